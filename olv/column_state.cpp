// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "column_state.h"
#include <algorithm>
#include <iterator>
#include <utility>
#include "serialize.h"
#include "string_tools.h"

using namespace olv;


namespace
{
const char COLUMN_STATE_FORMAT_DESCR[] = "OLVColumnState";
const int COLUMN_STATE_FORMAT_VER = 1;
}


std::string olv::serializeColumnState(const ColumnState& state)
{
    MemoryStreamOut streamOut;
    writeArray(streamOut, COLUMN_STATE_FORMAT_DESCR, sizeof(COLUMN_STATE_FORMAT_DESCR));
    writeNumber<int32_t>(streamOut, COLUMN_STATE_FORMAT_VER);

    writeNumber<int32_t>(streamOut, static_cast<int32_t>(state.columns.size()));
    for (const ColumnState::Column& col : state.columns)
    {
        writeNumber<int32_t>(streamOut, col.width);
        writeNumber<int8_t >(streamOut, col.visible);
    }

    writeNumber<int32_t>(streamOut, static_cast<int32_t>(state.displayOrder.size()));
    for (const size_t pos : state.displayOrder)
        writeNumber<int32_t>(streamOut, static_cast<int32_t>(pos));

    writeNumber<int32_t>(streamOut, state.sortColumn ? static_cast<int32_t>(*state.sortColumn) : -1);
    writeNumber<int8_t >(streamOut, state.sortAscending);

    return std::move(streamOut.ref());
}


ColumnState olv::deserializeColumnState(const std::string& blob)
{
    const std::wstring errorMsg = _("Cannot restore the column layout. The saved data is corrupted.");
    try
    {
        MemoryStreamIn streamIn(blob);

        char formatDescr[sizeof(COLUMN_STATE_FORMAT_DESCR)] = {};
        readArray(streamIn, formatDescr, sizeof(formatDescr)); //throw UnexpectedEndOfStream
        if (!std::equal(std::begin(formatDescr), std::end(formatDescr), std::begin(COLUMN_STATE_FORMAT_DESCR)))
            throw ColumnStateError(errorMsg, _("Unknown data format."));

        const int version = readNumber<int32_t>(streamIn); //throw UnexpectedEndOfStream
        if (version != COLUMN_STATE_FORMAT_VER)
            throw ColumnStateError(errorMsg, replaceCpy(_("Unsupported data format version %x."), L"%x", std::to_wstring(version)));

        ColumnState state;

        const int32_t colCount = readNumber<int32_t>(streamIn);
        if (colCount < 0)
            throw UnexpectedEndOfStream();
        for (int32_t i = 0; i < colCount; ++i)
        {
            ColumnState::Column col;
            col.width   = readNumber<int32_t>(streamIn);
            col.visible = readNumber<int8_t >(streamIn) != 0;
            state.columns.push_back(col);
        }

        const int32_t orderCount = readNumber<int32_t>(streamIn);
        if (orderCount != colCount)
            throw ColumnStateError(errorMsg, _("Invalid column order."));
        for (int32_t i = 0; i < orderCount; ++i)
        {
            const int32_t pos = readNumber<int32_t>(streamIn);
            if (pos < 0 || pos >= colCount)
                throw ColumnStateError(errorMsg, _("Invalid column order."));
            state.displayOrder.push_back(pos);
        }
        //must be a permutation:
        std::vector<size_t> orderSorted = state.displayOrder;
        std::sort(orderSorted.begin(), orderSorted.end());
        if (std::adjacent_find(orderSorted.begin(), orderSorted.end()) != orderSorted.end())
            throw ColumnStateError(errorMsg, _("Invalid column order."));

        const int32_t sortCol = readNumber<int32_t>(streamIn);
        if (sortCol < -1 || sortCol >= colCount)
            throw ColumnStateError(errorMsg, _("Invalid sort column."));
        if (sortCol >= 0)
            state.sortColumn = sortCol;
        state.sortAscending = readNumber<int8_t>(streamIn) != 0;

        if (!streamIn.atEnd())
            throw ColumnStateError(errorMsg, _("Unexpected trailing data."));

        return state;
    }
    catch (const UnexpectedEndOfStream& e) { throw ColumnStateError(errorMsg, e.toString()); }
}
