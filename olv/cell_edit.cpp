// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "cell_edit.h"
#include <algorithm>
#include <cerrno>
#include <cwchar>
#include "date_parse.h"

using namespace olv;


bool olv::shouldStartEditOnClick(CellEditMode mode, const MouseClick& click)
{
    if (click.altDown || click.controlDown || click.shiftDown)
        return false;

    switch (mode)
    {
        case CellEditMode::none:
        case CellEditMode::f2Only:
            return false;

        case CellEditMode::singleClick:
            if (click.doubleClick)
                return false;
            return click.col != 0; //a single click on column 0 selects the row

        case CellEditMode::doubleClick:
            return click.doubleClick;
    }
    return false;
}


bool olv::shouldStartEditOnF2(CellEditMode mode)
{
    return mode != CellEditMode::none;
}


std::optional<size_t> olv::getNextEditableColumn(const std::vector<bool>& editable, size_t col, bool forward)
{
    const size_t colCount = editable.size();
    if (colCount == 0)
        return std::nullopt;

    for (size_t i = 0; i + 1 < colCount; ++i)
    {
        col = forward ?
              (col + 1) % colCount :
              (col + colCount - 1) % colCount;

        if (editable[col])
            return col;
    }
    return std::nullopt;
}


std::optional<EditorKind> olv::getEditorKindForValue(const Value& v)
{
    switch (v.kind())
    {
        case ValueKind::boolean:
            return EditorKind::boolean;
        case ValueKind::integer:
            return EditorKind::integer;
        case ValueKind::floating:
            return EditorKind::floating;
        case ValueKind::text:
            return EditorKind::text;
        case ValueKind::date:
            return EditorKind::date;
        case ValueKind::time:
            return EditorKind::time;
        case ValueKind::dateTime:
            return EditorKind::dateTime;

        case ValueKind::null:
        case ValueKind::record:
            break;
    }
    return std::nullopt;
}


EditorKind olv::selectEditorKind(const std::optional<EditorKind>& columnOverride, const Value& cellValue,
                                 size_t rowCount, const std::function<Value(size_t row)>& getColumnValue)
{
    if (columnOverride)
        return *columnOverride;

    if (!cellValue.isNull())
        return getEditorKindForValue(cellValue).value_or(EditorKind::text);

    //null cell: guess from the first non-null value in the same column
    for (size_t row = 0; row < std::min(rowCount, EDITOR_GUESS_MAX_ROWS); ++row)
        if (const Value v = getColumnValue(row);
            !v.isNull())
            return getEditorKindForValue(v).value_or(EditorKind::text);

    return EditorKind::text;
}


namespace
{
[[noreturn]] void throwInvalidNumber(const std::wstring& text)
{
    throw ParseError(replaceCpy(_("Cannot interpret %x as a number."), L"%x", fmtText(text)));
}
}


Value olv::parseEditorText(EditorKind kind, const std::wstring& text)
{
    if (kind == EditorKind::text)
        return text;

    const std::wstring str = trimCpy(text);
    if (str.empty())
        return Value();

    switch (kind)
    {
        case EditorKind::boolean:
            if (equalNoCase(str, L"true") || str == L"1")
                return true;
            if (equalNoCase(str, L"false") || str == L"0")
                return false;
            throw ParseError(replaceCpy(_("Cannot interpret %x as a boolean value."), L"%x", fmtText(str)));

        case EditorKind::integer:
        {
            wchar_t* end = nullptr;
            errno = 0;
            const long long n = std::wcstoll(str.c_str(), &end, 10);
            if (errno != 0 || end != str.c_str() + str.size())
                throwInvalidNumber(str);
            return static_cast<int64_t>(n);
        }

        case EditorKind::floating:
        {
            wchar_t* end = nullptr;
            errno = 0;
            const double d = std::wcstod(str.c_str(), &end);
            if (errno != 0 || end != str.c_str() + str.size())
                throwInvalidNumber(str);
            return d;
        }

        case EditorKind::date:
            return parseDate(str, getCurrentYear()); //throw ParseError
        case EditorKind::time:
            return parseTime(str); //throw ParseError
        case EditorKind::dateTime:
            return parseDateTime(str, getCurrentYear()); //throw ParseError

        case EditorKind::text:
            break;
    }
    return str;
}
