// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef COLUMN_STATE_H_3829104756102938471
#define COLUMN_STATE_H_3829104756102938471

#include <optional>
#include <string>
#include <vector>
#include "error.h"


namespace olv
{
//user-modifiable layout of a list: saved on exit, restored on next start
struct ColumnState
{
    struct Column
    {
        int  width   = -1;
        bool visible = true;

        bool operator==(const Column&) const = default;
    };
    std::vector<Column> columns;
    std::vector<size_t> displayOrder; //permutation of column indexes
    std::optional<size_t> sortColumn;
    bool sortAscending = true;

    bool operator==(const ColumnState&) const = default;
};

std::string serializeColumnState  (const ColumnState& state);
ColumnState deserializeColumnState(const std::string& blob); //throw ColumnStateError
}

#endif //COLUMN_STATE_H_3829104756102938471
