// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef COLUMN_LAYOUT_H_5560129837465102938
#define COLUMN_LAYOUT_H_5560129837465102938

#include <vector>


namespace olv
{
struct ColumnWidthInfo
{
    int width = 0; //current width
    int minimumWidth = -1;
    int maximumWidth = -1;
    bool isSpaceFilling = false;
    int freeSpaceProportion = 1; //>= 0
};

int calcBoundedWidth(int width, int minimumWidth, int maximumWidth);

/*  distribute the client width not used by ordinary columns among the space-filling columns:
    - a space-filling column whose share would violate its bounds is treated like a fixed-width column (bounded width)
    - the remaining space is shared by proportion; rounding remainders go to the first columns
    returns the new widths of *all* columns (ordinary columns unchanged)                          */
std::vector<int> calcSpaceFillingWidths(const std::vector<ColumnWidthInfo>& columns, int clientWidth);
}

#endif //COLUMN_LAYOUT_H_5560129837465102938
