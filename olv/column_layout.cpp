// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "column_layout.h"
#include <algorithm>
#include <cassert>

using namespace olv;


int olv::calcBoundedWidth(int width, int minimumWidth, int maximumWidth)
{
    if (width < 0)
        return width;

    if (maximumWidth >= 0)
        width = std::min(maximumWidth, width);
    return std::max(minimumWidth, width);
}


std::vector<int> olv::calcSpaceFillingWidths(const std::vector<ColumnWidthInfo>& columns, int clientWidth)
{
    std::vector<int> output;
    int usedWidth = 0;
    for (const ColumnWidthInfo& ci : columns)
    {
        output.push_back(ci.width);
        if (!ci.isSpaceFilling)
            usedWidth += ci.width;
    }

    int freeSpace = std::max(0, clientWidth - usedWidth);
    int totalProportion = 0;
    for (const ColumnWidthInfo& ci : columns)
        if (ci.isSpaceFilling)
        {
            assert(ci.freeSpaceProportion >= 0);
            totalProportion += std::max(ci.freeSpaceProportion, 0);
        }

    //space-filling columns that would escape their bounds are treated as fixed-size columns
    std::vector<size_t> colsToResize;
    for (size_t col = 0; col < columns.size(); ++col)
        if (const ColumnWidthInfo& ci = columns[col];
            ci.isSpaceFilling)
        {
            const int proportion = std::max(ci.freeSpaceProportion, 0);
            const int newWidth = totalProportion > 0 ? freeSpace * proportion / totalProportion : 0;
            const int boundedWidth = calcBoundedWidth(newWidth, ci.minimumWidth, ci.maximumWidth);

            if (newWidth == boundedWidth)
                colsToResize.push_back(col);
            else
            {
                output[col] = boundedWidth;
                freeSpace = std::max(0, freeSpace - boundedWidth);
                totalProportion -= proportion;
            }
        }

    if (totalProportion <= 0)
    {
        for (size_t col : colsToResize)
            output[col] = calcBoundedWidth(0, columns[col].minimumWidth, columns[col].maximumWidth);
        return output;
    }

    int remainingWidth = freeSpace;
    for (size_t col : colsToResize)
    {
        const int width = freeSpace * std::max(columns[col].freeSpaceProportion, 0) / totalProportion; //rounds down!
        output[col] = width;
        remainingWidth -= width;
    }

    //distribute *all* of the free space: enlarge the first few columns (as long as their bounds allow)
    for (size_t col : colsToResize)
    {
        if (remainingWidth <= 0)
            break;
        if (columns[col].freeSpaceProportion > 0 &&
            calcBoundedWidth(output[col] + 1, columns[col].minimumWidth, columns[col].maximumWidth) == output[col] + 1)
        {
            ++output[col];
            --remainingWidth;
        }
    }

    for (size_t col : colsToResize)
        output[col] = calcBoundedWidth(output[col], columns[col].minimumWidth, columns[col].maximumWidth);

    return output;
}
