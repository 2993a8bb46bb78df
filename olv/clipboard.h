// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef CLIPBOARD_H_9910273645102938475
#define CLIPBOARD_H_9910273645102938475

#include <string>
#include <vector>


namespace olv
{
struct ClipboardContent
{
    std::wstring text; //tab-separated columns, one line per row
    std::wstring html; //<table> fragment
};

ClipboardContent formatClipboardContent(const std::vector<std::wstring>& columnTitles,
                                        const std::vector<std::vector<std::wstring>>& rows,
                                        bool includeColumnTitlesInText);

std::wstring escapeHtml(const std::wstring& str);
}

#endif //CLIPBOARD_H_9910273645102938475
