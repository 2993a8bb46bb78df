// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "clipboard.h"

using namespace olv;


std::wstring olv::escapeHtml(const std::wstring& str)
{
    std::wstring output;
    for (const wchar_t c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case L'&':  output += L"&amp;";  break;
            case L'<':  output += L"&lt;";   break;
            case L'>':  output += L"&gt;";   break;
            case L'"':  output += L"&quot;"; break;
            case L'\n': output += L"<br>";   break;
            default:    output += c;         break;
            //*INDENT-ON*
        }
    return output;
}


ClipboardContent olv::formatClipboardContent(const std::vector<std::wstring>& columnTitles,
                                             const std::vector<std::vector<std::wstring>>& rows,
                                             bool includeColumnTitlesInText)
{
    ClipboardContent content;

    auto appendTextLine = [&](const std::vector<std::wstring>& cells)
    {
        for (auto it = cells.begin(); it != cells.end(); ++it)
        {
            if (it != cells.begin())
                content.text += L'\t';
            for (const wchar_t c : *it) //tabs and line breaks would break the table structure
                content.text += c == L'\t' || c == L'\n' ? L' ' : c;
        }
        content.text += L'\n';
    };

    if (includeColumnTitlesInText)
        appendTextLine(columnTitles);
    for (const std::vector<std::wstring>& row : rows)
        appendTextLine(row);

    content.html = L"<table>\n<tr>";
    for (const std::wstring& title : columnTitles)
        content.html += L"<th>" + escapeHtml(title) + L"</th>";
    content.html += L"</tr>\n";

    for (const std::vector<std::wstring>& row : rows)
    {
        content.html += L"<tr>";
        for (const std::wstring& cell : row)
            content.html += L"<td>" + escapeHtml(cell) + L"</td>";
        content.html += L"</tr>\n";
    }
    content.html += L"</table>";

    return content;
}
