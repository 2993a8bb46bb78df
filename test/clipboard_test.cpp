// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include <gtest/gtest.h>
#include <olv/clipboard.h>

using namespace olv;


TEST(Clipboard, EscapeHtml)
{
    EXPECT_EQ(escapeHtml(L"a < b & \"c\" > d"), L"a &lt; b &amp; &quot;c&quot; &gt; d");
    EXPECT_EQ(escapeHtml(L"line1\nline2"), L"line1<br>line2");
}


TEST(Clipboard, Format)
{
    const ClipboardContent content = formatClipboardContent({L"Name", L"Note"},
    {
        {L"Alex", L"tab\there"},
        {L"Zoe",  L"two\nlines"},
    }, false);

    EXPECT_EQ(content.text, L"Alex\ttab here\n"
                            L"Zoe\ttwo lines\n");
    EXPECT_EQ(content.html, L"<table>\n"
                            L"<tr><th>Name</th><th>Note</th></tr>\n"
                            L"<tr><td>Alex</td><td>tab\there</td></tr>\n"
                            L"<tr><td>Zoe</td><td>two<br>lines</td></tr>\n"
                            L"</table>");

    EXPECT_EQ(formatClipboardContent({L"A", L"B"}, {{L"1", L"2"}}, true).text, L"A\tB\n1\t2\n");
}
