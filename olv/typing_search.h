// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef TYPING_SEARCH_H_1029384756102938475
#define TYPING_SEARCH_H_1029384756102938475

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "string_tools.h"


namespace olv
{
const std::chrono::milliseconds SEARCH_KEYSTROKE_DELAY(750); //pause that starts a new search prefix
const size_t MAX_ROWS_FOR_UNSORTED_SEARCH = 100000;


//collect the characters typed into a list into one search prefix
class TypingSearchBuffer
{
public:
    const std::wstring& addChar(wchar_t c, std::chrono::steady_clock::time_point now)
    {
        if (now - lastKeyTime_ > SEARCH_KEYSTROKE_DELAY)
            prefix_.clear();
        lastKeyTime_ = now;
        prefix_ += c;
        return prefix_;
    }

    void clear() { prefix_.clear(); }

private:
    std::wstring prefix_;
    std::chrono::steady_clock::time_point lastKeyTime_;
};


/*  binary search for the first row in [rowFirst, rowLast) whose text starts with "prefix" (case-insensitive)
    rows must be sorted by text in "ascending" order; returns -1 if there is no match       */
inline
ptrdiff_t findRowBisect(size_t rowFirst, size_t rowLast, const std::wstring& prefix, bool ascending,
                        const std::function<std::wstring(size_t row)>& getText)
{
    auto isBeforeMatch = [&](const std::wstring& text)
    {
        if (startsWithNoCase(text, prefix))
            return false;
        return ascending ?
               compareNoCase(text, prefix) < 0 :
               compareNoCase(text, prefix) > 0;
    };

    size_t first = rowFirst;
    size_t last  = rowLast;
    while (first < last)
    {
        const size_t middle = first + (last - first) / 2;
        if (isBeforeMatch(getText(middle)))
            first = middle + 1;
        else
            last = middle;
    }

    if (first < rowLast && startsWithNoCase(getText(first), prefix))
        return first;
    return -1;
}
}

#endif //TYPING_SEARCH_H_1029384756102938475
