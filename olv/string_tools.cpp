// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "string_tools.h"
#include <algorithm>
#include <glib.h>

using namespace olv;


wchar_t olv::getUpperCase(wchar_t c)
{
    if (static_cast<unsigned int>(c) < 128) //fast path
        return asciiToUpper(c);

    static_assert(sizeof(wchar_t) == sizeof(gunichar)); //UTF-32
    return static_cast<wchar_t>(::g_unichar_toupper(static_cast<gunichar>(c))); //don't use std::towupper: *incomplete* and locale-dependent!
}


std::wstring olv::getUpperCase(std::wstring_view str)
{
    std::wstring output(str);
    for (wchar_t& c : output)
        c = getUpperCase(c);
    return output;
}


std::weak_ordering olv::compareNoCase(std::wstring_view lhs, std::wstring_view rhs)
{
    //no memory allocations: compare char by char
    const size_t len = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < len; ++i)
    {
        const wchar_t charL = getUpperCase(lhs[i]); //note: tolower can be ambiguous, so don't use:
        const wchar_t charR = getUpperCase(rhs[i]); //e.g. "Σ" (upper case) can be lower-case "ς" in the end of the word or "σ" in the middle.
        if (charL != charR)
            return static_cast<unsigned int>(charL) <=> static_cast<unsigned int>(charR);
    }
    return lhs.size() <=> rhs.size();
}


bool olv::equalNoCase(std::wstring_view lhs, std::wstring_view rhs)
{
    return lhs.size() == rhs.size() && compareNoCase(lhs, rhs) == std::weak_ordering::equivalent;
}


bool olv::startsWithNoCase(std::wstring_view str, std::wstring_view prefix)
{
    return str.size() >= prefix.size() && equalNoCase(str.substr(0, prefix.size()), prefix);
}


bool olv::containsNoCase(std::wstring_view str, std::wstring_view term)
{
    if (term.empty())
        return true;
    const std::wstring strUp  = getUpperCase(str);
    const std::wstring termUp = getUpperCase(term);
    return contains(strUp, termUp);
}


std::wstring olv::trimCpy(std::wstring_view str, TrimSide side)
{
    auto first = str.begin();
    auto last  = str.end();

    if (side == TrimSide::right || side == TrimSide::both)
        while (last != first && isWhiteSpace(*(last - 1)))
            --last;
    if (side == TrimSide::left || side == TrimSide::both)
        while (first != last && isWhiteSpace(*first))
            ++first;

    return std::wstring(first, last);
}


std::vector<std::wstring> olv::splitCpy(std::wstring_view str, wchar_t delimiter, SplitOnEmpty soe)
{
    std::vector<std::wstring> output;
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        const std::wstring_view blk = str.substr(0, pos);

        if (!blk.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(blk);

        if (pos == std::wstring_view::npos)
            return output;
        str.remove_prefix(pos + 1);
    }
}


std::wstring olv::replaceCpy(std::wstring str, std::wstring_view oldTerm, std::wstring_view newTerm)
{
    if (oldTerm.empty())
        return str;

    for (size_t pos = str.find(oldTerm); pos != std::wstring::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}
