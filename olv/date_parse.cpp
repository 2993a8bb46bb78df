// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "date_parse.h"
#include <algorithm>
#include <ctime>
#include <iterator>
#include "string_tools.h"

using namespace olv;


namespace
{
const wchar_t* monthNames[] =
{
    L"january", L"february", L"march", L"april", L"may", L"june",
    L"july", L"august", L"september", L"october", L"november", L"december"
};


std::wstring toLower(std::wstring_view str)
{
    std::wstring out(str);
    for (wchar_t& c : out)
        c = asciiToLower(c);
    return out;
}


std::optional<int> parseMonthName(std::wstring_view name) //"Dec", "December" => 12
{
    const std::wstring nameLow = toLower(name);
    if (nameLow.size() < 3)
        return std::nullopt;

    for (size_t i = 0; i < std::size(monthNames); ++i)
        if (startsWith(monthNames[i], nameLow))
            return static_cast<int>(i + 1);
    return std::nullopt;
}


std::optional<int> parseInt(std::wstring_view str)
{
    if (str.empty() || str.size() > 9)
        return std::nullopt;

    int n = 0;
    for (const wchar_t c : str)
    {
        if (!isDigit(c))
            return std::nullopt;
        n = n * 10 + (c - L'0');
    }
    return n;
}


bool isValidDate(const Date& d)
{
    return 1 <= d.month && d.month <= 12 &&
           1 <= d.day   && d.day   <= getDaysInMonth(d.year, d.month);
}


std::optional<Date> parseDatePart(const std::wstring& text, int defaultYear)
{
    //"31/12/2007", "12/31", ...
    if (contains(text, L"/"))
    {
        const std::vector<std::wstring> parts = splitCpy(text, L'/', SplitOnEmpty::allow);
        if (parts.size() != 2 && parts.size() != 3)
            return std::nullopt;

        const std::optional<int> first  = parseInt(trimCpy(parts[0]));
        const std::optional<int> second = parseInt(trimCpy(parts[1]));
        const std::optional<int> year   = parts.size() == 3 ? parseInt(trimCpy(parts[2])) : defaultYear;
        if (!first || !second || !year)
            return std::nullopt;

        if (const Date dmy{*year, *second, *first}; isValidDate(dmy))
            return dmy;
        if (const Date mdy{*year, *first, *second}; isValidDate(mdy))
            return mdy;
        return std::nullopt;
    }

    //"31-Dec-2007", "31-Dec"
    if (contains(text, L"-"))
    {
        const std::vector<std::wstring> parts = splitCpy(text, L'-', SplitOnEmpty::allow);
        if (parts.size() != 2 && parts.size() != 3)
            return std::nullopt;

        const std::optional<int> day   = parseInt(trimCpy(parts[0]));
        const std::optional<int> month = parseMonthName(trimCpy(parts[1]));
        const std::optional<int> year  = parts.size() == 3 ? parseInt(trimCpy(parts[2])) : defaultYear;
        if (!day || !month || !year)
            return std::nullopt;

        if (const Date d{*year, *month, *day}; isValidDate(d))
            return d;
        return std::nullopt;
    }

    //"31 December 2007", "Dec 31, 2007", "Dec 31"
    const std::vector<std::wstring> tokens = splitCpy(replaceCpy(text, L",", L" "), L' ', SplitOnEmpty::skip);
    if (tokens.size() != 2 && tokens.size() != 3)
        return std::nullopt;

    std::optional<int> day;
    std::optional<int> month;
    if (isDigit(tokens[0][0]))
    {
        day   = parseInt(tokens[0]);
        month = parseMonthName(tokens[1]);
    }
    else
    {
        month = parseMonthName(tokens[0]);
        day   = parseInt(tokens[1]);
    }
    const std::optional<int> year = tokens.size() == 3 ? parseInt(tokens[2]) : defaultYear;
    if (!day || !month || !year)
        return std::nullopt;

    if (const Date d{*year, *month, *day}; isValidDate(d))
        return d;
    return std::nullopt;
}


std::optional<TimeOfDay> parseTimePart(const std::wstring& text)
{
    std::wstring timeStr = toLower(trimCpy(text));

    std::optional<bool> isPm;
    if (endsWith(timeStr, L"am") || endsWith(timeStr, L"pm"))
    {
        isPm = endsWith(timeStr, L"pm");
        timeStr = trimCpy(std::wstring_view(timeStr).substr(0, timeStr.size() - 2));
    }

    const std::vector<std::wstring> parts = splitCpy(timeStr, L':', SplitOnEmpty::allow);
    if (parts.size() != 2 && parts.size() != 3)
        return std::nullopt;

    std::optional<int> hour   = parseInt(parts[0]);
    std::optional<int> minute = parseInt(parts[1]);
    std::optional<int> second = parts.size() == 3 ? parseInt(parts[2]) : 0;
    if (!hour || !minute || !second)
        return std::nullopt;

    if (isPm)
    {
        if (*hour < 1 || *hour > 12)
            return std::nullopt;
        *hour %= 12;
        if (*isPm)
            *hour += 12;
    }

    if (*hour > 23 || *minute > 59 || *second > 59)
        return std::nullopt;

    return TimeOfDay{*hour, *minute, *second};
}


[[noreturn]] void throwParseError(const std::wstring& text)
{
    throw ParseError(replaceCpy(_("Cannot interpret %x as a date or time."), L"%x", fmtText(text)));
}
}


int olv::getDaysInMonth(int year, int month)
{
    static const int daysPerMonth[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > 12)
        return 0;

    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
        return 29;
    return daysPerMonth[month - 1];
}


Date olv::getCurrentDate()
{
    const time_t now = std::time(nullptr);
    std::tm ltm = {};
    if (!::localtime_r(&now, &ltm))
        return Date();
    return {ltm.tm_year + 1900, ltm.tm_mon + 1, ltm.tm_mday};
}


TimeOfDay olv::getCurrentTime()
{
    const time_t now = std::time(nullptr);
    std::tm ltm = {};
    if (!::localtime_r(&now, &ltm))
        return TimeOfDay();
    return {ltm.tm_hour, ltm.tm_min, std::min(ltm.tm_sec, 59)};
}


int olv::getCurrentYear()
{
    return getCurrentDate().year;
}


DateTime olv::parseDateTime(const std::wstring& text, int defaultYear)
{
    const std::wstring trimmed = trimCpy(text);

    //the time part starts with the last token holding a colon
    const size_t colonPos = trimmed.find(L':');
    if (colonPos == std::wstring::npos)
    {
        if (const std::optional<Date> d = parseDatePart(trimmed, defaultYear))
            return {*d, TimeOfDay()};
        throwParseError(text);
    }

    const size_t timeStart = trimmed.rfind(L' ', colonPos);
    if (timeStart == std::wstring::npos)
        throwParseError(text);

    const std::optional<Date>      d = parseDatePart(trimCpy(std::wstring_view(trimmed).substr(0, timeStart)), defaultYear);
    const std::optional<TimeOfDay> t = parseTimePart(trimmed.substr(timeStart + 1));
    if (!d || !t)
        throwParseError(text);

    return {*d, *t};
}


Date olv::parseDate(const std::wstring& text, int defaultYear)
{
    if (const std::optional<Date> d = parseDatePart(trimCpy(text), defaultYear))
        return *d;
    throwParseError(text);
}


TimeOfDay olv::parseTime(const std::wstring& text)
{
    if (const std::optional<TimeOfDay> t = parseTimePart(text))
        return *t;
    throwParseError(text);
}
