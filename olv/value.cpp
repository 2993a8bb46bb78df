// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "value.h"
#include <charconv>
#include <cmath>
#include <ctime>
#include <cwchar>
#include <iterator>
#include "string_tools.h"

using namespace olv;


bool Value::operator==(const Value& other) const
{
    if (kind() == ValueKind::record && other.kind() == ValueKind::record)
    {
        const RecordRef& lhs = *get<RecordRef>();
        const RecordRef& rhs = *other.get<RecordRef>();
        return lhs == rhs || *lhs == *rhs;
    }
    return var_ == other.var_;
}


Value Record::get(const std::wstring& name) const
{
    if (auto it = fields_.find(name);
        it != fields_.end())
        return it->second;
    return Value();
}


std::optional<double> olv::getNumber(const Value& v)
{
    if (const int64_t* n = v.get<int64_t>())
        return static_cast<double>(*n);
    if (const double* d = v.get<double>())
        return *d;
    return std::nullopt;
}


std::optional<int64_t> olv::getInteger(const Value& v)
{
    if (const int64_t* n = v.get<int64_t>())
        return *n;
    if (const double* d = v.get<double>())
        if (std::isfinite(*d) && std::trunc(*d) == *d)
            return static_cast<int64_t>(*d);
    return std::nullopt;
}


std::weak_ordering olv::compareValues(const Value& lhs, const Value& rhs)
{
    if (lhs.isNumber() && rhs.isNumber())
    {
        if (const int64_t* nL = lhs.get<int64_t>())
            if (const int64_t* nR = rhs.get<int64_t>())
                return *nL <=> *nR;

        const double dL = *getNumber(lhs);
        const double dR = *getNumber(rhs);
        if (dL < dR) return std::weak_ordering::less;
        if (dR < dL) return std::weak_ordering::greater;
        return std::weak_ordering::equivalent; //including NaN
    }

    if (lhs.kind() != rhs.kind())
        return lhs.kind() <=> rhs.kind();

    switch (lhs.kind())
    {
        case ValueKind::null:
            return std::weak_ordering::equivalent;
        case ValueKind::boolean:
            return *lhs.get<bool>() <=> *rhs.get<bool>();
        case ValueKind::text:
            return compareNoCase(*lhs.get<std::wstring>(), *rhs.get<std::wstring>());
        case ValueKind::date:
            return *lhs.get<Date>() <=> *rhs.get<Date>();
        case ValueKind::time:
            return *lhs.get<TimeOfDay>() <=> *rhs.get<TimeOfDay>();
        case ValueKind::dateTime:
            return *lhs.get<DateTime>() <=> *rhs.get<DateTime>();
        case ValueKind::record:
            return compareNoCase(toDisplayString(lhs), toDisplayString(rhs));
        case ValueKind::integer:
        case ValueKind::floating:
            break; //handled above
    }
    return std::weak_ordering::equivalent;
}


namespace
{
std::wstring printDouble(double d)
{
    char buffer[64];
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), d); //shortest round-trip representation
    if (rv.ec != std::errc())
        return L"?";
    return std::wstring(std::begin(buffer), rv.ptr);
}


std::wstring printTwoDigits(int n)
{
    std::wstring out = std::to_wstring(n);
    if (out.size() < 2)
        out.insert(0, 2 - out.size(), L'0');
    return out;
}
}


std::wstring olv::formatDate(const Date& d)
{
    std::wstring year = std::to_wstring(d.year);
    if (year.size() < 4)
        year.insert(0, 4 - year.size(), L'0');
    return year + L'-' + printTwoDigits(d.month) + L'-' + printTwoDigits(d.day);
}


std::wstring olv::formatTime(const TimeOfDay& t)
{
    return printTwoDigits(t.hour) + L':' + printTwoDigits(t.minute) + L':' + printTwoDigits(t.second);
}


std::wstring olv::formatDateTime(const DateTime& dt)
{
    return formatDate(dt.date) + L' ' + formatTime(dt.time);
}


std::wstring olv::toDisplayString(const Value& v)
{
    switch (v.kind())
    {
        case ValueKind::null:
            return std::wstring();
        case ValueKind::boolean:
            return *v.get<bool>() ? L"True" : L"False";
        case ValueKind::integer:
            return std::to_wstring(*v.get<int64_t>());
        case ValueKind::floating:
            return printDouble(*v.get<double>());
        case ValueKind::text:
            return *v.get<std::wstring>();
        case ValueKind::date:
            return formatDate(*v.get<Date>());
        case ValueKind::time:
            return formatTime(*v.get<TimeOfDay>());
        case ValueKind::dateTime:
            return formatDateTime(*v.get<DateTime>());
        case ValueKind::record:
        {
            std::wstring out = L"{";
            for (const auto& [name, fieldVal] : (*v.get<RecordRef>())->fields())
            {
                if (out.size() > 1)
                    out += L", ";
                out += name + L": " + toDisplayString(fieldVal);
            }
            return out + L'}';
        }
    }
    return std::wstring();
}


namespace
{
/*  split printf-style pattern into "prefix %[flags][width][.precision][length]conv suffix"
    - exactly one conversion is supported, "%%" is a literal percent sign
    - length modifiers are dropped: the caller decides on the argument type     */
struct FormatSpec
{
    std::wstring prefix;
    std::wstring flagsWidthPrecision;
    wchar_t conversion = 0;
    std::wstring suffix;
};


std::optional<FormatSpec> parseFormatSpec(const std::wstring& format)
{
    FormatSpec spec;
    std::wstring* literal = &spec.prefix;

    for (size_t i = 0; i < format.size(); ++i)
    {
        if (format[i] != L'%')
        {
            *literal += format[i];
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == L'%')
        {
            *literal += L"%%";
            ++i;
            continue;
        }
        if (spec.conversion != 0) //second conversion
            return std::nullopt;

        size_t pos = i + 1;
        while (pos < format.size() && contains(L"-+ #0", std::wstring_view(&format[pos], 1)))
            spec.flagsWidthPrecision += format[pos++];
        while (pos < format.size() && isDigit(format[pos]))
            spec.flagsWidthPrecision += format[pos++];
        if (pos < format.size() && format[pos] == L'.')
        {
            spec.flagsWidthPrecision += format[pos++];
            while (pos < format.size() && isDigit(format[pos]))
                spec.flagsWidthPrecision += format[pos++];
        }
        while (pos < format.size() && contains(L"hlLqjzt", std::wstring_view(&format[pos], 1)))
            ++pos; //skip length modifier

        if (pos >= format.size() || !contains(L"diouxXeEfFgGaAcs", std::wstring_view(&format[pos], 1)))
            return std::nullopt;

        spec.conversion = format[pos];
        literal = &spec.suffix;
        i = pos;
    }
    if (spec.conversion == 0)
        return std::nullopt;
    return spec;
}


std::optional<std::wstring> formatNumberOrText(const std::wstring& format, const Value& v)
{
    const std::optional<FormatSpec> spec = parseFormatSpec(format);
    if (!spec)
        return std::nullopt;

    const std::wstring head = L'%' + spec->flagsWidthPrecision;
    std::optional<std::wstring> formatted;

    switch (spec->conversion)
    {
        case L'd':
        case L'i':
            if (const std::optional<int64_t> n = v.get<bool>() ? static_cast<int64_t>(*v.get<bool>()) : getInteger(v))
                formatted = printNumber(head + L"ll" + spec->conversion, static_cast<long long>(*n));
            else if (const std::optional<double> d = getNumber(v))
                formatted = printNumber(head + L"ll" + spec->conversion, static_cast<long long>(*d)); //truncate like Python's "%d"
            break;

        case L'o':
        case L'u':
        case L'x':
        case L'X':
            if (const std::optional<int64_t> n = getInteger(v))
                formatted = printNumber(head + L"ll" + spec->conversion, static_cast<unsigned long long>(*n));
            break;

        case L'c':
            if (const std::optional<int64_t> n = getInteger(v))
                formatted = printNumber(head + L"lc", static_cast<wint_t>(*n));
            break;

        case L's':
            formatted = toDisplayString(v);
            if (!spec->flagsWidthPrecision.empty())
            {
                wchar_t buffer[1024];
                const int charsWritten = std::swprintf(buffer, std::size(buffer), (head + L"ls").c_str(), formatted->c_str());
                if (charsWritten >= 0 && charsWritten < static_cast<int>(std::size(buffer)))
                    formatted = std::wstring(buffer, charsWritten);
            }
            break;

        default: //floating point
            if (const std::optional<double> d = getNumber(v))
                formatted = printNumber(head + spec->conversion, *d);
            break;
    }

    if (!formatted)
        return std::nullopt;

    return replaceCpy(spec->prefix, L"%%", L"%") + *formatted + replaceCpy(spec->suffix, L"%%", L"%");
}


std::optional<std::wstring> formatDateTimePattern(const std::wstring& format, const Value& v)
{
    std::tm ctc = {};
    if (const Date* d = v.get<Date>())
    {
        ctc.tm_year = d->year - 1900;
        ctc.tm_mon  = d->month - 1;
        ctc.tm_mday = d->day;
    }
    else if (const TimeOfDay* t = v.get<TimeOfDay>())
    {
        ctc.tm_year = 70;
        ctc.tm_mday = 1;
        ctc.tm_hour = t->hour;
        ctc.tm_min  = t->minute;
        ctc.tm_sec  = t->second;
    }
    else if (const DateTime* dt = v.get<DateTime>())
    {
        ctc.tm_year = dt->date.year - 1900;
        ctc.tm_mon  = dt->date.month - 1;
        ctc.tm_mday = dt->date.day;
        ctc.tm_hour = dt->time.hour;
        ctc.tm_min  = dt->time.minute;
        ctc.tm_sec  = dt->time.second;
    }
    else
        return std::nullopt;

    std::tm ctcNorm = ctc;
    ctcNorm.tm_isdst = -1;
    if (std::mktime(&ctcNorm) != -1) //fill in tm_wday/tm_yday for %a, %A, %j
    {
        ctc.tm_wday = ctcNorm.tm_wday;
        ctc.tm_yday = ctcNorm.tm_yday;
    }

    if (format.empty())
        return std::wstring();

    wchar_t buffer[256];
    const size_t charsWritten = std::wcsftime(buffer, std::size(buffer), format.c_str(), &ctc);
    if (charsWritten == 0) //"too long" or empty result: can't tell apart
        return std::nullopt;

    return std::wstring(buffer, charsWritten);
}
}


std::wstring olv::formatValue(const std::wstring& format, const Value& v)
{
    if (v.isNull())
        return std::wstring();

    std::optional<std::wstring> formatted;
    switch (v.kind())
    {
        case ValueKind::date:
        case ValueKind::time:
        case ValueKind::dateTime:
            formatted = formatDateTimePattern(format, v);
            break;
        default:
            formatted = formatNumberOrText(format, v);
            break;
    }
    return formatted ? *formatted : toDisplayString(v);
}
