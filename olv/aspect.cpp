// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "aspect.h"

using namespace olv;


std::wstring olv::getAspectErrorText(const std::wstring& name, const std::wstring& typeName)
{
    return L'\'' + name + L"' is not a parameter-less method, property or field of type '" + typeName + L'\'';
}


std::wstring olv::getValueKindName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::null:
            return L"Null";
        case ValueKind::boolean:
            return L"Boolean";
        case ValueKind::integer:
            return L"Integer";
        case ValueKind::floating:
            return L"Double";
        case ValueKind::text:
            return L"String";
        case ValueKind::date:
            return L"Date";
        case ValueKind::time:
            return L"Time";
        case ValueKind::dateTime:
            return L"DateTime";
        case ValueKind::record:
            return L"Record";
    }
    return L"?";
}


Value olv::getValueComponent(const Value& v, const std::wstring& name)
{
    if (const RecordRef* rec = v.get<RecordRef>())
        return (*rec)->get(name);

    const Date*      date = v.get<Date>();
    const TimeOfDay* time = v.get<TimeOfDay>();
    if (const DateTime* dt = v.get<DateTime>())
    {
        date = &dt->date;
        time = &dt->time;

        if (equalNoCase(name, L"Date")) return dt->date;
        if (equalNoCase(name, L"Time")) return dt->time;
    }

    if (date)
    {
        if (equalNoCase(name, L"Year"))  return date->year;
        if (equalNoCase(name, L"Month")) return date->month;
        if (equalNoCase(name, L"Day"))   return date->day;
    }
    if (time)
    {
        if (equalNoCase(name, L"Hour"))   return time->hour;
        if (equalNoCase(name, L"Minute")) return time->minute;
        if (equalNoCase(name, L"Second")) return time->second;
    }

    if (const std::wstring* text = v.get<std::wstring>())
        if (equalNoCase(name, L"Length"))
            return text->size();

    return getAspectErrorText(name, getValueKindName(v.kind()));
}
