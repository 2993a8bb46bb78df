// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef DATE_PARSE_H_7723019485612093847
#define DATE_PARSE_H_7723019485612093847

#include "value.h"
#include "error.h"


namespace olv
{
/*  parse user input of date/time cell editors

    date part (year is optional and defaults to "defaultYear"):
        31/12/2007      day/month/year, falls back to month/day/year if month is out of range
        12/31/2007
        31-Dec-2007
        31 December 2007
        Dec 31, 2007

    time part (seconds are optional):
        23:59:59        24h
        11:59:59 pm     12h                                                  */

DateTime  parseDateTime(const std::wstring& text, int defaultYear); //throw ParseError
Date      parseDate    (const std::wstring& text, int defaultYear); //throw ParseError
TimeOfDay parseTime    (const std::wstring& text);                  //throw ParseError

int getCurrentYear();
Date getCurrentDate();
TimeOfDay getCurrentTime();

int getDaysInMonth(int year, int month); //month: 1-12
}

#endif //DATE_PARSE_H_7723019485612093847
