// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef SORTING_H_3309127845610293847
#define SORTING_H_3309127845610293847

#include <type_traits>
#include "value.h"


namespace olv
{
template <class Predicate>
struct LessDescending
{
    LessDescending(Predicate lessThan) : lessThan_(lessThan) {}
    template <class T> bool operator()(const T& lhs, const T& rhs) const { return lessThan_(rhs, lhs); }
private:
    Predicate lessThan_;
};

/*  makeSortDirection(old binary predicate, std::bool_constant<ascending>()) -> new binary predicate  */
template <class Predicate> inline
/**/           Predicate  makeSortDirection(Predicate pred, std::true_type) { return pred; }

template <class Predicate> inline
LessDescending<Predicate> makeSortDirection(Predicate pred, std::false_type) { return pred; }


struct LessValue { bool operator()(const Value& lhs, const Value& rhs) const { return compareValues(lhs, rhs) < 0; } };


template <bool ascending> inline
bool lessCellValue(const Value& a, const Value& b)
{
    //null values always last
    if (a.isNull())
        return false;
    else if (b.isNull())
        return true;

    return makeSortDirection(LessValue(), std::bool_constant<ascending>())(a, b);
}


inline
bool lessCellValue(const Value& a, const Value& b, bool ascending)
{
    return ascending ?
           lessCellValue<true >(a, b) :
           lessCellValue<false>(a, b);
}
}

#endif //SORTING_H_3309127845610293847
