// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include <algorithm>
#include <gtest/gtest.h>
#include <olv/value.h>
#include <olv/sorting.h>
#include <olv/string_tools.h>

using namespace olv;


TEST(Value, Kinds)
{
    EXPECT_TRUE(Value().isNull());
    EXPECT_TRUE(Value(nullptr).isNull());
    EXPECT_EQ(Value(true).kind(), ValueKind::boolean);
    EXPECT_EQ(Value(42).kind(), ValueKind::integer);
    EXPECT_EQ(Value(size_t(42)).kind(), ValueKind::integer);
    EXPECT_EQ(Value(1.5).kind(), ValueKind::floating);
    EXPECT_EQ(Value(L"abc").kind(), ValueKind::text);
    EXPECT_EQ(Value(Date{2007, 12, 31}).kind(), ValueKind::date);
    EXPECT_EQ(Value(RecordRef()).kind(), ValueKind::null);

    EXPECT_TRUE(Value(3).isNumber());
    EXPECT_FALSE(Value(L"3").isNumber());

    ASSERT_TRUE(Value(42).get<int64_t>());
    EXPECT_EQ(*Value(42).get<int64_t>(), 42);
    EXPECT_FALSE(Value(42).get<double>());
}


TEST(Value, DisplayString)
{
    EXPECT_EQ(toDisplayString(Value()), L"");
    EXPECT_EQ(toDisplayString(0), L"0"); //zero is not blanked like null
    EXPECT_EQ(toDisplayString(false), L"False");
    EXPECT_EQ(toDisplayString(true), L"True");
    EXPECT_EQ(toDisplayString(-17), L"-17");
    EXPECT_EQ(toDisplayString(2.5), L"2.5");
    EXPECT_EQ(toDisplayString(Date{2007, 2, 3}), L"2007-02-03");
    EXPECT_EQ(toDisplayString(TimeOfDay{9, 5, 0}), L"09:05:00");
    EXPECT_EQ(toDisplayString(DateTime{{1999, 12, 31}, {23, 59, 59}}), L"1999-12-31 23:59:59");

    auto rec = std::make_shared<Record>(Record{{L"a", 1}, {L"b", L"x"}});
    EXPECT_EQ(toDisplayString(RecordRef(rec)), L"{a: 1, b: x}");
}


TEST(Value, FormatNumbersAndText)
{
    EXPECT_EQ(formatValue(L"%d", 42), L"42");
    EXPECT_EQ(formatValue(L"%05d", 42), L"00042");
    EXPECT_EQ(formatValue(L"%.2f", 3.14159), L"3.14");
    EXPECT_EQ(formatValue(L"$%.2f", 2), L"$2.00");
    EXPECT_EQ(formatValue(L"%d%%", 50), L"50%");
    EXPECT_EQ(formatValue(L"%x", 255), L"ff");
    EXPECT_EQ(formatValue(L"[%s]", L"abc"), L"[abc]");
    EXPECT_EQ(formatValue(L"%d", Value()), L"");

    //unusable patterns fall back to the display string
    EXPECT_EQ(formatValue(L"%d", L"abc"), L"abc");
    EXPECT_EQ(formatValue(L"%d %d", 1), L"1");
    EXPECT_EQ(formatValue(L"no conversion", 7), L"7");
}


TEST(Value, FormatDates)
{
    EXPECT_EQ(formatValue(L"%Y/%m/%d", Date{2007, 12, 31}), L"2007/12/31");
    EXPECT_EQ(formatValue(L"%H:%M", TimeOfDay{13, 7, 0}), L"13:07");
    EXPECT_EQ(formatValue(L"%d.%m.%Y %H:%M:%S", DateTime{{2001, 2, 3}, {4, 5, 6}}), L"03.02.2001 04:05:06");
}


TEST(Value, Compare)
{
    EXPECT_TRUE(compareValues(1, 2) < 0);
    EXPECT_TRUE(compareValues(2.5, 2) > 0);
    EXPECT_TRUE(compareValues(2, 2.0) == 0);
    EXPECT_TRUE(compareValues(L"abc", L"ABC") == 0);
    EXPECT_TRUE(compareValues(L"abc", L"abd") < 0);
    EXPECT_TRUE(compareValues(Date{2000, 1, 1}, Date{1999, 12, 31}) > 0);
    EXPECT_TRUE(compareValues(false, true) < 0);
    EXPECT_TRUE(compareValues(Value(), Value()) == 0);
}


TEST(Value, NumericConversion)
{
    EXPECT_EQ(getNumber(3), 3.0);
    EXPECT_EQ(getNumber(L"3"), std::nullopt);
    EXPECT_EQ(getInteger(4.0), 4);
    EXPECT_EQ(getInteger(4.5), std::nullopt);
}


TEST(Sorting, NullsAlwaysLast)
{
    std::vector<Value> values{3, Value(), 1, 2, Value()};

    std::stable_sort(values.begin(), values.end(), [](const Value& lhs, const Value& rhs) { return lessCellValue<true>(lhs, rhs); });
    EXPECT_EQ(values, (std::vector<Value>{1, 2, 3, Value(), Value()}));

    std::stable_sort(values.begin(), values.end(), [](const Value& lhs, const Value& rhs) { return lessCellValue<false>(lhs, rhs); });
    EXPECT_EQ(values, (std::vector<Value>{3, 2, 1, Value(), Value()}));
}


TEST(StringTools, CaseInsensitive)
{
    EXPECT_TRUE(equalNoCase(L"Ärger", L"äRGER"));
    EXPECT_TRUE(startsWithNoCase(L"Zoe Meliko", L"zo"));
    EXPECT_FALSE(startsWithNoCase(L"Zo", L"zoe"));
    EXPECT_TRUE(containsNoCase(L"Eric Fandango", L"FAND"));
    EXPECT_TRUE(compareNoCase(L"ae cummings", L"Alex") < 0);

    EXPECT_EQ(trimCpy(L"  a b  "), L"a b");
    EXPECT_EQ(splitCpy(L"a,,b", L',', SplitOnEmpty::skip), (std::vector<std::wstring>{L"a", L"b"}));
    EXPECT_EQ(splitCpy(L"a,,b", L',', SplitOnEmpty::allow), (std::vector<std::wstring>{L"a", L"", L"b"}));
    EXPECT_EQ(replaceCpy(L"%x of %x", L"%x", L"1"), L"1 of 1");
}
