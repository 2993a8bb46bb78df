// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include <gtest/gtest.h>
#include <olv/column.h>
#include "test_data.h"

using namespace olv;
using namespace olv_test;


TEST(Column, StringValue)
{
    const std::vector<PersonPtr> persons = makePersons();
    std::vector<ColumnDefn<Person>> cols = makePersonColumns();

    EXPECT_EQ(cols[0].getStringValue(*persons[0]), L"Alex Bawling");
    EXPECT_EQ(cols[1].getStringValue(*persons[0]), L"1955-01-02");
    EXPECT_EQ(cols[3].getStringValue(*persons[1]), L"0");

    cols[1].stringFormat = L"%d.%m.%Y";
    EXPECT_EQ(cols[1].getStringValue(*persons[0]), L"02.01.1955");

    cols[3].stringConverter = [](const Value& v) { return getInteger(v) == 0 ? std::wstring(L"none") : toDisplayString(v); };
    EXPECT_EQ(cols[3].getStringValue(*persons[1]), L"none");
    EXPECT_EQ(cols[3].getStringValue(*persons[0]), L"2");

    const ColumnDefn<Person> initial(L"Initial", ColumnAlignment::centre, 30, [](const Person& p) { return p.name.substr(0, 1); });
    EXPECT_EQ(initial.getStringValue(*persons[4]), L"I");
}


TEST(Column, Images)
{
    const std::vector<PersonPtr> persons = makePersons();
    ColumnDefn<Person> col = makePersonColumns()[0];

    EXPECT_EQ(col.getImage(*persons[0]), -1);

    col.imageGetter = 3;
    EXPECT_EQ(col.getImage(*persons[0]), 3);

    col.imageGetter = [](const Person& p) { return p.isMale ? 0 : 1; };
    EXPECT_EQ(col.getImage(*persons[0]), 0);
    EXPECT_EQ(col.getImage(*persons[1]), 1);

    col.imageGetter = L"children";
    EXPECT_EQ(col.getImage(*persons[2]), 3);

    col.imageGetter = L"name"; //not a number
    EXPECT_EQ(col.getImage(*persons[2]), -1);
}


TEST(Column, SetValue)
{
    std::vector<PersonPtr> persons = makePersons();
    std::vector<ColumnDefn<Person>> cols = makePersonColumns();

    EXPECT_TRUE(cols[0].setValue(*persons[0], L"Alexander Bawling"));
    EXPECT_EQ(persons[0]->name, L"Alexander Bawling");

    EXPECT_FALSE(cols[2].setValue(*persons[0], L"Female")); //method
    EXPECT_TRUE(persons[0]->isMale);

    cols[2].valueSetter = [](Person& p, const Value& v) { p.isMale = toDisplayString(v) == L"Male"; };
    EXPECT_TRUE(cols[2].setValue(*persons[0], L"Female"));
    EXPECT_FALSE(persons[0]->isMale);

    const ColumnDefn<Person> initial(L"Initial", ColumnAlignment::left, 30, [](const Person& p) { return p.name.substr(0, 1); });
    EXPECT_FALSE(initial.setValue(*persons[0], L"X"));

    EXPECT_THROW(cols[3].setValue(*persons[0], L"lots"), ValueConversionError);
}


TEST(Column, GroupKeysAndTitles)
{
    const std::vector<PersonPtr> persons = makePersons();
    std::vector<ColumnDefn<Person>> cols = makePersonColumns();

    EXPECT_EQ(cols[2].getGroupKey(*persons[0]), Value(L"Male"));
    EXPECT_EQ(cols[2].getGroupTitle(L"Male", 4, true), L"Male (4 items)");
    EXPECT_EQ(cols[2].getGroupTitle(L"Male", 1, true), L"Male (1 item)");
    EXPECT_EQ(cols[2].getGroupTitle(L"Male", 4, false), L"Male");

    cols[2].groupTitleSingleItem  = L"%title% [only one]";
    cols[2].groupTitlePluralItems = L"%title% [%x people]";
    EXPECT_EQ(cols[2].getGroupTitle(L"Female", 1, true), L"Female [only one]");
    EXPECT_EQ(cols[2].getGroupTitle(L"Female", 3, true), L"Female [3 people]");

    cols[0].useInitialLetterForGroupKey = true;
    EXPECT_EQ(cols[0].getGroupKey(*persons[6]), Value(L"A")); //"ae cummings"
    EXPECT_EQ(cols[0].getGroupKey(*persons[0]), Value(L"A"));
    EXPECT_EQ(cols[0].getGroupKeyAsString(L"A"), L"A");

    cols[1].groupKeyGetter = L"birthDate.Year";
    cols[1].groupKeyConverter = [](const Value& v) { return L"Born " + toDisplayString(v); };
    EXPECT_EQ(cols[1].getGroupKey(*persons[4]), Value(1931));
    EXPECT_EQ(cols[1].getGroupKeyAsString(1931), L"Born 1931");
}


TEST(Column, CheckState)
{
    ColumnDefn<Person> col = makePersonColumns()[0];
    EXPECT_FALSE(col.hasCheckState());

    col.checkStateGetter = [](const Person& p) { return p.isMale; };
    EXPECT_TRUE(col.hasCheckState());
}


TEST(Column, Widths)
{
    ColumnDefn<Person> col = makePersonColumns()[0];
    EXPECT_FALSE(col.isFixedWidth());
    EXPECT_EQ(col.calcBoundedWidth(500), 500);

    col.minimumWidth = 50;
    col.maximumWidth = 200;
    EXPECT_EQ(col.calcBoundedWidth(10),  50);
    EXPECT_EQ(col.calcBoundedWidth(500), 200);
    EXPECT_EQ(col.calcBoundedWidth(-1),  -1);

    col.setFixedWidth(24);
    EXPECT_TRUE(col.isFixedWidth());
    EXPECT_EQ(col.width, 24);
    EXPECT_EQ(col.calcBoundedWidth(100), 24);

    EXPECT_EQ(parseAlignment(L"Center"), ColumnAlignment::centre);
    EXPECT_EQ(parseAlignment(L"right"),  ColumnAlignment::right);
    EXPECT_EQ(parseAlignment(L"?"),      ColumnAlignment::left);
}


TEST(ColumnLayout, SpaceFilling)
{
    auto fill = [](int proportion, int minWidth = -1, int maxWidth = -1)
    {
        ColumnWidthInfo ci;
        ci.isSpaceFilling = true;
        ci.freeSpaceProportion = proportion;
        ci.minimumWidth = minWidth;
        ci.maximumWidth = maxWidth;
        return ci;
    };
    ColumnWidthInfo fixed;
    fixed.width = 100;

    EXPECT_EQ(calcSpaceFillingWidths({fixed, fill(1), fill(3)}, 500), (std::vector<int>{100, 100, 300}));

    //bounded column gives up its share
    EXPECT_EQ(calcSpaceFillingWidths({fixed, fill(1, -1, 50), fill(1)}, 500), (std::vector<int>{100, 50, 350}));

    //rounding remainder goes to the first column
    EXPECT_EQ(calcSpaceFillingWidths({fill(1), fill(1), fill(1)}, 100), (std::vector<int>{34, 33, 33}));

    //no free space left
    EXPECT_EQ(calcSpaceFillingWidths({fixed, fill(1, 20)}, 80), (std::vector<int>{100, 20}));
    EXPECT_EQ(calcSpaceFillingWidths({fixed, fill(0)}, 300), (std::vector<int>{100, 0}));
}
