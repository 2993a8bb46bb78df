// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include <gtest/gtest.h>
#include <olv/list_model.h>
#include "test_data.h"

using namespace olv;
using namespace olv_test;


namespace
{
class CheckStateTest : public testing::Test
{
protected:
    void SetUp() override
    {
        persons = makePersons();
        model.setColumns(makePersonColumns());
        model.setObjects(persons);
        model.attachView(&spy);
    }

    std::vector<PersonPtr> persons;
    ObjectListModel<Person> model;
    ViewSpy spy;
};
}


TEST_F(CheckStateTest, NoCheckColumn)
{
    EXPECT_EQ(model.getCheckStateColumn(), std::nullopt);
    EXPECT_EQ(model.getCheckViewColumn(), std::nullopt);
    EXPECT_EQ(model.getCheckState(0), std::nullopt);

    model.check(*persons[0]);
    EXPECT_FALSE(model.isChecked(*persons[0]));
    EXPECT_TRUE(model.getCheckedObjects().empty());
}


TEST_F(CheckStateTest, CreatedCheckColumn)
{
    model.createCheckStateColumn();

    EXPECT_EQ(model.getColumnCount(), 5u);
    EXPECT_EQ(model.getCheckStateColumn(), 0u);
    EXPECT_EQ(model.getCheckViewColumn(), 0u);
    EXPECT_TRUE(model.getColumn(0).isFixedWidth());
    EXPECT_EQ(model.getColumn(0).width, CHECK_COLUMN_WIDTH);
    EXPECT_EQ(model.getCellText(0, 0), L"");
    EXPECT_EQ(model.getCellText(0, 1), L"Alex Bawling");
    EXPECT_EQ(model.getCheckState(0), false);

    spy.refreshed.clear();
    model.check(*persons[0]);
    EXPECT_TRUE(model.isChecked(*persons[0]));
    EXPECT_EQ(model.getCheckState(0), true);
    EXPECT_EQ(model.getCheckedObjects(), std::vector<PersonPtr>{persons[0]});
    EXPECT_EQ(spy.refreshed, (std::vector<std::pair<size_t, size_t>>{{0, 1}}));

    model.toggleCheck(*persons[0]);
    EXPECT_FALSE(model.isChecked(*persons[0]));
}


TEST_F(CheckStateTest, ClickOnSelectedRowChecksSelection)
{
    model.createCheckStateColumn();

    model.handleCheckClick(1);
    EXPECT_TRUE(model.isChecked(*persons[1]));
    model.handleCheckClick(1);
    EXPECT_FALSE(model.isChecked(*persons[1]));

    model.selectObjects({persons[2].get(), persons[3].get()});
    model.handleCheckClick(2);
    EXPECT_EQ(model.getCheckedObjects(), (std::vector<PersonPtr>{persons[2], persons[3]}));
    EXPECT_EQ(model.getSelectedObjects().size(), 2u); //selection is unchanged

    model.handleCheckClick(3);
    EXPECT_TRUE(model.getCheckedObjects().empty());
}


TEST_F(CheckStateTest, CheckStateFollowsObjects)
{
    model.createCheckStateColumn();
    model.setCheckedObjects({persons[5].get(), persons[6].get()});

    model.sortBy(1, true); //name: ae cummings first
    EXPECT_EQ(model.getCheckState(0), true);
    EXPECT_EQ(model.getCheckState(1), false);

    model.setCheckedObjects({persons[4].get()});
    EXPECT_EQ(model.getCheckedObjects(), std::vector<PersonPtr>{persons[4]});

    //removed objects lose their check state
    model.removeObject(*persons[4]);
    model.addObject(persons[4]);
    EXPECT_FALSE(model.isChecked(*persons[4]));

    model.check(*persons[4]);
    model.setObjects({persons[0], persons[1]});
    model.setObjects(persons);
    EXPECT_TRUE(model.getCheckedObjects().empty());
}


TEST_F(CheckStateTest, ModelBackedCheckState)
{
    std::vector<ColumnDefn<Person>> cols = makePersonColumns();
    cols[2].checkStateGetter = [](const Person& p) { return p.isMale; };
    cols[2].checkStateSetter = [](Person& p, bool checked) { p.isMale = checked; };
    model.setColumns(cols);

    EXPECT_EQ(model.getCheckStateColumn(), 2u);
    EXPECT_EQ(model.getCheckedObjects(), (std::vector<PersonPtr>{persons[0], persons[2], persons[4], persons[6]}));

    model.handleCheckClick(0);
    EXPECT_FALSE(persons[0]->isMale);
    EXPECT_EQ(model.getCellText(0, 2), L"Female");

    //a column without a check state getter of its own uses the internal state
    model.installCheckStateColumn(1);
    EXPECT_EQ(model.getCheckViewColumn(), 1u);
    EXPECT_TRUE(model.getCheckedObjects().empty());
    model.check(*persons[3]);
    EXPECT_EQ(model.getCheckedObjects(), std::vector<PersonPtr>{persons[3]});

    model.installCheckStateColumn(std::nullopt);
    EXPECT_EQ(model.getCheckState(3), std::nullopt);
}


TEST_F(CheckStateTest, GroupHeadersHaveNoCheckBox)
{
    model.createCheckStateColumn(4);
    EXPECT_EQ(model.getCheckStateColumn(), 4u);

    model.sortBy(2, true);
    model.setShowGroups(true);
    EXPECT_EQ(model.getCheckState(0), std::nullopt);
    EXPECT_EQ(model.getCheckState(1), false);
}
