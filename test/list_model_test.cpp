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
class ListModelTest : public testing::Test
{
protected:
    void SetUp() override
    {
        persons = makePersons();
        model.setColumns(makePersonColumns());
        model.attachView(&spy);
        model.setObjects(persons);
    }

    std::vector<std::wstring> getRowTexts(size_t viewCol = 0) const
    {
        std::vector<std::wstring> texts;
        for (size_t row = 0; row < model.getRowCount(); ++row)
            texts.push_back(model.getCellText(row, viewCol));
        return texts;
    }

    std::vector<PersonPtr> persons;
    ObjectListModel<Person> model;
    ViewSpy spy;
};

const std::vector<std::wstring> namesInsertionOrder{L"Alex Bawling", L"Cindy Dawn", L"Eric Fandango", L"Ginger Hawk", L"Ian Janide", L"Zoe Meliko", L"ae cummings"};
const std::vector<std::wstring> namesAscending     {L"ae cummings", L"Alex Bawling", L"Cindy Dawn", L"Eric Fandango", L"Ginger Hawk", L"Ian Janide", L"Zoe Meliko"};
}


TEST_F(ListModelTest, SetObjects)
{
    EXPECT_EQ(model.getObjectCount(), 7u);
    EXPECT_EQ(model.getRowCount(), 7u);
    EXPECT_EQ(getRowTexts(), namesInsertionOrder);
    EXPECT_EQ(model.getCellText(2, 3), L"3");
    EXPECT_EQ(model.getObjectAt(4), persons[4]);
    EXPECT_EQ(model.getObjectAt(7), nullptr);
    EXPECT_EQ(model.getIndexOf(*persons[6]), 6);
    EXPECT_GE(spy.rowsReset, 1);

    model.addObject(persons[0]); //no duplicates
    EXPECT_EQ(model.getObjectCount(), 7u);

    model.clearAll();
    EXPECT_EQ(model.getRowCount(), 0u);
    EXPECT_EQ(model.getEmptyListMsg(), L"This list is empty");
}


TEST_F(ListModelTest, SortBy)
{
    model.sortBy(0, true);
    EXPECT_EQ(getRowTexts(), namesAscending);
    EXPECT_EQ(model.getSortIndicator(), std::pair(size_t(0), true));
    EXPECT_EQ(spy.sortIndicatorChanged, 1);

    model.sortBy(0, false);
    EXPECT_EQ(getRowTexts(), std::vector<std::wstring>(namesAscending.rbegin(), namesAscending.rend()));

    model.sortBy(1, true);
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Ian Janide", L"ae cummings", L"Alex Bawling", L"Eric Fandango", L"Cindy Dawn", L"Zoe Meliko", L"Ginger Hawk"}));

    model.unsort();
    EXPECT_EQ(getRowTexts(), namesInsertionOrder);
    EXPECT_EQ(model.getSortIndicator(), std::nullopt);

    model.sortBy(17, true); //invalid column
    EXPECT_EQ(model.getSortColumn(), std::nullopt);
}


TEST_F(ListModelTest, ColumnClickTogglesDirection)
{
    model.handleColumnClick(3);
    EXPECT_EQ(model.getSortColumn(), 3u);
    EXPECT_TRUE(model.isSortAscending());
    EXPECT_EQ(getRowTexts(3), (std::vector<std::wstring>{L"0", L"0", L"1", L"1", L"2", L"3", L"4"}));
    EXPECT_EQ(model.getCellText(0, 0), L"Cindy Dawn"); //stable: insertion order among equal values

    model.handleColumnClick(3);
    EXPECT_FALSE(model.isSortAscending());
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Ian Janide", L"Eric Fandango", L"Alex Bawling", L"Ginger Hawk", L"ae cummings", L"Cindy Dawn", L"Zoe Meliko"}));

    model.handleColumnClick(0);
    EXPECT_EQ(model.getSortColumn(), 0u);
    EXPECT_TRUE(model.isSortAscending());
}


TEST_F(ListModelTest, SortingEvents)
{
    int afterSorting = 0;
    model.events().onAfterSorting = [&](const SortingEvent& e) { ++afterSorting; EXPECT_EQ(e.sortColumn, 0u); };

    model.events().onBeforeSorting = [](SortingEvent& e) { e.cancelled = true; };
    model.sortBy(0, true);
    EXPECT_EQ(model.getSortColumn(), std::nullopt);
    EXPECT_EQ(getRowTexts(), namesInsertionOrder);
    EXPECT_EQ(afterSorting, 0);

    //handler sorts by itself: the model must not reorder the objects
    model.events().onBeforeSorting = [](SortingEvent& e) { e.handled = true; };
    model.sortBy(0, true);
    EXPECT_EQ(model.getSortColumn(), 0u);
    EXPECT_EQ(getRowTexts(), namesInsertionOrder);
    EXPECT_EQ(afterSorting, 1);
}


TEST_F(ListModelTest, ItemEvents)
{
    std::vector<std::pair<size_t, size_t>> changes;
    model.events().onItemsChanged = [&](const ItemsChangedEvent& e) { changes.emplace_back(e.oldObjectCount, e.newObjectCount); };

    model.events().onItemsAdding = [](ItemsAddingEvent<Person>& e) { e.cancelled = true; };
    model.addObject(std::make_shared<Person>());
    EXPECT_EQ(model.getObjectCount(), 7u);
    EXPECT_TRUE(changes.empty());

    model.events().onItemsRemoving = [](ItemsRemovingEvent<Person>& e) { e.objects.pop_back(); };
    model.removeObjects({persons[0].get(), persons[1].get()});
    EXPECT_EQ(model.getObjectCount(), 6u);
    EXPECT_EQ(model.getIndexOf(*persons[1]), 0);

    model.events().onItemsChanging = [](ItemsChangingEvent<Person>& e)
    {
        EXPECT_EQ(e.oldObjectCount, 6u);
        e.newObjects.resize(2);
    };
    model.setObjects(persons);
    EXPECT_EQ(model.getObjectCount(), 2u);

    EXPECT_EQ(changes, (std::vector<std::pair<size_t, size_t>>{{7, 6}, {6, 2}}));
}


TEST_F(ListModelTest, Selection)
{
    int selectionEvents = 0;
    model.events().onSelectionChanged = [&](const SelectionChangedEvent&) { ++selectionEvents; };

    model.selectObject(*persons[2]);
    EXPECT_EQ(model.getSelectedObject(), persons[2]);
    EXPECT_EQ(model.getSelectedRows(), std::vector<size_t>{2});
    EXPECT_EQ(spy.selectionChanged, 1);
    EXPECT_EQ(selectionEvents, 1);

    model.selectObjects({persons[5].get(), persons[0].get()}, false /*deselectOthers*/);
    EXPECT_EQ(model.getSelectedObject(), nullptr); //more than one
    EXPECT_EQ(model.getSelectedObjects(), (std::vector<PersonPtr>{persons[0], persons[2], persons[5]}));

    //selection follows the objects, not the rows
    model.sortBy(0, true);
    EXPECT_EQ(model.getSelectedRows(), (std::vector<size_t>{1, 3, 6}));

    //selection reported by the list control is not echoed back
    const int viewNotifications = spy.selectionChanged;
    model.setSelectedRows({0});
    EXPECT_EQ(model.getSelectedObject(), persons[6]);
    EXPECT_EQ(spy.selectionChanged, viewNotifications);

    model.selectAll();
    EXPECT_EQ(model.getSelectedObjects().size(), 7u);
    model.deselectAll();
    EXPECT_TRUE(model.getSelectedObjects().empty());

    //objects that are not listed can't be selected
    Person stranger;
    model.selectObject(stranger);
    EXPECT_FALSE(model.isObjectSelected(stranger));

    model.selectObject(*persons[3]);
    model.removeObject(*persons[3]);
    EXPECT_TRUE(model.getSelectedObjects().empty());
}


TEST_F(ListModelTest, Filters)
{
    model.selectObjects({persons[0].get(), persons[1].get()});

    model.setModelFilter(std::make_shared<PredicateFilter<Person>>([](const Person& p) { return p.isMale; }));
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Alex Bawling", L"Eric Fandango", L"Ian Janide", L"ae cummings"}));
    EXPECT_EQ(model.getSelectedObjects(), std::vector<PersonPtr>{persons[0]}); //filtered objects are deselected

    model.setListFilter(std::make_shared<TailFilter<Person>>(2));
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Ian Janide", L"ae cummings"}));

    //sorting applies before filtering
    model.sortBy(0, true);
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Eric Fandango", L"Ian Janide"}));

    model.setModelFilter(nullptr);
    model.setListFilter(std::make_shared<TextSearchFilter<Person>>(makePersonColumns(), L"AN"));
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Eric Fandango", L"Ian Janide"}));

    model.setListFilter(std::make_shared<ChainFilter<Person>>(std::vector<std::shared_ptr<const ListFilter<Person>>>
    {
        std::make_shared<PredicateFilter<Person>>([](const Person& p) { return !p.isMale; }),
        std::make_shared<HeadFilter<Person>>(2),
    }));
    EXPECT_EQ(getRowTexts(), (std::vector<std::wstring>{L"Cindy Dawn", L"Ginger Hawk"}));

    model.setListFilter(nullptr);
    EXPECT_EQ(model.getObjectCount(), 7u);
}


TEST_F(ListModelTest, FindRowByPrefix)
{
    //unsorted: linear search on the first column
    EXPECT_EQ(model.findRowByPrefix(L"e", -1), 2);
    EXPECT_EQ(model.findRowByPrefix(L"a", 0), 6); //new search starts after the focused row
    EXPECT_EQ(model.findRowByPrefix(L"al", 0), 0);
    EXPECT_EQ(model.findRowByPrefix(L"x", -1), -1);
    EXPECT_EQ(model.findRowByPrefix(L"", -1), -1);

    //sorted by text: binary search on the sort column
    model.sortBy(0, true);
    EXPECT_EQ(model.findRowByPrefix(L"a", -1), 0);
    EXPECT_EQ(model.findRowByPrefix(L"a", 0), 1);
    EXPECT_EQ(model.findRowByPrefix(L"a", 1), 0); //wrap around
    EXPECT_EQ(model.findRowByPrefix(L"ZOE", 2), 6);
    EXPECT_EQ(model.findRowByPrefix(L"q", 3), -1);

    model.sortBy(0, false);
    EXPECT_EQ(model.findRowByPrefix(L"g", -1), 2);

    //sorted by number: linear search on the sort column
    model.sortBy(3, true);
    EXPECT_EQ(model.findRowByPrefix(L"3", -1), 5);

    ColumnDefn<Person> col = model.getColumn(3);
    col.isSearchable = false;
    model.setColumn(3, col);
    EXPECT_EQ(model.findRowByPrefix(L"3", -1), -1);
}


TEST_F(ListModelTest, RowFormat)
{
    EXPECT_EQ(model.getRowFormat(0).backgroundColour, (RgbColour{240, 248, 255}));
    EXPECT_EQ(model.getRowFormat(1).backgroundColour, (RgbColour{255, 250, 205}));
    EXPECT_FALSE(model.getRowFormat(0).bold);

    model.setRowFormatter([](RowFormat& fmt, const Person& p)
    {
        if (!p.isMale)
            fmt.textColour = RgbColour{255, 0, 0};
    });
    model.setUseAlternateBackColours(false);

    EXPECT_EQ(model.getRowFormat(0).backgroundColour, std::nullopt);
    EXPECT_EQ(model.getRowFormat(0).textColour, std::nullopt);
    EXPECT_EQ(model.getRowFormat(1).textColour, (RgbColour{255, 0, 0}));
}


TEST_F(ListModelTest, CellFormat)
{
    EXPECT_FALSE(model.getRowFormat(0).useCellFormat);
    EXPECT_EQ(model.getCellFormat(0, 0), std::nullopt);

    //format cells of even rows one by one: highlight large families
    model.setRowFormatter([](RowFormat& fmt, const Person& p) { fmt.useCellFormat = fmt.useCellFormat && p.children % 2 == 0; });
    model.setCellFormatter([](CellFormat& fmt, const Person& p, size_t col)
    {
        if (col == 3 && p.children > 1)
        {
            fmt.textColour = RgbColour{255, 0, 0};
            fmt.bold = true;
        }
    });
    EXPECT_TRUE(model.getRowFormat(0).useCellFormat);  //Alex: 2 children
    EXPECT_FALSE(model.getRowFormat(2).useCellFormat); //Eric: 3 children

    const std::optional<CellFormat> children = model.getCellFormat(0, 3);
    ASSERT_TRUE(children);
    EXPECT_EQ(children->textColour, (RgbColour{255, 0, 0}));
    EXPECT_EQ(children->backgroundColour, (RgbColour{240, 248, 255})); //row format is the starting point
    EXPECT_TRUE(children->bold);

    const std::optional<CellFormat> name = model.getCellFormat(0, 0);
    ASSERT_TRUE(name);
    EXPECT_EQ(name->textColour, std::nullopt);
    EXPECT_FALSE(name->bold);

    EXPECT_EQ(model.getCellFormat(2, 3), std::nullopt); //row format applies
    EXPECT_EQ(model.getCellFormat(0, 4), std::nullopt);
    EXPECT_EQ(model.getCellFormat(7, 0), std::nullopt);

    //columns are reported by index, whatever their position
    model.setColumnVisible(0, false);
    const std::optional<CellFormat> childrenMoved = model.getCellFormat(0, 2);
    ASSERT_TRUE(childrenMoved);
    EXPECT_TRUE(childrenMoved->bold);
}


TEST_F(ListModelTest, ItemsAddingReplacesObjects)
{
    auto bob = std::make_shared<Person>(Person{L"Bob"});
    model.events().onItemsAdding = [&](ItemsAddingEvent<Person>& e)
    {
        ASSERT_EQ(e.objects.size(), 2u);
        e.objects = {bob};
    };

    model.addObjects({std::make_shared<Person>(Person{L"Tom"}), std::make_shared<Person>(Person{L"Ann"})});
    EXPECT_EQ(model.getObjectCount(), 8u);
    EXPECT_EQ(model.getObjectAt(7), bob);
    EXPECT_EQ(model.findRowByPrefix(L"tom", -1), -1);
}


TEST_F(ListModelTest, FindRowByPrefixWithNulls)
{
    model.addColumn(ColumnDefn<Person>(L"Nickname", ColumnAlignment::left, 80, L"nickname"));

    //beyond the limit for linear search: only a binary search can find anything
    std::vector<PersonPtr> objects;
    for (size_t i = 0; i <= MAX_ROWS_FOR_UNSORTED_SEARCH; ++i)
        objects.push_back(std::make_shared<Person>(Person{L"Anonymous"}));
    objects[10]   ->nickname = L"Jan";
    objects[500]  ->nickname = L"Bear";
    objects[90000]->nickname = L"Fang";
    model.setObjects(objects);

    model.sortBy(4, true); //Bear Fang Jan <null>...
    EXPECT_EQ(model.findRowByPrefix(L"j", -1), 2);
    EXPECT_EQ(model.findRowByPrefix(L"b", 0), 0); //wrap around
    EXPECT_EQ(model.findRowByPrefix(L"f", 500), 1); //focus on a null row
    EXPECT_EQ(model.findRowByPrefix(L"x", -1), -1);

    model.sortBy(4, false); //Jan Fang Bear <null>...
    EXPECT_EQ(model.findRowByPrefix(L"bea", -1), 2);
    EXPECT_EQ(model.findRowByPrefix(L"jan", -1), 0);
}


TEST_F(ListModelTest, CopySelection)
{
    EXPECT_EQ(model.copySelection().text, L"");

    model.sortBy(0, true);
    model.selectObjects({persons[1].get(), persons[0].get()});

    EXPECT_EQ(model.copySelection().text, L"Alex Bawling\t1955-01-02\tMale\t2\n"
                                          L"Cindy Dawn\t1967-03-04\tFemale\t0\n");

    model.setColumnDisplayOrder({3, 0, 1, 2});
    model.setColumnVisible(1, false);
    model.setIncludeColumnTitlesInCopy(true);

    const ClipboardContent content = model.copySelection();
    EXPECT_EQ(content.text, L"Children\tName\tSex\n"
                            L"2\tAlex Bawling\tMale\n"
                            L"0\tCindy Dawn\tFemale\n");
    EXPECT_EQ(content.html, L"<table>\n"
                            L"<tr><th>Children</th><th>Name</th><th>Sex</th></tr>\n"
                            L"<tr><td>2</td><td>Alex Bawling</td><td>Male</td></tr>\n"
                            L"<tr><td>0</td><td>Cindy Dawn</td><td>Female</td></tr>\n"
                            L"</table>");
}


TEST_F(ListModelTest, Columns)
{
    EXPECT_EQ(model.getViewColumnCount(), 4u);
    EXPECT_EQ(model.getViewColumnInfo(3).title, L"Children");
    EXPECT_EQ(model.getViewColumnInfo(3).align, ColumnAlignment::right);
    EXPECT_EQ(model.getViewColumnInfo(4).title, L""); //beyond the last view column
    EXPECT_EQ(model.getEditorKind(0, 4), EditorKind::text);

    model.sortBy(3, true);
    model.insertColumn(0, ColumnDefn<Person>(L"Initial", ColumnAlignment::left, 20, [](const Person& p) { return p.name.substr(0, 1); }));
    EXPECT_EQ(model.getColumnCount(), 5u);
    EXPECT_EQ(model.getSortColumn(), 4u);
    EXPECT_EQ(model.getColumnDisplayOrder(), (std::vector<size_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(model.getCellText(0, 0), L"C");
    EXPECT_EQ(spy.columnsReset, 1);

    model.setColumnVisible(1, false);
    EXPECT_EQ(model.getViewColumnCount(), 4u);
    EXPECT_EQ(model.getCellText(0, 1), L"1967-03-04");
    EXPECT_EQ(model.getSortIndicator(), std::pair(size_t(3), true));

    model.setColumnDisplayOrder({4, 3, 2, 1, 0});
    EXPECT_EQ(model.getViewColumnOrder(), (std::vector<size_t>{3, 2, 1, 0}));
    model.setColumnDisplayOrder({0, 0, 1, 2, 3}); //not a permutation: ignored
    EXPECT_EQ(model.getColumnDisplayOrder(), (std::vector<size_t>{4, 3, 2, 1, 0}));

    ColumnDefn<Person> name = model.getColumn(1);
    name.minimumWidth = 80;
    name.maximumWidth = 200;
    model.setColumn(1, name);
    model.setColumnWidth(1, 500);
    EXPECT_EQ(model.getColumn(1).width, 200);

    model.setColumnVisible(1, true);
    model.setViewColumnWidth(1, 10);
    EXPECT_EQ(model.getColumn(1).width, 80);
}


TEST_F(ListModelTest, CellValues)
{
    EXPECT_TRUE(model.isCellEditable(0, 0));
    EXPECT_EQ(model.getCellValue(0, 1), Value(Date{1955, 1, 2}));

    EXPECT_EQ(model.getEditorKind(0, 0), EditorKind::text);
    EXPECT_EQ(model.getEditorKind(0, 1), EditorKind::date);
    EXPECT_EQ(model.getEditorKind(0, 3), EditorKind::integer);

    spy.refreshed.clear();
    EXPECT_TRUE(model.setCellValue(2, 0, L"Erica Fandango"));
    EXPECT_EQ(persons[2]->name, L"Erica Fandango");
    EXPECT_EQ(spy.refreshed, (std::vector<std::pair<size_t, size_t>>{{2, 3}}));

    EXPECT_FALSE(model.setCellValue(2, 2, L"Female")); //read-only aspect
    EXPECT_THROW(model.setCellValue(2, 3, L"three"), ValueConversionError);
    EXPECT_FALSE(model.setCellValue(99, 0, L"nobody"));

    ColumnDefn<Person> children = model.getColumn(3);
    children.isEditable = false;
    model.setColumn(3, children);
    EXPECT_FALSE(model.isCellEditable(0, 3));
}


TEST_F(ListModelTest, NullValuesGuessEditor)
{
    ColumnDefn<Person> parent(L"Children if any", ColumnAlignment::right, 80, [](const Person& p) { return p.children > 0 ? Value(p.children) : Value(); });
    model.addColumn(parent);
    EXPECT_EQ(model.getEditorKind(1, 4), EditorKind::integer); //null cell: first non-null value of the column

    ColumnDefn<Person> nick(L"Nickname", ColumnAlignment::left, 80, L"nickname");
    model.addColumn(nick);
    EXPECT_EQ(model.getEditorKind(0, 5), EditorKind::text); //no value in any row

    nick.cellEditorKind = EditorKind::date;
    model.setColumn(5, nick);
    EXPECT_EQ(model.getEditorKind(0, 5), EditorKind::date);
}


TEST_F(ListModelTest, RefreshObject)
{
    spy.refreshed.clear();
    model.refreshObject(*persons[4]);
    EXPECT_EQ(spy.refreshed, (std::vector<std::pair<size_t, size_t>>{{4, 5}}));

    Person stranger;
    model.refreshObject(stranger);
    EXPECT_EQ(spy.refreshed.size(), 1u);
}
