// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef TEST_DATA_H_2019384756102938475
#define TEST_DATA_H_2019384756102938475

#include <memory>
#include <vector>
#include <olv/list_model.h>


namespace olv_test
{
using namespace olv;

struct Person
{
    std::wstring name;
    Date birthDate;
    bool isMale = true;
    int  children = 0;
    std::optional<std::wstring> nickname;

    std::wstring getSex() const { return isMale ? L"Male" : L"Female"; }
};

using PersonPtr = std::shared_ptr<Person>;


inline
void registerPersonAspects()
{
    AspectRegistry<Person>::instance().setTypeName(L"Person")
                                      .addField (L"name",      &Person::name)
                                      .addField (L"birthDate", &Person::birthDate)
                                      .addField (L"isMale",    &Person::isMale)
                                      .addField (L"children",  &Person::children)
                                      .addField (L"nickname",  &Person::nickname)
                                      .addMethod(L"sex",       &Person::getSex);
}


inline
std::vector<PersonPtr> makePersons()
{
    registerPersonAspects();

    auto makePerson = [](const wchar_t* name, Date birthDate, bool isMale, int children)
    {
        auto p = std::make_shared<Person>();
        p->name      = name;
        p->birthDate = birthDate;
        p->isMale    = isMale;
        p->children  = children;
        return p;
    };

    return
    {
        makePerson(L"Alex Bawling",  {1955, 1,  2}, true,  2),
        makePerson(L"Cindy Dawn",    {1967, 3,  4}, false, 0),
        makePerson(L"Eric Fandango", {1957, 5,  6}, true,  3),
        makePerson(L"Ginger Hawk",   {1977, 7,  8}, false, 1),
        makePerson(L"Ian Janide",    {1931, 9, 10}, true,  4),
        makePerson(L"Zoe Meliko",    {1974, 9, 10}, false, 0),
        makePerson(L"ae cummings",   {1944, 9, 10}, true,  1),
    };
}


//columns: 0 name, 1 birth date, 2 sex, 3 children
inline
std::vector<ColumnDefn<Person>> makePersonColumns()
{
    registerPersonAspects();

    std::vector<ColumnDefn<Person>> cols
    {
        ColumnDefn<Person>(L"Name",     ColumnAlignment::left,  150, L"name"),
        ColumnDefn<Person>(L"Birthday", ColumnAlignment::left,  100, L"birthDate"),
        ColumnDefn<Person>(L"Sex",      ColumnAlignment::left,   60, L"sex"),
        ColumnDefn<Person>(L"Children", ColumnAlignment::right,  60, L"children"),
    };
    return cols;
}


inline
std::vector<std::wstring> getNames(const std::vector<PersonPtr>& persons)
{
    std::vector<std::wstring> names;
    for (const PersonPtr& p : persons)
        names.push_back(p->name);
    return names;
}


//record what the model tells the list control
struct ViewSpy : public ListViewNotify
{
    void onRowsReset() override { ++rowsReset; }
    void onRowsRefreshed(size_t rowFirst, size_t rowLast) override { refreshed.emplace_back(rowFirst, rowLast); }
    void onColumnsReset() override { ++columnsReset; }
    void onSelectionChanged() override { ++selectionChanged; }
    void onSortIndicatorChanged() override { ++sortIndicatorChanged; }

    int rowsReset = 0;
    int columnsReset = 0;
    int selectionChanged = 0;
    int sortIndicatorChanged = 0;
    std::vector<std::pair<size_t, size_t>> refreshed;
};
}

#endif //TEST_DATA_H_2019384756102938475
