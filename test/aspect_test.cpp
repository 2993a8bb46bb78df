// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include <gtest/gtest.h>
#include <olv/aspect.h>
#include "test_data.h"

using namespace olv;
using namespace olv_test;


namespace
{
enum class Colour { red, green, blue };

struct Widget
{
    Colour colour = Colour::green;
    double weight = 1.5;
    RecordRef extra;
};
}


TEST(Aspect, RegisteredMembers)
{
    const std::vector<PersonPtr> persons = makePersons();
    const Person& alex = *persons[0];

    EXPECT_EQ(getAspectValue(alex, L"name"), Value(L"Alex Bawling"));
    EXPECT_EQ(getAspectValue(alex, L"birthDate"), Value(Date{1955, 1, 2}));
    EXPECT_EQ(getAspectValue(alex, L"children"), Value(2));
    EXPECT_EQ(getAspectValue(alex, L"isMale"), Value(true));
    EXPECT_EQ(getAspectValue(alex, L"sex"), Value(L"Male"));
    EXPECT_TRUE(getAspectValue(alex, L"nickname").isNull());
}


TEST(Aspect, UnknownNameYieldsErrorText)
{
    const std::vector<PersonPtr> persons = makePersons();

    EXPECT_EQ(getAspectValue(*persons[0], L"age"),
              Value(L"'age' is not a parameter-less method, property or field of type 'Person'"));

    EXPECT_EQ(getAspectValue(*persons[0], L"birthDate.Week"),
              Value(L"'Week' is not a parameter-less method, property or field of type 'Date'"));
}


TEST(Aspect, DottedPath)
{
    const std::vector<PersonPtr> persons = makePersons();
    const Person& ian = *persons[4];

    EXPECT_EQ(getAspectValue(ian, L"birthDate.Year"),  Value(1931));
    EXPECT_EQ(getAspectValue(ian, L"birthDate.month"), Value(9));
    EXPECT_EQ(getAspectValue(ian, L"name.Length"),     Value(10));
    EXPECT_TRUE(getAspectValue(ian, L"nickname.Length").isNull()); //null propagates
}


TEST(Aspect, RecordsAndRows)
{
    auto address = std::make_shared<Record>(Record{{L"city", L"Paris"}});
    const Record rec{{L"id", 7}, {L"address", RecordRef(address)}};

    EXPECT_EQ(getAspectValue(rec, L"id"), Value(7));
    EXPECT_EQ(getAspectValue(rec, L"address.city"), Value(L"Paris"));
    EXPECT_TRUE(getAspectValue(rec, L"missing").isNull());
    EXPECT_TRUE(getAspectValue(rec, L"address.zip").isNull());

    const std::vector<Value> row{L"a", 2, 3.5};
    EXPECT_EQ(Aspect<std::vector<Value>>(AspectIndex{1}).get(row), Value(2));
    EXPECT_TRUE(Aspect<std::vector<Value>>(AspectIndex{5}).get(row).isNull());

    std::vector<Value> rowMod = row;
    EXPECT_TRUE (Aspect<std::vector<Value>>(AspectIndex{0}).set(rowMod, L"b"));
    EXPECT_FALSE(Aspect<std::vector<Value>>(AspectIndex{3}).set(rowMod, L"c"));
    EXPECT_EQ(rowMod[0], Value(L"b"));
}


TEST(Aspect, Callable)
{
    const std::vector<PersonPtr> persons = makePersons();

    const Aspect<Person> initials([](const Person& p) { return p.name.substr(0, 1); });
    EXPECT_TRUE(initials.isCallable());
    EXPECT_EQ(initials.get(*persons[1]), Value(L"C"));

    Person tmp = *persons[1];
    EXPECT_FALSE(initials.set(tmp, L"X"));
    EXPECT_TRUE(Aspect<Person>().empty());
}


TEST(Aspect, Setters)
{
    std::vector<PersonPtr> persons = makePersons();
    Person& cindy = *persons[1];

    EXPECT_TRUE(setAspectValue(cindy, L"name", L"Cindy Dusk"));
    EXPECT_EQ(cindy.name, L"Cindy Dusk");

    EXPECT_TRUE(setAspectValue(cindy, L"children", 5));
    EXPECT_EQ(cindy.children, 5);

    EXPECT_TRUE(setAspectValue(cindy, L"children", 6.0)); //integral double is accepted
    EXPECT_EQ(cindy.children, 6);

    EXPECT_TRUE(setAspectValue(cindy, L"nickname", L"Cin"));
    EXPECT_EQ(cindy.nickname, L"Cin");
    EXPECT_TRUE(setAspectValue(cindy, L"nickname", Value()));
    EXPECT_FALSE(cindy.nickname);

    EXPECT_FALSE(setAspectValue(cindy, L"sex", L"Male"));           //method: read-only
    EXPECT_FALSE(setAspectValue(cindy, L"birthDate.Year", 2000));  //dotted: read-only
    EXPECT_FALSE(setAspectValue(cindy, L"unknown", 1));
    EXPECT_EQ(cindy.birthDate, (Date{1967, 3, 4}));

    const AspectSetter<Person> setter(L"birthDate");
    EXPECT_TRUE(setter.set(cindy, DateTime{{1968, 4, 5}, {10, 0, 0}}));
    EXPECT_EQ(cindy.birthDate, (Date{1968, 4, 5}));

    Record rec;
    EXPECT_TRUE(setAspectValue(rec, L"x", 1));
    EXPECT_EQ(rec.get(L"x"), Value(1));
}


TEST(Aspect, ConversionError)
{
    std::vector<PersonPtr> persons = makePersons();

    EXPECT_THROW(setAspectValue(*persons[0], L"children", L"many"), ValueConversionError);
    EXPECT_THROW(setAspectValue(*persons[0], L"children", 2.5), ValueConversionError);
    EXPECT_THROW(setAspectValue(*persons[0], L"birthDate", 17), ValueConversionError);
    EXPECT_EQ(persons[0]->children, 2);
}


TEST(Aspect, EnumsAndProperties)
{
    AspectRegistry<Widget>::instance().setTypeName(L"Widget")
                                      .addField(L"colour", &Widget::colour)
                                      .addField(L"extra",  &Widget::extra)
                                      .addProperty(L"weightGram",
                                                   [](const Widget& w) { return Value(w.weight * 1000); },
                                                   [](Widget& w, const Value& v) { w.weight = fromValue<double>(v) / 1000; });
    Widget w;
    EXPECT_EQ(getAspectValue(w, L"colour"), Value(1));
    EXPECT_TRUE(setAspectValue(w, L"colour", 2));
    EXPECT_EQ(w.colour, Colour::blue);

    EXPECT_EQ(getAspectValue(w, L"weightGram"), Value(1500.0));
    EXPECT_TRUE(setAspectValue(w, L"weightGram", 250));
    EXPECT_EQ(w.weight, 0.25);

    EXPECT_TRUE(getAspectValue(w, L"extra.note").isNull());
    w.extra = std::make_shared<Record>(Record{{L"note", L"fragile"}});
    EXPECT_EQ(getAspectValue(w, L"extra.note"), Value(L"fragile"));
}
