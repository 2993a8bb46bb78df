// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef VALUE_H_2094817236450918273
#define VALUE_H_2094817236450918273

#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>


namespace olv
{
struct Date
{
    int year  = 1970;
    int month = 1; //1-12
    int day   = 1; //1-31

    std::strong_ordering operator<=>(const Date&) const = default;
};

struct TimeOfDay
{
    int hour   = 0; //0-23
    int minute = 0;
    int second = 0;

    std::strong_ordering operator<=>(const TimeOfDay&) const = default;
};

struct DateTime
{
    Date      date;
    TimeOfDay time;

    std::strong_ordering operator<=>(const DateTime&) const = default;
};

class Record;
using RecordRef = std::shared_ptr<const Record>;


enum class ValueKind //order is significant: values of different kinds are sorted by kind
{
    null,
    boolean,
    integer,
    floating,
    text,
    date,
    time,
    dateTime,
    record,
};


//the (dynamically typed) value of one aspect of a model object
class Value
{
public:
    Value() {}
    Value(std::nullptr_t) {}
    Value(bool b) : var_(b) {}
    template <class N, std::enable_if_t<std::is_integral_v<N> && !std::is_same_v<N, bool> && !std::is_same_v<N, wchar_t>, int> = 0>
    Value(N n) : var_(static_cast<int64_t>(n)) {}
    Value(double d) : var_(d) {}
    Value(float f) : var_(static_cast<double>(f)) {}
    Value(const wchar_t* str) : var_(std::wstring(str)) {}
    Value(const std::wstring& str) : var_(str) {}
    Value(std::wstring&& str) : var_(std::move(str)) {}
    Value(const Date& d) : var_(d) {}
    Value(const TimeOfDay& t) : var_(t) {}
    Value(const DateTime& dt) : var_(dt) {}
    Value(const RecordRef& rec) { if (rec) var_ = rec; }

    ValueKind kind() const { return static_cast<ValueKind>(var_.index()); }
    bool isNull() const { return kind() == ValueKind::null; }
    bool isNumber() const { return kind() == ValueKind::integer || kind() == ValueKind::floating; }

    template <class T> const T* get() const { return std::get_if<T>(&var_); } //nullptr if kind does not match

    bool operator==(const Value& other) const;

private:
    std::variant<std::monostate, bool, int64_t, double, std::wstring, Date, TimeOfDay, DateTime, RecordRef> var_;
};


//dictionary-like model object: field name => value
class Record
{
public:
    Record() {}
    Record(std::initializer_list<std::pair<const std::wstring, Value>> fields) : fields_(fields) {}

    Value get(const std::wstring& name) const; //null if missing
    void set(const std::wstring& name, const Value& value) { fields_[name] = value; }
    bool contains(const std::wstring& name) const { return fields_.contains(name); }

    const std::map<std::wstring, Value>& fields() const { return fields_; }

    bool operator==(const Record& other) const { return fields_ == other.fields_; }

private:
    std::map<std::wstring, Value> fields_;
};


std::weak_ordering compareValues(const Value& lhs, const Value& rhs); //strings: case-insensitive

std::wstring toDisplayString(const Value& v); //null => empty string

//printf-style pattern for numbers and text, strftime-style for dates and times; falls back to toDisplayString()
std::wstring formatValue(const std::wstring& format, const Value& v);

std::wstring formatDate    (const Date& d);      //YYYY-MM-DD
std::wstring formatTime    (const TimeOfDay& t); //HH:MM:SS
std::wstring formatDateTime(const DateTime& dt); //YYYY-MM-DD HH:MM:SS

std::optional<double>  getNumber (const Value& v); //integer or floating
std::optional<int64_t> getInteger(const Value& v); //integer or integral floating
}

#endif //VALUE_H_2094817236450918273
