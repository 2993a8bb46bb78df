// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef ASPECT_H_6613092847561029384
#define ASPECT_H_6613092847561029384

#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>
#include "value.h"
#include "error.h"
#include "string_tools.h"


namespace olv
{
/*  Aspect: a named (possibly dotted) path into a model object, e.g. "birthDate.Year"

    Model types register their readable/writable members once:
        AspectRegistry<Person>::instance().setTypeName(L"Person")
                                          .addField (L"name",    &Person::name)
                                          .addMethod(L"getAge",  &Person::getAge);

    Without registration:
        - Record:             aspect name = field name, missing field => null
        - std::vector<Value>: use AspectIndex{n}, out of range => null          */

template <class M> Value toValue(const M& m);
template <class M> M fromValue(const Value& v); //throw ValueConversionError

template <class T>
struct AspectAccessor
{
    std::function<Value(const T&)>           get;
    std::function<void(T&, const Value& v)> set; //empty for read-only aspects
};


template <class T>
class AspectRegistry
{
public:
    static AspectRegistry& instance()
    {
        static AspectRegistry inst;
        return inst;
    }

    template <class M>
    AspectRegistry& addField(const std::wstring& name, M T::* member)
    {
        accessors_[name] = { [member](const T& obj) { return toValue(obj.*member); },
                             [member](T& obj, const Value& v) { obj.*member = fromValue<M>(v); }};
        return *this;
    }

    template <class R>
    AspectRegistry& addMethod(const std::wstring& name, R (T::*method)() const)
    {
        accessors_[name] = { [method](const T& obj) { return toValue((obj.*method)()); }, nullptr };
        return *this;
    }

    AspectRegistry& addProperty(const std::wstring& name, const std::function<Value(const T&)>& get, const std::function<void(T&, const Value&)>& set = nullptr)
    {
        accessors_[name] = { get, set };
        return *this;
    }

    AspectRegistry& setTypeName(const std::wstring& typeName) { typeName_ = typeName; return *this; }

    std::wstring getTypeName() const
    {
        if (!typeName_.empty())
            return typeName_;
        const char* rawName = typeid(T).name(); //mangled, but better than nothing
        return std::wstring(rawName, rawName + std::strlen(rawName));
    }

    const AspectAccessor<T>* find(const std::wstring& name) const
    {
        if (auto it = accessors_.find(name);
            it != accessors_.end())
            return &it->second;
        return nullptr;
    }

private:
    AspectRegistry() {}
    AspectRegistry           (const AspectRegistry&) = delete;
    AspectRegistry& operator=(const AspectRegistry&) = delete;

    std::map<std::wstring, AspectAccessor<T>> accessors_;
    std::wstring typeName_;
};


std::wstring getAspectErrorText(const std::wstring& name, const std::wstring& typeName);
std::wstring getValueKindName(ValueKind kind);

//resolve one path segment on an already computed value: record field, date component, text length
Value getValueComponent(const Value& v, const std::wstring& name);

template <class T> Value getAspectValue(const T& obj, const std::wstring& path);
template <class T> bool  setAspectValue(T& obj, const std::wstring& path, const Value& v); //false: not writable, nothing done

struct AspectIndex { size_t index = 0; };


//value getter of a column: callable, aspect path or index
template <class T>
class Aspect
{
public:
    Aspect() {}
    Aspect(const std::function<Value(const T&)>& fun) { if (fun) munger_ = fun; }
    template <class F, std::enable_if_t<std::is_invocable_v<const F&, const T&> && !std::is_convertible_v<F, std::wstring>, int> = 0>
    Aspect(F fun) : munger_(std::function<Value(const T&)>([fun](const T& obj) { return Value(fun(obj)); })) {}
    Aspect(const wchar_t* path) : munger_(std::wstring(path)) {}
    Aspect(const std::wstring& path) : munger_(path) {}
    Aspect(AspectIndex idx) : munger_(idx) {}

    bool empty() const { return std::holds_alternative<std::monostate>(munger_); }
    bool isCallable() const { return std::holds_alternative<std::function<Value(const T&)>>(munger_); }

    const std::wstring* getPath () const { return std::get_if<std::wstring>(&munger_); }
    const AspectIndex*  getIndex() const { return std::get_if<AspectIndex >(&munger_); }

    Value get(const T& obj) const;
    bool  set(T& obj, const Value& v) const; //callables can't set: return false

private:
    std::variant<std::monostate, std::function<Value(const T&)>, std::wstring, AspectIndex> munger_;
};


//value setter of a column: callable or aspect path
template <class T>
class AspectSetter
{
public:
    AspectSetter() {}
    AspectSetter(const std::function<void(T&, const Value&)>& fun) { if (fun) munger_ = fun; }
    template <class F, std::enable_if_t<std::is_invocable_v<const F&, T&, const Value&> && !std::is_convertible_v<F, std::wstring>, int> = 0>
    AspectSetter(F fun) : munger_(std::function<void(T&, const Value&)>(fun)) {}
    AspectSetter(const wchar_t* path) : munger_(std::wstring(path)) {}
    AspectSetter(const std::wstring& path) : munger_(path) {}

    bool empty() const { return std::holds_alternative<std::monostate>(munger_); }

    bool set(T& obj, const Value& v) const
    {
        if (const auto fun = std::get_if<std::function<void(T&, const Value&)>>(&munger_))
        {
            (*fun)(obj, v);
            return true;
        }
        if (const std::wstring* path = std::get_if<std::wstring>(&munger_))
            return setAspectValue(obj, *path, v);
        return false;
    }

private:
    std::variant<std::monostate, std::function<void(T&, const Value&)>, std::wstring> munger_;
};








//######################## implementation ##########################
namespace impl
{
template <class M> struct IsOptional                   : std::false_type {};
template <class M> struct IsOptional<std::optional<M>> : std::true_type  {};

template <class M> struct IsSharedPtr                     : std::false_type {};
template <class M> struct IsSharedPtr<std::shared_ptr<M>> : std::true_type  {};
}


template <class M> inline
Value toValue(const M& m)
{
    if constexpr (impl::IsOptional<M>::value)
        return m ? toValue(*m) : Value();
    else if constexpr (std::is_enum_v<M>)
        return Value(static_cast<int64_t>(m));
    else if constexpr (std::is_same_v<M, RecordRef>)
        return Value(m);
    else if constexpr (impl::IsSharedPtr<M>::value) //e.g. std::shared_ptr<Record>
        return Value(RecordRef(m));
    else
        return Value(m);
}


template <class M> inline
M fromValue(const Value& v)
{
    auto throwConversionError = [&]() -> M
    {
        throw ValueConversionError(replaceCpy(_("Cannot convert %x to the type of the aspect."), L"%x", fmtText(toDisplayString(v))),
                                   replaceCpy(_("Value type: %x"), L"%x", getValueKindName(v.kind())));
    };

    if constexpr (std::is_same_v<M, Value>)
        return v;
    else if constexpr (impl::IsOptional<M>::value)
    {
        if (v.isNull())
            return std::nullopt;
        return fromValue<typename M::value_type>(v);
    }
    else if constexpr (std::is_same_v<M, bool>)
    {
        if (const bool* b = v.get<bool>())
            return *b;
        if (const std::optional<int64_t> n = getInteger(v))
            return *n != 0;
        return throwConversionError();
    }
    else if constexpr (std::is_enum_v<M>)
    {
        if (const std::optional<int64_t> n = getInteger(v))
            return static_cast<M>(*n);
        return throwConversionError();
    }
    else if constexpr (std::is_integral_v<M>)
    {
        if (const std::optional<int64_t> n = getInteger(v))
            return static_cast<M>(*n);
        return throwConversionError();
    }
    else if constexpr (std::is_floating_point_v<M>)
    {
        if (const std::optional<double> d = getNumber(v))
            return static_cast<M>(*d);
        return throwConversionError();
    }
    else if constexpr (std::is_same_v<M, std::wstring>)
        return toDisplayString(v);
    else if constexpr (std::is_same_v<M, DateTime>)
    {
        if (const DateTime* dt = v.get<DateTime>())
            return *dt;
        if (const Date* d = v.get<Date>())
            return DateTime{*d, TimeOfDay()};
        return throwConversionError();
    }
    else if constexpr (std::is_same_v<M, Date>)
    {
        if (const Date* d = v.get<Date>())
            return *d;
        if (const DateTime* dt = v.get<DateTime>())
            return dt->date;
        return throwConversionError();
    }
    else if constexpr (std::is_same_v<M, TimeOfDay>)
    {
        if (const TimeOfDay* t = v.get<TimeOfDay>())
            return *t;
        if (const DateTime* dt = v.get<DateTime>())
            return dt->time;
        return throwConversionError();
    }
    else if constexpr (std::is_same_v<M, RecordRef>)
    {
        if (v.isNull())
            return nullptr;
        if (const RecordRef* rec = v.get<RecordRef>())
            return *rec;
        return throwConversionError();
    }
    else
        static_assert(!sizeof(M), "unsupported aspect member type");
}


namespace impl
{
template <class T> inline
Value getFirstSegment(const T& obj, const std::wstring& name)
{
    if constexpr (std::is_same_v<T, Record>)
        return obj.get(name);
    else if constexpr (std::is_same_v<T, std::vector<Value>>)
        return Value(); //index-based only
    else
    {
        const AspectRegistry<T>& reg = AspectRegistry<T>::instance();
        if (const AspectAccessor<T>* acc = reg.find(name))
            return acc->get(obj);
        return getAspectErrorText(name, reg.getTypeName());
    }
}
}


template <class T> inline
Value getAspectValue(const T& obj, const std::wstring& path)
{
    const std::vector<std::wstring> segments = splitCpy(path, L'.', SplitOnEmpty::allow);

    Value v = impl::getFirstSegment(obj, segments[0]);

    for (auto it = segments.begin() + 1; it != segments.end(); ++it)
    {
        if (v.isNull()) //null propagates: "spouse.name" with spouse == null
            return Value();
        v = getValueComponent(v, *it);
    }
    return v;
}


template <class T> inline
bool setAspectValue(T& obj, const std::wstring& path, const Value& v)
{
    if (contains(path, L".")) //intermediate values are copies: nothing to write back into
        return false;

    if constexpr (std::is_same_v<T, Record>)
    {
        obj.set(path, v);
        return true;
    }
    else if constexpr (std::is_same_v<T, std::vector<Value>>)
        return false;
    else
    {
        if (const AspectAccessor<T>* acc = AspectRegistry<T>::instance().find(path))
            if (acc->set)
            {
                acc->set(obj, v); //throw ValueConversionError
                return true;
            }
        return false;
    }
}


template <class T> inline
Value Aspect<T>::get(const T& obj) const
{
    if (const auto fun = std::get_if<std::function<Value(const T&)>>(&munger_))
        return (*fun)(obj);

    if (const std::wstring* path = std::get_if<std::wstring>(&munger_))
        return getAspectValue(obj, *path);

    if (const AspectIndex* idx = std::get_if<AspectIndex>(&munger_))
    {
        if constexpr (std::is_same_v<T, std::vector<Value>>)
        {
            if (idx->index < obj.size())
                return obj[idx->index];
        }
        else if constexpr (std::is_same_v<T, Record>)
            return obj.get(std::to_wstring(idx->index));
    }
    return Value();
}


template <class T> inline
bool Aspect<T>::set(T& obj, const Value& v) const
{
    if (const std::wstring* path = std::get_if<std::wstring>(&munger_))
        return setAspectValue(obj, *path, v);

    if (const AspectIndex* idx = std::get_if<AspectIndex>(&munger_))
    {
        if constexpr (std::is_same_v<T, std::vector<Value>>)
        {
            if (idx->index < obj.size())
            {
                obj[idx->index] = v;
                return true;
            }
        }
        else if constexpr (std::is_same_v<T, Record>)
        {
            obj.set(std::to_wstring(idx->index), v);
            return true;
        }
    }
    return false;
}
}

#endif //ASPECT_H_6613092847561029384
