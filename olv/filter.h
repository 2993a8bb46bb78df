// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef FILTER_H_7730194852630192845
#define FILTER_H_7730194852630192845

#include <algorithm>
#include <functional>
#include <memory>
#include <vector>
#include "column.h"


namespace olv
{
/*  filters reduce the list of model objects shown by a list:
        model filter: applied first
        list filter:  applied to the output of the model filter

    model->setListFilter(std::make_shared<TailFilter<Person>>(20));     */

template <class T>
class ListFilter
{
public:
    using ObjectPtr = std::shared_ptr<T>;

    virtual ~ListFilter() {}

    virtual std::vector<ObjectPtr> apply(const std::vector<ObjectPtr>& objects) const = 0;
};


template <class T>
class PredicateFilter : public ListFilter<T>
{
public:
    using typename ListFilter<T>::ObjectPtr;

    explicit PredicateFilter(const std::function<bool(const T& obj)>& pred) : pred_(pred) {}

    std::vector<ObjectPtr> apply(const std::vector<ObjectPtr>& objects) const override
    {
        std::vector<ObjectPtr> output;
        std::copy_if(objects.begin(), objects.end(), std::back_inserter(output), [&](const ObjectPtr& obj) { return pred_(*obj); });
        return output;
    }

private:
    const std::function<bool(const T& obj)> pred_;
};


//first n objects
template <class T>
class HeadFilter : public ListFilter<T>
{
public:
    using typename ListFilter<T>::ObjectPtr;

    explicit HeadFilter(size_t count) : count_(count) {}

    std::vector<ObjectPtr> apply(const std::vector<ObjectPtr>& objects) const override
    {
        return {objects.begin(), objects.begin() + std::min(count_, objects.size())};
    }

private:
    const size_t count_;
};


//last n objects
template <class T>
class TailFilter : public ListFilter<T>
{
public:
    using typename ListFilter<T>::ObjectPtr;

    explicit TailFilter(size_t count) : count_(count) {}

    std::vector<ObjectPtr> apply(const std::vector<ObjectPtr>& objects) const override
    {
        return {objects.end() - std::min(count_, objects.size()), objects.end()};
    }

private:
    const size_t count_;
};


//case-insensitive substring match on the string values of the given columns; empty text matches everything
template <class T>
class TextSearchFilter : public ListFilter<T>
{
public:
    using typename ListFilter<T>::ObjectPtr;

    TextSearchFilter(const std::vector<ColumnDefn<T>>& columns, const std::wstring& text) : columns_(columns), text_(text) {}

    void setText(const std::wstring& text) { text_ = text; }
    const std::wstring& getText() const { return text_; }

    std::vector<ObjectPtr> apply(const std::vector<ObjectPtr>& objects) const override
    {
        if (text_.empty())
            return objects;

        std::vector<ObjectPtr> output;
        for (const ObjectPtr& obj : objects)
            if (std::any_of(columns_.begin(), columns_.end(), [&](const ColumnDefn<T>& col) { return containsNoCase(col.getStringValue(*obj), text_); }))
                output.push_back(obj);
        return output;
    }

private:
    const std::vector<ColumnDefn<T>> columns_;
    std::wstring text_;
};


//apply each filter to the output of the previous one
template <class T>
class ChainFilter : public ListFilter<T>
{
public:
    using typename ListFilter<T>::ObjectPtr;

    explicit ChainFilter(const std::vector<std::shared_ptr<const ListFilter<T>>>& filters) : filters_(filters) {}

    std::vector<ObjectPtr> apply(const std::vector<ObjectPtr>& objects) const override
    {
        std::vector<ObjectPtr> output = objects;
        for (const std::shared_ptr<const ListFilter<T>>& filter : filters_)
            if (filter)
                output = filter->apply(output);
        return output;
    }

private:
    const std::vector<std::shared_ptr<const ListFilter<T>>> filters_;
};
}

#endif //FILTER_H_7730194852630192845
