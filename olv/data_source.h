// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef DATA_SOURCE_H_1849301726350918237
#define DATA_SOURCE_H_1849301726350918237

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "column.h"
#include "filter.h"
#include "sorting.h"


namespace olv
{
//row data of a virtual list: the list control asks for objects by row index only
template <class T>
class VirtualDataSource
{
public:
    using ObjectPtr = std::shared_ptr<T>;

    virtual ~VirtualDataSource() {}

    virtual ObjectPtr getNthObject(size_t n) const = 0; //nullptr if n is out of range
    virtual size_t getObjectCount() const = 0;
    virtual ptrdiff_t getObjectIndex(const T& obj) const = 0; //-1 if not found

    //the list is about to ask for rows [from, to]
    virtual void prepareCache(size_t from, size_t to) { (void)from; (void)to; }

    //false if getNthObject() may create a new object for the same row on each call: the list then binds selection and check state to rows
    virtual bool hasStableIdentity() const { return true; }

    //case-insensitive prefix match on the string values of "col" in rows [first, last]; -1 if nothing found
    virtual ptrdiff_t searchText(const std::wstring& text, size_t first, size_t last, const ColumnDefn<T>& col) const = 0;

    virtual void sort(const ColumnDefn<T>* col /*nullptr: unsorted*/, bool ascending) = 0;

    virtual void addObjects   (const std::vector<ObjectPtr>& objects) = 0;
    virtual void removeObjects(const std::vector<const T*>& objects) = 0;
    virtual void setObjects   (const std::vector<ObjectPtr>& objects) = 0;

    virtual void applyFilters(const std::shared_ptr<const ListFilter<T>>& modelFilter,
                              const std::shared_ptr<const ListFilter<T>>& listFilter) = 0;

    //objects after filtering, in list order
    virtual std::vector<ObjectPtr> getFilteredObjects() const = 0;
};


/*  in-memory data source:

        filteredObjects_ (+ objectIndex_)       rows shown by the list
            /|\
             | applyFilters()
        sortedObjects_
            /|\
             | sort()
        fullObjects_                            insertion order                 */
template <class T>
class FastDataSource : public VirtualDataSource<T>
{
public:
    using typename VirtualDataSource<T>::ObjectPtr;

    FastDataSource() {}

    ObjectPtr getNthObject(size_t n) const override { return n < filteredObjects_.size() ? filteredObjects_[n] : nullptr; }

    size_t getObjectCount() const override { return filteredObjects_.size(); }

    ptrdiff_t getObjectIndex(const T& obj) const override
    {
        auto it = objectIndex_.find(&obj);
        return it != objectIndex_.end() ? static_cast<ptrdiff_t>(it->second) : -1;
    }

    ptrdiff_t searchText(const std::wstring& text, size_t first, size_t last, const ColumnDefn<T>& col) const override
    {
        for (size_t row = first; row <= last && row < filteredObjects_.size(); ++row)
            if (startsWithNoCase(col.getStringValue(*filteredObjects_[row]), text))
                return row;
        return -1;
    }

    void sort(const ColumnDefn<T>* col, bool ascending) override
    {
        if (col)
            sortColumn_ = *col;
        else
            sortColumn_.reset();
        sortAscending_ = ascending;

        updateSortedView();
        updateFilteredView();
    }

    void addObjects(const std::vector<ObjectPtr>& objects) override
    {
        std::unordered_set<const T*> existing;
        for (const ObjectPtr& obj : fullObjects_)
            existing.insert(obj.get());

        for (const ObjectPtr& obj : objects)
            if (obj && existing.insert(obj.get()).second) //no duplicates
                fullObjects_.push_back(obj);

        updateSortedView();
        updateFilteredView();
    }

    void removeObjects(const std::vector<const T*>& objects) override
    {
        const std::unordered_set<const T*> toRemove(objects.begin(), objects.end());
        std::erase_if(fullObjects_, [&](const ObjectPtr& obj) { return toRemove.contains(obj.get()); });

        updateSortedView();
        updateFilteredView();
    }

    void setObjects(const std::vector<ObjectPtr>& objects) override
    {
        fullObjects_.clear();
        addObjects(objects);
    }

    void applyFilters(const std::shared_ptr<const ListFilter<T>>& modelFilter,
                      const std::shared_ptr<const ListFilter<T>>& listFilter) override
    {
        modelFilter_ = modelFilter;
        listFilter_  = listFilter;
        updateFilteredView();
    }

    std::vector<ObjectPtr> getFilteredObjects() const override { return filteredObjects_; }

    const std::vector<ObjectPtr>& getAllObjects() const { return fullObjects_; } //unfiltered, insertion order

private:
    FastDataSource           (const FastDataSource&) = delete;
    FastDataSource& operator=(const FastDataSource&) = delete;

    void updateSortedView()
    {
        if (!sortColumn_)
        {
            sortedObjects_ = fullObjects_;
            return;
        }

        //evaluate each cell value only once:
        std::vector<std::pair<Value, ObjectPtr>> sortKeys;
        sortKeys.reserve(fullObjects_.size());
        for (const ObjectPtr& obj : fullObjects_)
            sortKeys.emplace_back(sortColumn_->getValue(*obj), obj);

        if (sortAscending_)
            std::stable_sort(sortKeys.begin(), sortKeys.end(), [](const auto& lhs, const auto& rhs) { return lessCellValue<true >(lhs.first, rhs.first); });
        else
            std::stable_sort(sortKeys.begin(), sortKeys.end(), [](const auto& lhs, const auto& rhs) { return lessCellValue<false>(lhs.first, rhs.first); });

        sortedObjects_.clear();
        for (auto& [value, obj] : sortKeys)
            sortedObjects_.push_back(std::move(obj));
    }

    void updateFilteredView()
    {
        filteredObjects_ = sortedObjects_;
        if (modelFilter_)
            filteredObjects_ = modelFilter_->apply(filteredObjects_);
        if (listFilter_)
            filteredObjects_ = listFilter_->apply(filteredObjects_);

        objectIndex_.clear();
        for (size_t row = 0; row < filteredObjects_.size(); ++row)
            objectIndex_.emplace(filteredObjects_[row].get(), row);
    }

    std::vector<ObjectPtr> fullObjects_;
    std::vector<ObjectPtr> sortedObjects_;
    std::vector<ObjectPtr> filteredObjects_;
    std::unordered_map<const T*, size_t> objectIndex_; //find row positions on filteredObjects_ directly

    std::optional<ColumnDefn<T>> sortColumn_;
    bool sortAscending_ = true;

    std::shared_ptr<const ListFilter<T>> modelFilter_;
    std::shared_ptr<const ListFilter<T>> listFilter_;
};


/*  unbounded virtual list: objects are created on demand by a callback, e.g. from a database cursor
    no add/remove/sort/search/filter support => rows never move, so the list keys its state by row      */
template <class T>
class CallbackDataSource : public VirtualDataSource<T>
{
public:
    using typename VirtualDataSource<T>::ObjectPtr;

    explicit CallbackDataSource(const std::function<ObjectPtr(size_t row)>& objectGetter, size_t rowCount = 0) :
        objectGetter_(objectGetter), rowCount_(rowCount) {}

    void setObjectGetter(const std::function<ObjectPtr(size_t row)>& objectGetter) { objectGetter_ = objectGetter; }
    void setObjectCount(size_t rowCount) { rowCount_ = rowCount; }

    ObjectPtr getNthObject(size_t n) const override
    {
        if (n >= rowCount_ || !objectGetter_)
            return nullptr;
        return objectGetter_(n);
    }

    size_t getObjectCount() const override { return rowCount_; }

    bool hasStableIdentity() const override { return false; }

    ptrdiff_t getObjectIndex(const T& obj) const override //finds objects the getter hands out more than once only
    {
        for (size_t row = 0; row < rowCount_; ++row)
            if (const ObjectPtr rowObj = getNthObject(row);
                rowObj.get() == &obj)
                return row;
        return -1;
    }

    ptrdiff_t searchText(const std::wstring& text, size_t first, size_t last, const ColumnDefn<T>& col) const override
    {
        (void)text; (void)first; (void)last; (void)col;
        return -1;
    }

    void sort(const ColumnDefn<T>* col, bool ascending) override { (void)col; (void)ascending; }

    void addObjects   (const std::vector<ObjectPtr>& objects) override { (void)objects; }
    void removeObjects(const std::vector<const T*>& objects) override { (void)objects; }
    void setObjects   (const std::vector<ObjectPtr>& objects) override { (void)objects; }

    void applyFilters(const std::shared_ptr<const ListFilter<T>>& modelFilter,
                      const std::shared_ptr<const ListFilter<T>>& listFilter) override { (void)modelFilter; (void)listFilter; }

    std::vector<ObjectPtr> getFilteredObjects() const override
    {
        std::vector<ObjectPtr> output;
        for (size_t row = 0; row < rowCount_; ++row)
            if (ObjectPtr obj = getNthObject(row))
                output.push_back(std::move(obj));
        return output;
    }

private:
    std::function<ObjectPtr(size_t row)> objectGetter_;
    size_t rowCount_ = 0;
};
}

#endif //DATA_SOURCE_H_1849301726350918237
