// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef BATCHED_UPDATE_H_5520193847561029384
#define BATCHED_UPDATE_H_5520193847561029384

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>


namespace olv
{
//the list operations a BatchedUpdate forwards to
template <class T>
struct BatchTarget
{
    std::function<void(const std::vector<std::shared_ptr<T>>& objects)> setObjects;
    std::function<void(const std::vector<std::shared_ptr<T>>& objects)> addObjects;
    std::function<void(const std::vector<const T*>& objects)> removeObjects;
    std::function<void(const std::vector<const T*>& objects)> refreshObjects;
};

//"List": ObjectListModel<T>, ObjectListView<T>
template <class T, class List>
BatchTarget<T> makeBatchTarget(List& list);


/*  collapse frequent list changes (e.g. from a background scan) into at most one list update per period:
        - the first change after a quiet period is applied immediately
        - later changes within the period are merged into the pending update:
              setObjects() replaces everything pending
              addObjects()/removeObjects() edit the pending object list if there is one, else they are queued
              refreshObjects() is dropped if a new object list is pending
        - tick() (timer, idle event) applies the pending update once the period has elapsed:
              new object list, or else removals, additions and refreshes in this order          */
template <class T>
class BatchedUpdate
{
public:
    using ObjectPtr = std::shared_ptr<T>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    BatchedUpdate(const BatchTarget<T>& target,
                  std::chrono::milliseconds updatePeriod,
                  const Clock& clock = [] { return std::chrono::steady_clock::now(); }) :
        target_(target), updatePeriod_(updatePeriod), clock_(clock) {}

    void setObjects(const std::vector<ObjectPtr>& objects);
    void addObjects(const std::vector<ObjectPtr>& objects);
    void removeObjects(const std::vector<const T*>& objects);
    void refreshObjects(const std::vector<const T*>& objects);

    void tick();

    //apply the pending update regardless of the update period
    void flush();

    bool hasPendingUpdate() const { return newObjects_ || !objectsToRemove_.empty() || !objectsToAdd_.empty() || !objectsToRefresh_.empty(); }

    void setUpdatePeriod(std::chrono::milliseconds updatePeriod) { updatePeriod_ = updatePeriod; }
    std::chrono::milliseconds getUpdatePeriod() const { return updatePeriod_; }

private:
    static bool contains(const std::vector<const T*>& objects, const T* obj) { return std::find(objects.begin(), objects.end(), obj) != objects.end(); }

    const BatchTarget<T> target_;
    std::chrono::milliseconds updatePeriod_;
    const Clock clock_;

    std::optional<std::vector<ObjectPtr>> newObjects_;
    std::vector<const T*>  objectsToRemove_;
    std::vector<ObjectPtr> objectsToAdd_;
    std::vector<const T*>  objectsToRefresh_;

    std::chrono::steady_clock::time_point nextUpdateTime_; //epoch: first update is immediate
};








//######################## implementation ##########################
template <class T, class List> inline
BatchTarget<T> makeBatchTarget(List& list)
{
    return
    {
        [&list](const std::vector<std::shared_ptr<T>>& objects) { list.setObjects(objects); },
        [&list](const std::vector<std::shared_ptr<T>>& objects) { list.addObjects(objects); },
        [&list](const std::vector<const T*>& objects) { list.removeObjects(objects); },
        [&list](const std::vector<const T*>& objects) { list.refreshObjects(objects); },
    };
}


template <class T> inline
void BatchedUpdate<T>::setObjects(const std::vector<ObjectPtr>& objects)
{
    newObjects_ = objects;
    objectsToRemove_ .clear();
    objectsToAdd_    .clear();
    objectsToRefresh_.clear();
    tick();
}


template <class T> inline
void BatchedUpdate<T>::addObjects(const std::vector<ObjectPtr>& objects)
{
    std::vector<ObjectPtr>& pending = newObjects_ ? *newObjects_ : objectsToAdd_;
    pending.insert(pending.end(), objects.begin(), objects.end());
    tick();
}


template <class T> inline
void BatchedUpdate<T>::removeObjects(const std::vector<const T*>& objects)
{
    std::erase_if(objectsToRefresh_, [&](const T* obj) { return contains(objects, obj); });

    if (newObjects_)
        std::erase_if(*newObjects_, [&](const ObjectPtr& obj) { return contains(objects, obj.get()); });
    else
        for (const T* obj : objects)
            if (auto it = std::find_if(objectsToAdd_.begin(), objectsToAdd_.end(), [obj](const ObjectPtr& added) { return added.get() == obj; });
                it != objectsToAdd_.end())
                objectsToAdd_.erase(it); //never reached the list
            else if (!contains(objectsToRemove_, obj))
                objectsToRemove_.push_back(obj);
    tick();
}


template <class T> inline
void BatchedUpdate<T>::refreshObjects(const std::vector<const T*>& objects)
{
    if (newObjects_)
        return; //all rows are shown anew

    for (const T* obj : objects)
        if (!contains(objectsToRefresh_, obj))
            objectsToRefresh_.push_back(obj);
    tick();
}


template <class T> inline
void BatchedUpdate<T>::tick()
{
    if (!hasPendingUpdate())
        return;

    const auto now = clock_();
    if (now < nextUpdateTime_)
        return;

    nextUpdateTime_ = now + updatePeriod_;
    flush();
}


template <class T> inline
void BatchedUpdate<T>::flush()
{
    //move out first: the target may call back into this batch
    std::optional<std::vector<ObjectPtr>> newObjects = std::move(newObjects_);
    std::vector<const T*>  objectsToRemove  = std::move(objectsToRemove_);
    std::vector<ObjectPtr> objectsToAdd     = std::move(objectsToAdd_);
    std::vector<const T*>  objectsToRefresh = std::move(objectsToRefresh_);
    newObjects_.reset();
    objectsToRemove_ .clear();
    objectsToAdd_    .clear();
    objectsToRefresh_.clear();

    if (newObjects)
        target_.setObjects(*newObjects);
    else
    {
        if (!objectsToRemove.empty())
            target_.removeObjects(objectsToRemove);
        if (!objectsToAdd.empty())
            target_.addObjects(objectsToAdd);
        if (!objectsToRefresh.empty())
            target_.refreshObjects(objectsToRefresh);
    }
}
}

#endif //BATCHED_UPDATE_H_5520193847561029384
