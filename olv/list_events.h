// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef LIST_EVENTS_H_6102938475610293847
#define LIST_EVENTS_H_6102938475610293847

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "value.h"


namespace olv
{
//notifications raised by ObjectListModel<T>; "cancelled = true" vetoes the change where supported

template <class T>
struct ItemsAddingEvent
{
    std::vector<std::shared_ptr<T>> objects; //may be modified by the handler
    bool cancelled = false;
};

template <class T>
struct ItemsRemovingEvent
{
    std::vector<const T*> objects;
    bool cancelled = false;
};

template <class T>
struct ItemsChangingEvent
{
    size_t oldObjectCount = 0;
    std::vector<std::shared_ptr<T>> newObjects; //may be modified by the handler
    bool cancelled = false;
};

struct ItemsChangedEvent
{
    size_t oldObjectCount = 0;
    size_t newObjectCount = 0;
};

struct SortingEvent
{
    std::optional<size_t> sortColumn; //none: unsorted
    bool ascending = true;
    bool cancelled = false;
    bool handled   = false; //BeforeSorting only: the handler has sorted the objects itself
};

struct GroupExpansionEvent
{
    std::vector<Value> groupKeys; //groups about to be expanded or collapsed
    bool isExpand = true;
    bool cancelled = false;
};

struct SelectionChangedEvent
{
    size_t selectedCount = 0;
};


template <class T>
struct ListModelEvents
{
    std::function<void(ItemsAddingEvent<T>&        )> onItemsAdding;
    std::function<void(ItemsRemovingEvent<T>&      )> onItemsRemoving;
    std::function<void(ItemsChangingEvent<T>&      )> onItemsChanging;
    std::function<void(const ItemsChangedEvent&    )> onItemsChanged;
    std::function<void(SortingEvent&               )> onBeforeSorting;
    std::function<void(const SortingEvent&         )> onAfterSorting;
    std::function<void(GroupExpansionEvent&        )> onGroupExpanding;
    std::function<void(GroupExpansionEvent&        )> onGroupCollapsing;
    std::function<void(const SelectionChangedEvent&)> onSelectionChanged;
};
}

#endif //LIST_EVENTS_H_6102938475610293847
