// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef GROUP_H_4471920365182736450
#define GROUP_H_4471920365182736450

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <vector>
#include "column.h"
#include "sorting.h"


namespace olv
{
template <class T>
struct ListGroup
{
    Value        key;
    std::wstring title;
    std::vector<std::shared_ptr<T>> objects; //in list order
    bool expanded = true;

    //header decoration, shown by renderers that support it
    std::wstring header;
    std::wstring footer;
    std::wstring subtitle;
    std::wstring task;
    std::wstring topDescription;
    std::wstring bottomDescription;
    int  titleImage  = -1;
    bool collapsible = true;
    bool focused  = false;
    bool selected = false;
};


enum class RowKind
{
    object,
    groupHeader,
    blank,
};

//one row of a grouped list
template <class T>
struct InnerRow
{
    RowKind kind = RowKind::object;
    size_t groupIdx = 0; //...into the group list
    std::shared_ptr<T> object; //nullptr unless kind == RowKind::object
};


struct LessGroupKey { bool operator()(const Value& lhs, const Value& rhs) const { return compareValues(lhs, rhs) < 0; } };


/*  partition objects (in list order) by the group key of "groupCol"
    - groups are sorted by key, null key last
    - objects within a group keep their list order
    - expansion state of groups is taken from "isExpanded"                  */
template <class T>
std::vector<ListGroup<T>> buildGroups(const std::vector<std::shared_ptr<T>>& objects, const ColumnDefn<T>& groupCol, bool ascending, bool showItemCounts,
                                      const std::function<bool(const Value& key)>& isExpanded)
{
    std::map<Value, ListGroup<T>, LessGroupKey> groupsByKey;

    for (const std::shared_ptr<T>& obj : objects)
    {
        const Value key = groupCol.getGroupKey(*obj);

        auto [it, inserted] = groupsByKey.try_emplace(key);
        if (inserted)
            it->second.key = key;
        it->second.objects.push_back(obj);
    }

    std::vector<ListGroup<T>> groups;
    for (auto& [key, group] : groupsByKey)
    {
        group.title = groupCol.getGroupTitle(groupCol.getGroupKeyAsString(key), group.objects.size(), showItemCounts);
        group.expanded = isExpanded ? isExpanded(key) : true;
        groups.push_back(std::move(group));
    }

    std::stable_sort(groups.begin(), groups.end(), [ascending](const ListGroup<T>& lhs, const ListGroup<T>& rhs)
    {
        return lessCellValue(lhs.key, rhs.key, ascending);
    });
    return groups;
}


//blank line (optional, not before the first group), group header, then objects of expanded groups
template <class T>
std::vector<InnerRow<T>> buildInnerRows(const std::vector<ListGroup<T>>& groups, bool blankLineBetweenGroups)
{
    std::vector<InnerRow<T>> rows;

    for (size_t groupIdx = 0; groupIdx < groups.size(); ++groupIdx)
    {
        const ListGroup<T>& group = groups[groupIdx];

        if (blankLineBetweenGroups && groupIdx > 0)
            rows.push_back({RowKind::blank, groupIdx, nullptr});

        rows.push_back({RowKind::groupHeader, groupIdx, nullptr});

        if (group.expanded)
            for (const std::shared_ptr<T>& obj : group.objects)
                rows.push_back({RowKind::object, groupIdx, obj});
    }
    return rows;
}
}

#endif //GROUP_H_4471920365182736450
