// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef OBJECT_LIST_VIEW_H_3301928374650192837
#define OBJECT_LIST_VIEW_H_3301928374650192837

#include <functional>
#include <olv/list_model.h>
#include "list_ctrl.h"


namespace olv
{
//raise the model's notifications as wx events (see olv_event.h); vetoing a "...ING" event cancels the change
template <class T>
void forwardModelEvents(ObjectListModel<T>& model, const std::function<wxEvtHandler&()>& getHandler, wxWindow* eventSource /*optional*/);


/*  list control showing objects of type T:

        auto olv = new ObjectListView<Person>(parent);
        olv->setColumns({ ColumnDefn<Person>(_("Name"), ColumnAlignment::left, 120, L"name"), ... });
        olv->setObjects(persons);

    model notifications arrive as wx events (see olv_event.h); vetoing a "...ING" event cancels the change   */
template <class T>
class ObjectListView : public ListCtrl
{
public:
    using ObjectPtr = std::shared_ptr<T>;

    ObjectListView(wxWindow* parent,
                   wxWindowID id        = wxID_ANY,
                   const wxPoint& pos   = wxDefaultPosition,
                   const wxSize& size   = wxDefaultSize,
                   long style           = wxBORDER_THEME,
                   const wxString& name = L"ObjectListView");
    ~ObjectListView() { setDataProvider(nullptr); } //model_ is gone before ~ListCtrl()

    ObjectListModel<T>&       model()       { return model_; }
    const ObjectListModel<T>& model() const { return model_; }

    //-------------------------- frequently used model operations --------------------------
    void setColumns(const std::vector<ColumnDefn<T>>& columns) { model_.setColumns(columns); }
    void addColumn(const ColumnDefn<T>& col) { model_.addColumn(col); }

    void setObjects(std::vector<ObjectPtr> objects) { model_.setObjects(std::move(objects)); }
    void addObjects(std::vector<ObjectPtr> objects) { model_.addObjects(std::move(objects)); }
    void removeObjects(const std::vector<const T*>& objects) { model_.removeObjects(objects); }
    void refreshObject(const T& obj) { model_.refreshObject(obj); }
    void refreshObjects(const std::vector<const T*>& objects) { model_.refreshObjects(objects); }
    void clearAll() { model_.clearAll(); }
    std::vector<ObjectPtr> getObjects() const { return model_.getObjects(); }
    ObjectPtr getObjectAt(size_t row) const { return model_.getObjectAt(row); }

    void sortBy(std::optional<size_t> col, bool ascending) { model_.sortBy(col, ascending); }

    void selectObject(const T& obj) { model_.selectObject(obj); }
    ObjectPtr getSelectedObject() const { return model_.getSelectedObject(); }
    std::vector<ObjectPtr> getSelectedObjects() const { return model_.getSelectedObjects(); }
    std::vector<ObjectPtr> getCheckedObjects() const { return model_.getCheckedObjects(); }

    void setShowGroups(bool show) { model_.setShowGroups(show); }
    void setEmptyListMsg(const std::wstring& msg) { model_.setEmptyListMsg(msg); refreshAllRows(); }

    std::string saveState() const { return model_.saveColumnState(); }
    void restoreState(const std::string& blob) { model_.restoreColumnState(blob); } //throw ColumnStateError

private:
    ObjectListModel<T> model_;
};








//######################## implementation ##########################
template <class T> inline
ObjectListView<T>::ObjectListView(wxWindow* parent, wxWindowID id, const wxPoint& pos, const wxSize& size, long style, const wxString& name) :
    ListCtrl(parent, id, pos, size, style, name)
{
    forwardModelEvents(model_, [this]() -> wxEvtHandler& { return *GetEventHandler(); }, this);
    setDataProvider(&model_);
}


template <class T> inline
void forwardModelEvents(ObjectListModel<T>& model, const std::function<wxEvtHandler&()>& getHandler, wxWindow* eventSource)
{
    auto raiseEvent = [getHandler, eventSource](wxEvent& event)
    {
        if (eventSource)
        {
            event.SetId(eventSource->GetId());
            event.SetEventObject(eventSource);
        }
        getHandler().ProcessEvent(event);
    };
    //vetoable notification: true if allowed
    auto raiseNotifyEvent = [raiseEvent](wxNotifyEvent& event) { raiseEvent(event); return event.IsAllowed(); };

    ListModelEvents<T>& ev = model.events();

    ev.onItemsAdding = [&model, raiseNotifyEvent](ItemsAddingEvent<T>& e)
    {
        ListObjectsEvent<T> evt(EVENT_OLV_ITEMS_ADDING, model.getObjectCount(), e.objects);
        e.cancelled = !raiseNotifyEvent(evt);
    };
    ev.onItemsRemoving = [&model, raiseNotifyEvent](ItemsRemovingEvent<T>& e)
    {
        ListChangeEvent evt(EVENT_OLV_ITEMS_REMOVING, model.getObjectCount(), e.objects.size());
        e.cancelled = !raiseNotifyEvent(evt);
    };
    ev.onItemsChanging = [raiseNotifyEvent](ItemsChangingEvent<T>& e)
    {
        ListObjectsEvent<T> evt(EVENT_OLV_ITEMS_CHANGING, e.oldObjectCount, e.newObjects);
        e.cancelled = !raiseNotifyEvent(evt);
    };
    ev.onItemsChanged = [raiseEvent](const ItemsChangedEvent& e)
    {
        ListChangeEvent evt(EVENT_OLV_ITEMS_CHANGED, e.oldObjectCount, e.newObjectCount);
        raiseEvent(evt);
    };

    auto toSortColumn = [](const SortingEvent& e) { return e.sortColumn ? static_cast<ptrdiff_t>(*e.sortColumn) : -1; };

    ev.onBeforeSorting = [raiseNotifyEvent, toSortColumn](SortingEvent& e)
    {
        ListSortEvent evt(EVENT_OLV_SORTING, toSortColumn(e), e.ascending);
        e.cancelled = !raiseNotifyEvent(evt);
        e.handled   = evt.handled_;
    };
    ev.onAfterSorting = [raiseEvent, toSortColumn](const SortingEvent& e)
    {
        ListSortEvent evt(EVENT_OLV_SORTED, toSortColumn(e), e.ascending);
        raiseEvent(evt);
    };

    ev.onGroupExpanding = [raiseNotifyEvent](GroupExpansionEvent& e)
    {
        GroupExpandEvent evt(EVENT_OLV_GROUP_EXPANDING, e.groupKeys);
        e.cancelled = !raiseNotifyEvent(evt);
    };
    ev.onGroupCollapsing = [raiseNotifyEvent](GroupExpansionEvent& e)
    {
        GroupExpandEvent evt(EVENT_OLV_GROUP_COLLAPSING, e.groupKeys);
        e.cancelled = !raiseNotifyEvent(evt);
    };

    ev.onSelectionChanged = [raiseEvent](const SelectionChangedEvent& e)
    {
        wxCommandEvent evt(EVENT_OLV_SELECTION_CHANGED);
        evt.SetInt(static_cast<int>(e.selectedCount));
        raiseEvent(evt);
    };
}
}

#endif //OBJECT_LIST_VIEW_H_3301928374650192837
