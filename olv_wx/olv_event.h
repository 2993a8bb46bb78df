// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef OLV_EVENT_H_5019283746501928374
#define OLV_EVENT_H_5019283746501928374

#include <memory>
#include <vector>
#include <wx/event.h>
#include <wx/gdicmn.h>
#include <olv/value.h>


namespace olv
{
class CellEditor;

/*  events sent by ListCtrl/ObjectListView to its own event handler (and propagated to the parent):

        olv.Bind(EVENT_OLV_SORTING, [this](ListSortEvent& event) { if (busy_) event.Veto(); });

    "...ING" events are vetoable: wxNotifyEvent::Veto()

    EVENT_OLV_ITEMS_ADDING/EVENT_OLV_ITEMS_CHANGING also carry the objects, which the handler may replace:

        olv.Bind(EVENT_OLV_ITEMS_ADDING, [](ListChangeEvent& event)
        {
            if (std::vector<std::shared_ptr<Person>>* objects = getEventObjects<Person>(event))
                std::erase_if(*objects, [](const auto& p) { return p->name.empty(); });
        });                                                                                     */

struct ListChangeEvent;
struct ListSortEvent;
struct GroupExpandEvent;
struct CellEditEvent;

wxDECLARE_EVENT(EVENT_OLV_ITEMS_ADDING,    ListChangeEvent);
wxDECLARE_EVENT(EVENT_OLV_ITEMS_REMOVING,  ListChangeEvent);
wxDECLARE_EVENT(EVENT_OLV_ITEMS_CHANGING,  ListChangeEvent);
wxDECLARE_EVENT(EVENT_OLV_ITEMS_CHANGED,   ListChangeEvent);
wxDECLARE_EVENT(EVENT_OLV_SORTING,         ListSortEvent);
wxDECLARE_EVENT(EVENT_OLV_SORTED,          ListSortEvent);
wxDECLARE_EVENT(EVENT_OLV_GROUP_EXPANDING,  GroupExpandEvent);
wxDECLARE_EVENT(EVENT_OLV_GROUP_COLLAPSING, GroupExpandEvent);
wxDECLARE_EVENT(EVENT_OLV_SELECTION_CHANGED, wxCommandEvent);
wxDECLARE_EVENT(EVENT_OLV_CELL_EDIT_STARTING,  CellEditEvent);
wxDECLARE_EVENT(EVENT_OLV_CELL_EDIT_FINISHING, CellEditEvent);


struct ListChangeEvent : public wxNotifyEvent
{
    ListChangeEvent(wxEventType et, size_t oldObjectCount, size_t newObjectCount) :
        wxNotifyEvent(et), oldObjectCount_(oldObjectCount), newObjectCount_(newObjectCount) {}
    ListChangeEvent* Clone() const override { return new ListChangeEvent(*this); }

    const size_t oldObjectCount_;
    const size_t newObjectCount_; //objects being added or removed for ...ADDING/...REMOVING (before the handler ran)
};


template <class T>
struct ListObjectsEvent : public ListChangeEvent
{
    ListObjectsEvent(wxEventType et, size_t oldObjectCount, std::vector<std::shared_ptr<T>>& objects) :
        ListChangeEvent(et, oldObjectCount, objects.size()), objects_(objects) {}
    ListObjectsEvent* Clone() const override { return new ListObjectsEvent(*this); }

    std::vector<std::shared_ptr<T>>& objects_; //the list applies whatever the handler leaves here
};


//nullptr if the event was not raised for objects of type T
template <class T> inline
std::vector<std::shared_ptr<T>>* getEventObjects(ListChangeEvent& event)
{
    auto objectsEvent = dynamic_cast<ListObjectsEvent<T>*>(&event);
    return objectsEvent ? &objectsEvent->objects_ : nullptr;
}


struct ListSortEvent : public wxNotifyEvent
{
    ListSortEvent(wxEventType et, ptrdiff_t sortColumn, bool ascending) :
        wxNotifyEvent(et), sortColumn_(sortColumn), ascending_(ascending) {}
    ListSortEvent* Clone() const override { return new ListSortEvent(*this); }

    const ptrdiff_t sortColumn_; //-1: unsorted
    const bool ascending_;
    bool handled_ = false; //EVENT_OLV_SORTING: set if the handler has sorted the objects itself
};


struct GroupExpandEvent : public wxNotifyEvent
{
    GroupExpandEvent(wxEventType et, const std::vector<Value>& groupKeys) :
        wxNotifyEvent(et), groupKeys_(groupKeys) {}
    GroupExpandEvent* Clone() const override { return new GroupExpandEvent(*this); }

    const std::vector<Value> groupKeys_;
};


struct CellEditEvent : public wxNotifyEvent
{
    CellEditEvent(wxEventType et, size_t row, size_t viewCol, const Value& cellValue, const wxRect& cellBounds, CellEditor* editor) :
        wxNotifyEvent(et), row_(row), viewCol_(viewCol), cellValue_(cellValue), cellBounds_(cellBounds), editor_(editor) {}
    CellEditEvent* Clone() const override { return new CellEditEvent(*this); }

    const size_t row_;
    const size_t viewCol_;

    Value  cellValue_;  //STARTING: initial editor value; FINISHING: value to be written (may be changed by the handler)
    wxRect cellBounds_; //STARTING: may be changed by the handler

    CellEditor* editor_; //owned by the list control
    CellEditor* newEditor_ = nullptr; //STARTING: replacement editor, ownership passes to the list control
    bool shouldConfigureEditor_ = true; //STARTING: false if the handler has positioned and initialized the editor
    bool userCancelled_ = false;        //FINISHING
};
}

#endif //OLV_EVENT_H_5019283746501928374
