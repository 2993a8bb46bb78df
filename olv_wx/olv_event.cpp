// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "olv_event.h"


namespace olv
{
wxDEFINE_EVENT(EVENT_OLV_ITEMS_ADDING,    ListChangeEvent);
wxDEFINE_EVENT(EVENT_OLV_ITEMS_REMOVING,  ListChangeEvent);
wxDEFINE_EVENT(EVENT_OLV_ITEMS_CHANGING,  ListChangeEvent);
wxDEFINE_EVENT(EVENT_OLV_ITEMS_CHANGED,   ListChangeEvent);
wxDEFINE_EVENT(EVENT_OLV_SORTING,         ListSortEvent);
wxDEFINE_EVENT(EVENT_OLV_SORTED,          ListSortEvent);
wxDEFINE_EVENT(EVENT_OLV_GROUP_EXPANDING,  GroupExpandEvent);
wxDEFINE_EVENT(EVENT_OLV_GROUP_COLLAPSING, GroupExpandEvent);
wxDEFINE_EVENT(EVENT_OLV_SELECTION_CHANGED, wxCommandEvent);
wxDEFINE_EVENT(EVENT_OLV_CELL_EDIT_STARTING,  CellEditEvent);
wxDEFINE_EVENT(EVENT_OLV_CELL_EDIT_FINISHING, CellEditEvent);
}
