// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef LIST_MODEL_H_3918274650192837465
#define LIST_MODEL_H_3918274650192837465

#include <algorithm>
#include <memory>
#include <numeric>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "cell_edit.h"
#include "column_state.h"
#include "data_source.h"
#include "group.h"
#include "list_data.h"
#include "list_events.h"
#include "typing_search.h"


namespace olv
{
const int CHECK_COLUMN_WIDTH = 24;


/*  view model behind an ObjectListView: columns, objects, sorting, grouping, selection and check state

        rows shown by the list:
            ungrouped:  rows of the data source (sorted + filtered)
            grouped:    innerRows_ = group header, [objects of expanded group], blank line, ...

    Selection and check state are bound to the model objects, not to rows: they survive sorting, filtering and grouping.
    Exception: a data source without stable object identity (CallbackDataSource) creates its objects on demand, so state is bound
    to its rows instead; such a list is never grouped.                                                                         */
template <class T>
class ObjectListModel : public ListDataProvider
{
public:
    using ObjectPtr = std::shared_ptr<T>;

    explicit ObjectListModel(std::unique_ptr<VirtualDataSource<T>> dataSource = std::make_unique<FastDataSource<T>>()) :
        dataSource_(std::move(dataSource)) {}

    ListModelEvents<T>& events() { return events_; }

    void setDataSource(std::unique_ptr<VirtualDataSource<T>> dataSource);
    VirtualDataSource<T>& getDataSource() { return *dataSource_; }

    //------------------------------ columns ------------------------------
    void setColumns(const std::vector<ColumnDefn<T>>& columns);
    void addColumn(const ColumnDefn<T>& col);
    void insertColumn(size_t pos, const ColumnDefn<T>& col);

    size_t getColumnCount() const { return columns_.size(); }
    const ColumnDefn<T>& getColumn(size_t col) const { return columns_[col]; }
    void setColumn(size_t col, const ColumnDefn<T>& defn);

    void setColumnWidth     (size_t col, int width); //bounded by minimum/maximum width
    void setColumnFixedWidth(size_t col, int width);
    void setColumnVisible   (size_t col, bool visible);
    std::vector<size_t> getVisibleColumns() const { return visibleColumns_; }

    std::vector<size_t> getColumnDisplayOrder() const { return displayOrder_; }
    void setColumnDisplayOrder(const std::vector<size_t>& order); //ignored unless a permutation of all columns

    std::string saveColumnState() const;
    void restoreColumnState(const std::string& blob); //throw ColumnStateError

    //------------------------------ objects ------------------------------
    void setObjects(std::vector<ObjectPtr> objects);
    void addObjects(std::vector<ObjectPtr> objects);
    void addObject(const ObjectPtr& obj) { addObjects({obj}); }
    void removeObjects(const std::vector<const T*>& objects);
    void removeObject(const T& obj) { removeObjects({&obj}); }
    void clearAll() { setObjects({}); }

    std::vector<ObjectPtr> getObjects() const { return dataSource_->getFilteredObjects(); } //list order
    size_t getObjectCount() const { return dataSource_->getObjectCount(); } //excluding group headers

    ObjectPtr getObjectAt(size_t row) const; //nullptr for group headers, blank lines and invalid rows
    ptrdiff_t getIndexOf(const T& obj) const; //-1 if not shown, e.g. member of a collapsed group

    void refreshObject (const T& obj);
    void refreshObjects(const std::vector<const T*>& objects);
    void repopulateList(); //after external changes of the data source

    //------------------------------ sorting ------------------------------
    void sortBy(std::optional<size_t> col /*none: unsorted*/, bool ascending);
    void unsort() { sortBy(std::nullopt, true); }
    std::optional<size_t> getSortColumn() const { return sortColumn_; }
    bool isSortAscending() const { return sortAscending_; }

    //------------------------------ selection ----------------------------
    void selectObject (const T& obj, bool deselectOthers = true) { selectObjects({&obj}, deselectOthers); }
    void selectObjects(const std::vector<const T*>& objects, bool deselectOthers = true);
    void selectAll();
    void deselectAll();
    ObjectPtr getSelectedObject() const; //nullptr unless exactly one object is selected
    std::vector<ObjectPtr> getSelectedObjects() const; //list order
    bool isObjectSelected(const T& obj) const;

    //------------------------------ check state --------------------------
    void installCheckStateColumn(std::optional<size_t> col); //column without checkStateGetter: use internal check state
    void createCheckStateColumn(size_t pos = 0);             //insert a new check box column at "pos"
    std::optional<size_t> getCheckStateColumn() const { return checkColumn_; }

    void check      (T& obj) { setCheckState(obj, true); }
    void uncheck    (T& obj) { setCheckState(obj, false); }
    void toggleCheck(T& obj) { setCheckState(obj, !isChecked(obj)); }
    bool isChecked  (const T& obj) const;
    std::vector<ObjectPtr> getCheckedObjects() const; //list order
    void setCheckedObjects(const std::vector<const T*>& objects); //all other objects are unchecked

    //------------------------------ grouping -----------------------------
    void setShowGroups(bool show);
    bool getShowGroups() const { return showGroups_; }
    void setAlwaysGroupByColumn(std::optional<size_t> col);
    void setShowItemCounts(bool show);
    void setPutBlankLineBetweenGroups(bool blankLine);
    void setGroupFormatter(const std::function<void(ListGroup<T>& group)>& formatter); //e.g. set header, footer, subtitle

    bool isGrouped() const { return showGroups_ && getGroupColumn() && !isRowBound(); }
    const std::vector<ListGroup<T>>& getGroups() const { return groups_; }

    void expand         (const Value& groupKey) { setGroupsExpanded({groupKey}, true); }
    void collapse       (const Value& groupKey) { setGroupsExpanded({groupKey}, false); }
    void toggleExpansion(const Value& groupKey) { setGroupsExpanded({groupKey}, !isGroupKeyExpanded(groupKey)); }
    void expandAll  ();
    void collapseAll();
    bool isGroupKeyExpanded(const Value& groupKey) const;

    //------------------------------ appearance ---------------------------
    void setEmptyListMsg(const std::wstring& msg) { emptyListMsg_ = msg; }
    void setUseAlternateBackColours(bool use) { useAlternateBackColours_ = use; refreshAll(); }
    void setEvenRowsBackColour(const RgbColour& col) { evenRowsBackColour_ = col; refreshAll(); }
    void setOddRowsBackColour (const RgbColour& col) { oddRowsBackColour_  = col; refreshAll(); }
    void setRowFormatter(const std::function<void(RowFormat& fmt, const T& obj)>& formatter) { rowFormatter_ = formatter; refreshAll(); }
    //"col": column index; called for rows whose RowFormat::useCellFormat is set, starting from the row format
    void setCellFormatter(const std::function<void(CellFormat& fmt, const T& obj, size_t col)>& formatter) { cellFormatter_ = formatter; refreshAll(); }
    void setIncludeColumnTitlesInCopy(bool include) { includeColumnTitlesInCopy_ = include; }

    //------------------------------ filters ------------------------------
    void setModelFilter(const std::shared_ptr<const ListFilter<T>>& filter) { modelFilter_ = filter; applyFilters(); }
    void setListFilter (const std::shared_ptr<const ListFilter<T>>& filter) { listFilter_  = filter; applyFilters(); }
    std::shared_ptr<const ListFilter<T>> getModelFilter() const { return modelFilter_; }
    std::shared_ptr<const ListFilter<T>> getListFilter () const { return listFilter_; }

    //------------------------------ ListDataProvider ---------------------
    size_t  getRowCount() const override { return isGrouped() ? innerRows_.size() : dataSource_->getObjectCount(); }
    RowKind getRowKind(size_t row) const override;
    std::wstring getCellText (size_t row, size_t viewCol) const override;
    int          getCellImage(size_t row, size_t viewCol) const override;
    std::optional<bool> getCheckState(size_t row) const override;
    RowFormat    getRowFormat(size_t row) const override;
    std::optional<CellFormat> getCellFormat(size_t row, size_t viewCol) const override;
    bool         isGroupExpanded(size_t row) const override;
    void         prepareCache(size_t rowFirst, size_t rowLast) override;

    size_t getViewColumnCount() const override { return visibleColumns_.size(); }
    ViewColumnInfo getViewColumnInfo(size_t viewCol) const override;
    std::optional<size_t> getCheckViewColumn() const override { return checkColumn_ ? toViewColumn(*checkColumn_) : std::nullopt; }
    std::optional<std::pair<size_t, bool>> getSortIndicator() const override;
    std::vector<size_t> getViewColumnOrder() const override;

    void handleColumnClick(size_t viewCol) override;
    void setViewColumnWidth(size_t viewCol, int width) override;
    void handleCheckClick(size_t row) override;
    void toggleGroupExpansion(size_t row) override;
    void setGroupExpanded(size_t row, bool expand) override;
    ptrdiff_t findRowByPrefix(const std::wstring& prefix, ptrdiff_t focusedRow) const override;

    std::vector<size_t> getSelectedRows() const override;
    void setSelectedRows(const std::vector<size_t>& rows) override;
    void selectAllRows() override { selectAll(); }

    bool       isCellEditable(size_t row, size_t viewCol) const override;
    Value      getCellValue  (size_t row, size_t viewCol) const override;
    bool       setCellValue  (size_t row, size_t viewCol, const Value& v) override;
    EditorKind getEditorKind (size_t row, size_t viewCol) const override;

    std::wstring getEmptyListMsg() const override { return emptyListMsg_; }
    ClipboardContent copySelection() const override;

private:
    ObjectListModel           (const ObjectListModel&) = delete;
    ObjectListModel& operator=(const ObjectListModel&) = delete;

    std::optional<size_t> getGroupColumn() const { return alwaysGroupByColumn_ ? alwaysGroupByColumn_ : sortColumn_; }

    bool isRowBound() const { return !dataSource_->hasStableIdentity(); } //selection and check state keyed by row
    bool hasRowCheckState() const { return isRowBound() && internalCheckState_; }
    size_t getSelectionCount() const { return isRowBound() ? selectedRows_.size() : selected_.size(); }

    void setCheckState(T& obj, bool checked);
    void setRowCheckState(size_t row, bool checked);
    void setGroupsExpanded(const std::vector<Value>& groupKeys, bool expand);
    const ListGroup<T>* getGroupAtRow(size_t row) const;
    bool canUseBinarySearch(size_t col) const;

    void updateVisibleColumns();
    std::optional<size_t> toViewColumn(size_t col) const;
    void resortDataSource();
    void applyFilters();
    void rebuildRows();
    void pruneObjectState(const std::unordered_set<const T*>& liveObjects); //selection + check state of objects no longer listed
    void pruneRowState(); //selection + check state of rows beyond the end of a row-bound list
    void changeSelection   (std::unordered_set<const T*>&& newSelection, bool notifyView);
    void changeRowSelection(std::set<size_t>&&             newSelection, bool notifyView);
    void notifySelectionChanged(bool notifyView);
    void raiseItemsChanged(size_t oldObjectCount);

    void refreshAll() { if (ListViewNotify* view = getView()) view->onRowsRefreshed(0, getRowCount()); }
    void notifyRowsReset   () { if (ListViewNotify* view = getView()) view->onRowsReset(); }
    void notifyColumnsReset() { if (ListViewNotify* view = getView()) view->onColumnsReset(); }

    std::unique_ptr<VirtualDataSource<T>> dataSource_;
    ListModelEvents<T> events_;

    std::vector<ColumnDefn<T>> columns_;
    std::vector<size_t> visibleColumns_; //view column => column index
    std::vector<size_t> displayOrder_;   //column indexes from left to right

    std::optional<size_t> sortColumn_;
    bool sortAscending_ = true;

    std::unordered_set<const T*> selected_;
    std::set<size_t> selectedRows_; //row-bound lists

    std::optional<size_t> checkColumn_;
    bool internalCheckState_ = false; //check column installed by installCheckStateColumn()
    std::unordered_map<const T*, bool> checkStateMap_; //default check state implementation
    std::set<size_t> checkedRows_;                     //same for row-bound lists

    bool showGroups_ = false;
    std::optional<size_t> alwaysGroupByColumn_;
    bool showItemCounts_ = true;
    bool putBlankLineBetweenGroups_ = true;
    std::function<void(ListGroup<T>& group)> groupFormatter_;
    std::vector<Value> collapsedGroupKeys_;
    std::vector<ListGroup<T>> groups_;
    std::vector<InnerRow<T>> innerRows_;
    std::unordered_map<const T*, size_t> groupedRowIndex_; //find row positions on innerRows_ directly

    std::wstring emptyListMsg_ = _("This list is empty");
    bool useAlternateBackColours_ = true;
    RgbColour evenRowsBackColour_{240, 248, 255};
    RgbColour oddRowsBackColour_ {255, 250, 205};
    std::function<void(RowFormat& fmt, const T& obj)> rowFormatter_;
    std::function<void(CellFormat& fmt, const T& obj, size_t col)> cellFormatter_;
    bool includeColumnTitlesInCopy_ = false;

    std::shared_ptr<const ListFilter<T>> modelFilter_;
    std::shared_ptr<const ListFilter<T>> listFilter_;

    //the list control asks for the same row once per column:
    mutable std::optional<size_t> cachedRow_;
    mutable ObjectPtr cachedObject_;
};








//######################## implementation ##########################
template <class T> inline
void ObjectListModel<T>::setDataSource(std::unique_ptr<VirtualDataSource<T>> dataSource)
{
    dataSource_ = std::move(dataSource);
    dataSource_->applyFilters(modelFilter_, listFilter_);
    resortDataSource();

    //rows of the old data source mean nothing for the new one
    checkedRows_.clear();
    changeRowSelection({}, false /*notifyView*/);

    rebuildRows();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::updateVisibleColumns()
{
    visibleColumns_.clear();
    for (size_t col = 0; col < columns_.size(); ++col)
        if (columns_[col].isVisible)
            visibleColumns_.push_back(col);
}


template <class T> inline
std::optional<size_t> ObjectListModel<T>::toViewColumn(size_t col) const
{
    auto it = std::find(visibleColumns_.begin(), visibleColumns_.end(), col);
    if (it == visibleColumns_.end())
        return std::nullopt;
    return it - visibleColumns_.begin();
}


template <class T> inline
void ObjectListModel<T>::setColumns(const std::vector<ColumnDefn<T>>& columns)
{
    columns_ = columns;
    displayOrder_.resize(columns_.size());
    std::iota(displayOrder_.begin(), displayOrder_.end(), 0);

    if (sortColumn_ && *sortColumn_ >= columns_.size())
        sortColumn_.reset();
    if (alwaysGroupByColumn_ && *alwaysGroupByColumn_ >= columns_.size())
        alwaysGroupByColumn_.reset();

    checkColumn_.reset();
    internalCheckState_ = false;
    for (size_t col = 0; col < columns_.size(); ++col)
        if (columns_[col].hasCheckState())
        {
            checkColumn_ = col;
            break;
        }

    updateVisibleColumns();
    resortDataSource();
    rebuildRows();
    notifyColumnsReset();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::addColumn(const ColumnDefn<T>& col)
{
    insertColumn(columns_.size(), col);
}


template <class T> inline
void ObjectListModel<T>::insertColumn(size_t pos, const ColumnDefn<T>& col)
{
    pos = std::min(pos, columns_.size());

    auto shiftIndex = [pos](std::optional<size_t>& idx) { if (idx && *idx >= pos) ++*idx; };
    shiftIndex(sortColumn_);
    shiftIndex(checkColumn_);
    shiftIndex(alwaysGroupByColumn_);

    for (size_t& idx : displayOrder_)
        if (idx >= pos)
            ++idx;
    displayOrder_.insert(displayOrder_.begin() + std::min(pos, displayOrder_.size()), pos);

    columns_.insert(columns_.begin() + pos, col);
    if (col.hasCheckState())
    {
        checkColumn_ = pos;
        internalCheckState_ = false;
    }

    updateVisibleColumns();
    notifyColumnsReset();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::setColumn(size_t col, const ColumnDefn<T>& defn)
{
    columns_[col] = defn;
    if (defn.hasCheckState() || checkColumn_ == col)
    {
        if (defn.hasCheckState())
            checkColumn_ = col;
        internalCheckState_ = false;
    }

    updateVisibleColumns();
    if (sortColumn_ == col)
        resortDataSource();
    rebuildRows();
    notifyColumnsReset();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::setColumnWidth(size_t col, int width)
{
    columns_[col].width = columns_[col].calcBoundedWidth(width);
    notifyColumnsReset();
}


template <class T> inline
void ObjectListModel<T>::setColumnFixedWidth(size_t col, int width)
{
    columns_[col].setFixedWidth(width);
    notifyColumnsReset();
}


template <class T> inline
void ObjectListModel<T>::setColumnVisible(size_t col, bool visible)
{
    columns_[col].isVisible = visible;
    updateVisibleColumns();
    notifyColumnsReset();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::setColumnDisplayOrder(const std::vector<size_t>& order)
{
    std::vector<size_t> sorted = order;
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 0; i < sorted.size(); ++i)
        if (sorted[i] != i)
            return;
    if (sorted.size() != columns_.size())
        return;

    displayOrder_ = order;
    notifyColumnsReset();
}


template <class T> inline
std::vector<size_t> ObjectListModel<T>::getViewColumnOrder() const
{
    std::vector<size_t> viewOrder;
    for (const size_t col : displayOrder_)
        if (const std::optional<size_t> viewCol = toViewColumn(col))
            viewOrder.push_back(*viewCol);
    return viewOrder;
}


template <class T> inline
std::string ObjectListModel<T>::saveColumnState() const
{
    ColumnState state;
    for (const ColumnDefn<T>& col : columns_)
        state.columns.push_back({col.width, col.isVisible});
    state.displayOrder  = displayOrder_;
    state.sortColumn    = sortColumn_;
    state.sortAscending = sortAscending_;

    return serializeColumnState(state);
}


template <class T> inline
void ObjectListModel<T>::restoreColumnState(const std::string& blob) //throw ColumnStateError
{
    const ColumnState state = deserializeColumnState(blob); //throw ColumnStateError

    if (state.columns.size() != columns_.size())
        throw ColumnStateError(_("Cannot restore the column layout."),
                               replaceCpy(replaceCpy(_("Expected %x columns, but found %y."), L"%x", std::to_wstring(columns_.size())),
                                          L"%y", std::to_wstring(state.columns.size())));

    for (size_t col = 0; col < columns_.size(); ++col)
    {
        columns_[col].width     = columns_[col].calcBoundedWidth(state.columns[col].width);
        columns_[col].isVisible = state.columns[col].visible;
    }
    displayOrder_ = state.displayOrder;

    updateVisibleColumns();
    notifyColumnsReset();

    sortBy(state.sortColumn, state.sortAscending);
}


template <class T> inline
void ObjectListModel<T>::resortDataSource()
{
    dataSource_->sort(sortColumn_ ? &columns_[*sortColumn_] : nullptr, sortAscending_);
}


template <class T> inline
void ObjectListModel<T>::rebuildRows()
{
    cachedRow_.reset();
    cachedObject_.reset();

    groups_          .clear();
    innerRows_       .clear();
    groupedRowIndex_ .clear();

    if (isGrouped())
    {
        const std::optional<size_t> groupCol = getGroupColumn();
        groups_ = buildGroups<T>(dataSource_->getFilteredObjects(), columns_[*groupCol], sortAscending_, showItemCounts_,
                                 [this](const Value& key) { return isGroupKeyExpanded(key); });
        if (groupFormatter_)
            for (ListGroup<T>& group : groups_)
                groupFormatter_(group);

        innerRows_ = buildInnerRows(groups_, putBlankLineBetweenGroups_);

        //forget groups that are gone
        std::erase_if(collapsedGroupKeys_, [&](const Value& key)
        {
            return std::none_of(groups_.begin(), groups_.end(), [&](const ListGroup<T>& group) { return compareValues(group.key, key) == 0; });
        });

        for (size_t row = 0; row < innerRows_.size(); ++row)
            if (innerRows_[row].object)
                groupedRowIndex_.emplace(innerRows_[row].object.get(), row);
    }
}


template <class T> inline
void ObjectListModel<T>::pruneObjectState(const std::unordered_set<const T*>& liveObjects)
{
    std::erase_if(checkStateMap_, [&](const auto& item) { return !liveObjects.contains(item.first); });

    std::unordered_set<const T*> newSelection = selected_;
    std::erase_if(newSelection, [&](const T* obj) { return !liveObjects.contains(obj); });
    changeSelection(std::move(newSelection), false /*notifyView*/); //rows are reset anyway
}


template <class T> inline
void ObjectListModel<T>::pruneRowState()
{
    const size_t rowCount = getRowCount();

    std::erase_if(checkedRows_, [rowCount](size_t row) { return row >= rowCount; });

    std::set<size_t> newSelection = selectedRows_;
    std::erase_if(newSelection, [rowCount](size_t row) { return row >= rowCount; });
    changeRowSelection(std::move(newSelection), false /*notifyView*/);
}


template <class T> inline
void ObjectListModel<T>::changeSelection(std::unordered_set<const T*>&& newSelection, bool notifyView)
{
    if (newSelection == selected_)
        return;

    selected_ = std::move(newSelection);
    notifySelectionChanged(notifyView);
}


template <class T> inline
void ObjectListModel<T>::changeRowSelection(std::set<size_t>&& newSelection, bool notifyView)
{
    if (newSelection == selectedRows_)
        return;

    selectedRows_ = std::move(newSelection);
    notifySelectionChanged(notifyView);
}


template <class T> inline
void ObjectListModel<T>::notifySelectionChanged(bool notifyView)
{
    if (notifyView)
        if (ListViewNotify* view = getView())
            view->onSelectionChanged();

    if (events_.onSelectionChanged)
        events_.onSelectionChanged({getSelectionCount()});
}


template <class T> inline
void ObjectListModel<T>::raiseItemsChanged(size_t oldObjectCount)
{
    if (events_.onItemsChanged)
        events_.onItemsChanged({oldObjectCount, getObjectCount()});
}


template <class T> inline
void ObjectListModel<T>::setObjects(std::vector<ObjectPtr> objects)
{
    const size_t oldObjectCount = getObjectCount();

    ItemsChangingEvent<T> changing{oldObjectCount, std::move(objects)};
    if (events_.onItemsChanging)
        events_.onItemsChanging(changing);
    if (changing.cancelled)
        return;

    dataSource_->setObjects(changing.newObjects); //keeps current sort and filters

    if (isRowBound())
        pruneRowState();
    else
    {
        std::unordered_set<const T*> liveObjects;
        for (const ObjectPtr& obj : dataSource_->getFilteredObjects())
            liveObjects.insert(obj.get());
        pruneObjectState(liveObjects);
    }

    rebuildRows();
    notifyRowsReset();
    raiseItemsChanged(oldObjectCount);
}


template <class T> inline
void ObjectListModel<T>::addObjects(std::vector<ObjectPtr> objects)
{
    ItemsAddingEvent<T> adding{std::move(objects)};
    if (events_.onItemsAdding)
        events_.onItemsAdding(adding);
    if (adding.cancelled)
        return;

    const size_t oldObjectCount = getObjectCount();
    dataSource_->addObjects(adding.objects);

    rebuildRows();
    notifyRowsReset();
    raiseItemsChanged(oldObjectCount);
}


template <class T> inline
void ObjectListModel<T>::removeObjects(const std::vector<const T*>& objects)
{
    ItemsRemovingEvent<T> removing{objects};
    if (events_.onItemsRemoving)
        events_.onItemsRemoving(removing);
    if (removing.cancelled)
        return;

    const size_t oldObjectCount = getObjectCount();
    dataSource_->removeObjects(removing.objects);

    const std::unordered_set<const T*> removed(removing.objects.begin(), removing.objects.end());
    std::erase_if(checkStateMap_, [&](const auto& item) { return removed.contains(item.first); });

    std::unordered_set<const T*> newSelection = selected_;
    std::erase_if(newSelection, [&](const T* obj) { return removed.contains(obj); });
    changeSelection(std::move(newSelection), false /*notifyView*/);

    if (isRowBound())
        pruneRowState();

    rebuildRows();
    notifyRowsReset();
    raiseItemsChanged(oldObjectCount);
}


template <class T> inline
typename ObjectListModel<T>::ObjectPtr ObjectListModel<T>::getObjectAt(size_t row) const
{
    if (cachedRow_ && *cachedRow_ == row)
        return cachedObject_;

    ObjectPtr obj;
    if (isGrouped())
    {
        if (row < innerRows_.size())
            obj = innerRows_[row].object;
    }
    else
        obj = dataSource_->getNthObject(row);

    cachedRow_    = row;
    cachedObject_ = obj;
    return obj;
}


template <class T> inline
ptrdiff_t ObjectListModel<T>::getIndexOf(const T& obj) const
{
    if (isGrouped())
    {
        auto it = groupedRowIndex_.find(&obj);
        return it != groupedRowIndex_.end() ? static_cast<ptrdiff_t>(it->second) : -1;
    }
    return dataSource_->getObjectIndex(obj);
}


template <class T> inline
void ObjectListModel<T>::refreshObject(const T& obj)
{
    cachedRow_.reset();
    cachedObject_.reset();

    if (const ptrdiff_t row = getIndexOf(obj);
        row >= 0)
        if (ListViewNotify* view = getView())
            view->onRowsRefreshed(row, row + 1);
}


template <class T> inline
void ObjectListModel<T>::refreshObjects(const std::vector<const T*>& objects)
{
    for (const T* obj : objects)
        refreshObject(*obj);
}


template <class T> inline
void ObjectListModel<T>::repopulateList()
{
    if (isRowBound())
        pruneRowState(); //row count may have changed

    rebuildRows();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::sortBy(std::optional<size_t> col, bool ascending)
{
    if (col && *col >= columns_.size())
        return;

    SortingEvent sorting{col, ascending};
    if (events_.onBeforeSorting)
        events_.onBeforeSorting(sorting);
    if (sorting.cancelled)
        return;

    sortColumn_    = col;
    sortAscending_ = ascending;

    if (!sorting.handled)
        resortDataSource();

    rebuildRows();
    notifyRowsReset();
    if (ListViewNotify* view = getView())
    {
        view->onSortIndicatorChanged();
        view->onSelectionChanged(); //same objects, new rows
    }

    if (events_.onAfterSorting)
        events_.onAfterSorting(sorting);
}


template <class T> inline
void ObjectListModel<T>::handleColumnClick(size_t viewCol)
{
    if (viewCol >= visibleColumns_.size())
        return;
    const size_t col = visibleColumns_[viewCol];

    if (sortColumn_ == col)
        sortBy(col, !sortAscending_);
    else
        sortBy(col, true);
}


template <class T> inline
std::optional<std::pair<size_t, bool>> ObjectListModel<T>::getSortIndicator() const
{
    if (sortColumn_)
        if (const std::optional<size_t> viewCol = toViewColumn(*sortColumn_))
            return std::pair(*viewCol, sortAscending_);
    return std::nullopt;
}


template <class T> inline
bool ObjectListModel<T>::isObjectSelected(const T& obj) const
{
    if (isRowBound())
    {
        const ptrdiff_t row = getIndexOf(obj);
        return row >= 0 && selectedRows_.contains(row);
    }
    return selected_.contains(&obj);
}


template <class T> inline
void ObjectListModel<T>::selectObjects(const std::vector<const T*>& objects, bool deselectOthers)
{
    if (isRowBound())
    {
        std::set<size_t> newSelection;
        if (!deselectOthers)
            newSelection = selectedRows_;

        for (const T* obj : objects)
            if (obj)
                if (const ptrdiff_t row = getIndexOf(*obj);
                    row >= 0)
                    newSelection.insert(row);

        changeRowSelection(std::move(newSelection), true /*notifyView*/);
        return;
    }

    std::unordered_set<const T*> newSelection;
    if (!deselectOthers)
        newSelection = selected_;

    for (const T* obj : objects)
        if (obj && getIndexOf(*obj) >= 0)
            newSelection.insert(obj);

    changeSelection(std::move(newSelection), true /*notifyView*/);
}


template <class T> inline
void ObjectListModel<T>::selectAll()
{
    if (isRowBound())
    {
        std::set<size_t> newSelection;
        for (size_t row = 0; row < getRowCount(); ++row)
            newSelection.insert(newSelection.end(), row);

        changeRowSelection(std::move(newSelection), true /*notifyView*/);
        return;
    }

    std::unordered_set<const T*> newSelection;
    for (size_t row = 0; row < getRowCount(); ++row)
        if (const ObjectPtr obj = getObjectAt(row))
            newSelection.insert(obj.get());

    changeSelection(std::move(newSelection), true /*notifyView*/);
}


template <class T> inline
void ObjectListModel<T>::deselectAll()
{
    if (isRowBound())
        changeRowSelection({}, true /*notifyView*/);
    else
        changeSelection({}, true /*notifyView*/);
}


template <class T> inline
std::vector<typename ObjectListModel<T>::ObjectPtr> ObjectListModel<T>::getSelectedObjects() const
{
    std::vector<ObjectPtr> output;
    if (isRowBound())
    {
        for (const size_t row : selectedRows_) //ordered
            if (ObjectPtr obj = getObjectAt(row))
                output.push_back(std::move(obj));
    }
    else if (!selected_.empty())
        for (const ObjectPtr& obj : dataSource_->getFilteredObjects())
            if (selected_.contains(obj.get()))
                output.push_back(obj);
    return output;
}


template <class T> inline
typename ObjectListModel<T>::ObjectPtr ObjectListModel<T>::getSelectedObject() const
{
    if (getSelectionCount() != 1)
        return nullptr;

    std::vector<ObjectPtr> selection = getSelectedObjects();
    return selection.size() == 1 ? selection[0] : nullptr;
}


template <class T> inline
std::vector<size_t> ObjectListModel<T>::getSelectedRows() const
{
    if (isRowBound())
        return std::vector<size_t>(selectedRows_.begin(), selectedRows_.end());

    std::vector<size_t> rows;
    for (const T* obj : selected_)
        if (const ptrdiff_t row = getIndexOf(*obj);
            row >= 0)
            rows.push_back(row);

    std::sort(rows.begin(), rows.end());
    return rows;
}


template <class T> inline
void ObjectListModel<T>::setSelectedRows(const std::vector<size_t>& rows)
{
    if (isRowBound())
    {
        const size_t rowCount = getRowCount();

        std::set<size_t> newSelection;
        for (const size_t row : rows)
            if (row < rowCount)
                newSelection.insert(row);

        changeRowSelection(std::move(newSelection), false /*notifyView: selection comes from the view*/);
        return;
    }

    std::unordered_set<const T*> newSelection;
    for (const size_t row : rows)
        if (const ObjectPtr obj = getObjectAt(row))
            newSelection.insert(obj.get());

    changeSelection(std::move(newSelection), false /*notifyView: selection comes from the view*/);
}


template <class T> inline
void ObjectListModel<T>::installCheckStateColumn(std::optional<size_t> col)
{
    if (col && *col >= columns_.size())
        return;

    internalCheckState_ = internalCheckState_ && checkColumn_ == col; //reinstalling keeps the internal state
    checkColumn_ = col;

    if (col && !columns_[*col].hasCheckState())
    {
        internalCheckState_ = true;
        columns_[*col].checkStateGetter = [this](const T& obj)
        {
            auto it = checkStateMap_.find(&obj);
            return it != checkStateMap_.end() && it->second;
        };
        columns_[*col].checkStateSetter = [this](T& obj, bool checked) { checkStateMap_[&obj] = checked; };
    }

    notifyColumnsReset();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::createCheckStateColumn(size_t pos)
{
    ColumnDefn<T> col;
    col.title = std::wstring();
    col.setFixedWidth(CHECK_COLUMN_WIDTH);
    col.isEditable   = false;
    col.isSearchable = false;
    col.stringConverter = [](const Value&) { return std::wstring(); }; //no text in a check box column

    insertColumn(pos, col);
    installCheckStateColumn(std::min(pos, columns_.size() - 1));
}


template <class T> inline
bool ObjectListModel<T>::isChecked(const T& obj) const
{
    if (hasRowCheckState())
    {
        const ptrdiff_t row = getIndexOf(obj);
        return row >= 0 && checkedRows_.contains(row);
    }

    if (checkColumn_)
        if (const ColumnDefn<T>& col = columns_[*checkColumn_];
            col.checkStateGetter)
            return col.checkStateGetter(obj);
    return false;
}


template <class T> inline
void ObjectListModel<T>::setCheckState(T& obj, bool checked)
{
    if (hasRowCheckState())
    {
        if (const ptrdiff_t row = getIndexOf(obj);
            row >= 0)
            setRowCheckState(row, checked);
        return;
    }

    if (checkColumn_)
        if (const ColumnDefn<T>& col = columns_[*checkColumn_];
            col.checkStateSetter)
        {
            col.checkStateSetter(obj, checked);
            refreshObject(obj);
        }
}


template <class T> inline
void ObjectListModel<T>::setRowCheckState(size_t row, bool checked)
{
    if (hasRowCheckState())
    {
        if (!checkColumn_ || row >= getRowCount())
            return;

        if (checked)
            checkedRows_.insert(row);
        else
            checkedRows_.erase(row);

        if (ListViewNotify* view = getView())
            view->onRowsRefreshed(row, row + 1);
        return;
    }

    if (const ObjectPtr obj = getObjectAt(row))
        setCheckState(*obj, checked);
}


template <class T> inline
std::vector<typename ObjectListModel<T>::ObjectPtr> ObjectListModel<T>::getCheckedObjects() const
{
    std::vector<ObjectPtr> output;
    if (hasRowCheckState())
    {
        for (const size_t row : checkedRows_)
            if (ObjectPtr obj = getObjectAt(row))
                output.push_back(std::move(obj));
    }
    else if (checkColumn_)
        for (const ObjectPtr& obj : dataSource_->getFilteredObjects())
            if (isChecked(*obj))
                output.push_back(obj);
    return output;
}


template <class T> inline
void ObjectListModel<T>::setCheckedObjects(const std::vector<const T*>& objects)
{
    if (hasRowCheckState())
    {
        std::set<size_t> rows;
        for (const T* obj : objects)
            if (obj)
                if (const ptrdiff_t row = getIndexOf(*obj);
                    row >= 0)
                    rows.insert(row);

        checkedRows_ = std::move(rows);
        refreshAll();
        return;
    }

    const std::unordered_set<const T*> toCheck(objects.begin(), objects.end());

    for (const ObjectPtr& obj : dataSource_->getFilteredObjects())
        if (const bool checked = toCheck.contains(obj.get());
            checked != isChecked(*obj))
            setCheckState(*obj, checked);
}


template <class T> inline
std::optional<bool> ObjectListModel<T>::getCheckState(size_t row) const
{
    if (!checkColumn_ || !columns_[*checkColumn_].hasCheckState())
        return std::nullopt;

    if (hasRowCheckState()) //don't create an object just to ask
    {
        if (row < getRowCount())
            return checkedRows_.contains(row);
        return std::nullopt;
    }

    if (const ObjectPtr obj = getObjectAt(row))
        return isChecked(*obj);
    return std::nullopt;
}


template <class T> inline
void ObjectListModel<T>::handleCheckClick(size_t row)
{
    const std::optional<bool> checked = getCheckState(row);
    if (!checked)
        return;

    const bool newState = !*checked;

    //clicking a selected row changes all selected rows
    if (const std::vector<size_t> selRows = getSelectedRows();
        std::binary_search(selRows.begin(), selRows.end(), row))
        for (const size_t selRow : selRows)
            setRowCheckState(selRow, newState);
    else
        setRowCheckState(row, newState);
}


template <class T> inline
void ObjectListModel<T>::setShowGroups(bool show)
{
    if (showGroups_ == show)
        return;
    showGroups_ = show;
    rebuildRows();
    notifyRowsReset();
    if (ListViewNotify* view = getView())
        view->onSelectionChanged();
}


template <class T> inline
void ObjectListModel<T>::setAlwaysGroupByColumn(std::optional<size_t> col)
{
    if (col && *col >= columns_.size())
        return;
    alwaysGroupByColumn_ = col;
    rebuildRows();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::setShowItemCounts(bool show)
{
    showItemCounts_ = show;
    rebuildRows();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::setPutBlankLineBetweenGroups(bool blankLine)
{
    putBlankLineBetweenGroups_ = blankLine;
    rebuildRows();
    notifyRowsReset();
}


template <class T> inline
void ObjectListModel<T>::setGroupFormatter(const std::function<void(ListGroup<T>& group)>& formatter)
{
    groupFormatter_ = formatter;
    rebuildRows();
    notifyRowsReset();
}


template <class T> inline
bool ObjectListModel<T>::isGroupKeyExpanded(const Value& groupKey) const
{
    return std::none_of(collapsedGroupKeys_.begin(), collapsedGroupKeys_.end(),
                        [&](const Value& key) { return compareValues(key, groupKey) == 0; });
}


template <class T> inline
void ObjectListModel<T>::setGroupsExpanded(const std::vector<Value>& groupKeys, bool expand)
{
    GroupExpansionEvent expansion;
    expansion.isExpand = expand;
    for (const Value& key : groupKeys)
        if (isGroupKeyExpanded(key) != expand)
            expansion.groupKeys.push_back(key);

    if (expansion.groupKeys.empty())
        return;

    if (const auto& handler = expand ? events_.onGroupExpanding : events_.onGroupCollapsing)
        handler(expansion);
    if (expansion.cancelled)
        return;

    for (const Value& key : expansion.groupKeys)
        if (expand)
            std::erase_if(collapsedGroupKeys_, [&](const Value& k) { return compareValues(k, key) == 0; });
        else
            collapsedGroupKeys_.push_back(key);

    rebuildRows();
    notifyRowsReset();
    if (ListViewNotify* view = getView())
        view->onSelectionChanged(); //same objects, new rows
}


template <class T> inline
void ObjectListModel<T>::expandAll()
{
    std::vector<Value> keys;
    for (const ListGroup<T>& group : groups_)
        keys.push_back(group.key);
    setGroupsExpanded(keys, true);
}


template <class T> inline
void ObjectListModel<T>::collapseAll()
{
    std::vector<Value> keys;
    for (const ListGroup<T>& group : groups_)
        keys.push_back(group.key);
    setGroupsExpanded(keys, false);
}


template <class T> inline
const ListGroup<T>* ObjectListModel<T>::getGroupAtRow(size_t row) const
{
    if (isGrouped() && row < innerRows_.size() && innerRows_[row].kind == RowKind::groupHeader)
        return &groups_[innerRows_[row].groupIdx];
    return nullptr;
}


template <class T> inline
bool ObjectListModel<T>::isGroupExpanded(size_t row) const
{
    if (const ListGroup<T>* group = getGroupAtRow(row))
        return group->expanded;
    return false;
}


template <class T> inline
void ObjectListModel<T>::toggleGroupExpansion(size_t row)
{
    if (const ListGroup<T>* group = getGroupAtRow(row))
    {
        const Value key = group->key; //groups_ is rebuilt!
        toggleExpansion(key);
    }
}


template <class T> inline
void ObjectListModel<T>::setGroupExpanded(size_t row, bool expand)
{
    if (const ListGroup<T>* group = getGroupAtRow(row))
    {
        const Value key = group->key;
        setGroupsExpanded({key}, expand);
    }
}


template <class T> inline
void ObjectListModel<T>::applyFilters()
{
    const size_t oldObjectCount = getObjectCount();

    dataSource_->applyFilters(modelFilter_, listFilter_);

    if (isRowBound())
        pruneRowState();
    else
    {
        //filtered objects are deselected
        std::unordered_set<const T*> visibleObjects;
        for (const ObjectPtr& obj : dataSource_->getFilteredObjects())
            visibleObjects.insert(obj.get());

        std::unordered_set<const T*> newSelection = selected_;
        std::erase_if(newSelection, [&](const T* obj) { return !visibleObjects.contains(obj); });
        changeSelection(std::move(newSelection), false /*notifyView*/);
    }

    rebuildRows();
    notifyRowsReset();
    raiseItemsChanged(oldObjectCount);
}


template <class T> inline
RowKind ObjectListModel<T>::getRowKind(size_t row) const
{
    if (isGrouped() && row < innerRows_.size())
        return innerRows_[row].kind;
    return RowKind::object;
}


template <class T> inline
std::wstring ObjectListModel<T>::getCellText(size_t row, size_t viewCol) const
{
    if (viewCol >= visibleColumns_.size())
        return std::wstring();

    if (const ListGroup<T>* group = getGroupAtRow(row))
        return viewCol == 0 ? group->title : std::wstring();

    if (const ObjectPtr obj = getObjectAt(row))
        return columns_[visibleColumns_[viewCol]].getStringValue(*obj);
    return std::wstring();
}


template <class T> inline
int ObjectListModel<T>::getCellImage(size_t row, size_t viewCol) const
{
    if (viewCol >= visibleColumns_.size())
        return -1;

    if (const ListGroup<T>* group = getGroupAtRow(row))
        return viewCol == 0 ? group->titleImage : -1;

    if (const ObjectPtr obj = getObjectAt(row))
        return columns_[visibleColumns_[viewCol]].getImage(*obj);
    return -1;
}


template <class T> inline
RowFormat ObjectListModel<T>::getRowFormat(size_t row) const
{
    RowFormat fmt;
    switch (getRowKind(row))
    {
        case RowKind::groupHeader:
            fmt.bold = true;
            break;

        case RowKind::blank:
            break;

        case RowKind::object:
            if (useAlternateBackColours_)
                fmt.backgroundColour = row % 2 == 0 ? evenRowsBackColour_ : oddRowsBackColour_;
            fmt.useCellFormat = static_cast<bool>(cellFormatter_);

            if (rowFormatter_)
                if (const ObjectPtr obj = getObjectAt(row))
                    rowFormatter_(fmt, *obj);
            break;
    }
    return fmt;
}


template <class T> inline
std::optional<CellFormat> ObjectListModel<T>::getCellFormat(size_t row, size_t viewCol) const
{
    if (!cellFormatter_ || viewCol >= visibleColumns_.size() || getRowKind(row) != RowKind::object)
        return std::nullopt;

    const RowFormat rowFmt = getRowFormat(row);
    if (!rowFmt.useCellFormat)
        return std::nullopt;

    if (const ObjectPtr obj = getObjectAt(row))
    {
        CellFormat fmt = rowFmt;
        cellFormatter_(fmt, *obj, visibleColumns_[viewCol]);
        return fmt;
    }
    return std::nullopt;
}


template <class T> inline
void ObjectListModel<T>::prepareCache(size_t rowFirst, size_t rowLast)
{
    if (!isGrouped() && rowFirst < rowLast)
        dataSource_->prepareCache(rowFirst, rowLast - 1); //closed range
}


template <class T> inline
ViewColumnInfo ObjectListModel<T>::getViewColumnInfo(size_t viewCol) const
{
    if (viewCol >= visibleColumns_.size())
        return ViewColumnInfo();

    const ColumnDefn<T>& col = columns_[visibleColumns_[viewCol]];

    ViewColumnInfo info;
    info.title = col.title;
    info.align = col.align;
    info.widthInfo.width        = col.width;
    info.widthInfo.minimumWidth = col.minimumWidth;
    info.widthInfo.maximumWidth = col.maximumWidth;
    info.widthInfo.isSpaceFilling      = col.isSpaceFilling;
    info.widthInfo.freeSpaceProportion = col.freeSpaceProportion;
    info.isEditable = col.isEditable;
    return info;
}


template <class T> inline
void ObjectListModel<T>::setViewColumnWidth(size_t viewCol, int width)
{
    if (viewCol < visibleColumns_.size())
    {
        ColumnDefn<T>& col = columns_[visibleColumns_[viewCol]];
        col.width = col.calcBoundedWidth(width);
    }
}


template <class T> inline
bool ObjectListModel<T>::canUseBinarySearch(size_t col) const
{
    if (sortColumn_ != col || isGrouped() || isRowBound()) //row-bound lists are never sorted
        return false;

    if (const std::optional<bool> useBinarySearch = columns_[col].useBinarySearch)
        return *useBinarySearch;

    //default: only text columns are ordered like their string values
    if (const ObjectPtr obj = getObjectAt(0))
        return columns_[col].getValue(*obj).kind() == ValueKind::text;
    return false;
}


template <class T> inline
ptrdiff_t ObjectListModel<T>::findRowByPrefix(const std::wstring& prefix, ptrdiff_t focusedRow) const
{
    const size_t rowCount = getRowCount();
    if (prefix.empty() || rowCount == 0 || visibleColumns_.empty())
        return -1;

    //search the sort column, or the first column if unsorted
    const size_t searchCol = sortColumn_ ? *sortColumn_ : visibleColumns_[0];
    const ColumnDefn<T>& col = columns_[searchCol];
    if (!col.isSearchable)
        return -1;

    size_t start = 0;
    if (focusedRow >= 0)
    {
        start = std::min<size_t>(focusedRow, rowCount - 1);
        if (prefix.size() == 1) //new search: don't stay on the current row
            start = (start + 1) % rowCount;
    }

    if (canUseBinarySearch(searchCol))
    {
        auto getText = [&](size_t row)
        {
            const ObjectPtr obj = getObjectAt(row);
            return obj ? col.getStringValue(*obj) : std::wstring();
        };
        //null values are sorted last in either direction: bisect the rows before them
        size_t valueRowCount = 0;
        for (size_t last = rowCount; valueRowCount < last;)
        {
            const size_t middle = valueRowCount + (last - valueRowCount) / 2;
            if (const ObjectPtr obj = getObjectAt(middle);
                obj && !col.getValue(*obj).isNull())
                valueRowCount = middle + 1;
            else
                last = middle;
        }
        const size_t startValue = std::min(start, valueRowCount);

        if (const ptrdiff_t row = findRowBisect(startValue, valueRowCount, prefix, sortAscending_, getText);
            row >= 0)
            return row;
        if (const ptrdiff_t row = findRowBisect(0, startValue, prefix, sortAscending_, getText);
            row >= 0)
            return row;
        //null values may still be shown as text: continue linear
    }

    if (rowCount > MAX_ROWS_FOR_UNSORTED_SEARCH)
        return -1;

    if (!isGrouped())
    {
        if (const ptrdiff_t row = dataSource_->searchText(prefix, start, rowCount - 1, col);
            row >= 0)
            return row;
        if (start > 0)
            return dataSource_->searchText(prefix, 0, start - 1, col);
        return -1;
    }

    //wrap around: [start, rowCount) then [0, start)
    for (size_t i = 0; i < rowCount; ++i)
    {
        const size_t row = (start + i) % rowCount;
        if (const ObjectPtr obj = getObjectAt(row))
            if (startsWithNoCase(col.getStringValue(*obj), prefix))
                return row;
    }
    return -1;
}


template <class T> inline
bool ObjectListModel<T>::isCellEditable(size_t row, size_t viewCol) const
{
    if (viewCol >= visibleColumns_.size() || getRowKind(row) != RowKind::object)
        return false;

    return columns_[visibleColumns_[viewCol]].isEditable && getObjectAt(row);
}


template <class T> inline
Value ObjectListModel<T>::getCellValue(size_t row, size_t viewCol) const
{
    if (viewCol < visibleColumns_.size())
        if (const ObjectPtr obj = getObjectAt(row))
            return columns_[visibleColumns_[viewCol]].getValue(*obj);
    return Value();
}


template <class T> inline
bool ObjectListModel<T>::setCellValue(size_t row, size_t viewCol, const Value& v) //throw ValueConversionError
{
    if (viewCol < visibleColumns_.size())
        if (const ObjectPtr obj = getObjectAt(row))
            if (columns_[visibleColumns_[viewCol]].setValue(*obj, v)) //throw ValueConversionError
            {
                refreshObject(*obj);
                return true;
            }
    return false;
}


template <class T> inline
EditorKind ObjectListModel<T>::getEditorKind(size_t row, size_t viewCol) const
{
    if (viewCol >= visibleColumns_.size())
        return EditorKind::text;

    const ColumnDefn<T>& col = columns_[visibleColumns_[viewCol]];

    return selectEditorKind(col.cellEditorKind, getCellValue(row, viewCol), getRowCount(), [&](size_t r)
    {
        const ObjectPtr obj = getObjectAt(r);
        return obj ? col.getValue(*obj) : Value();
    });
}


template <class T> inline
ClipboardContent ObjectListModel<T>::copySelection() const
{
    const std::vector<size_t> viewOrder = getViewColumnOrder();

    std::vector<std::wstring> titles;
    for (const size_t viewCol : viewOrder)
        titles.push_back(columns_[visibleColumns_[viewCol]].title);

    std::vector<std::vector<std::wstring>> rows;
    for (const ObjectPtr& obj : getSelectedObjects())
    {
        std::vector<std::wstring>& cells = rows.emplace_back();
        for (const size_t viewCol : viewOrder)
            cells.push_back(columns_[visibleColumns_[viewCol]].getStringValue(*obj));
    }
    return formatClipboardContent(titles, rows, includeColumnTitlesInCopy_);
}
}

#endif //LIST_MODEL_H_3918274650192837465
