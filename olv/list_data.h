// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef LIST_DATA_H_8102937465102938476
#define LIST_DATA_H_8102937465102938476

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "clipboard.h"
#include "column.h"
#include "group.h"


namespace olv
{
struct RgbColour
{
    unsigned char red   = 0;
    unsigned char green = 0;
    unsigned char blue  = 0;

    bool operator==(const RgbColour&) const = default;
};

struct CellFormat
{
    std::optional<RgbColour> textColour;
    std::optional<RgbColour> backgroundColour;
    bool bold = false;
};

struct RowFormat : public CellFormat
{
    bool useCellFormat = false; //format the cells of this row one by one; preset if the list has a cell formatter
};

struct ViewColumnInfo
{
    std::wstring    title;
    ColumnAlignment align = ColumnAlignment::left;
    ColumnWidthInfo widthInfo;
    bool isEditable = false;
};


//model => list control
class ListViewNotify
{
public:
    virtual ~ListViewNotify() {}

    virtual void onRowsReset() = 0; //row count and content of any row may have changed
    virtual void onRowsRefreshed(size_t rowFirst, size_t rowLast) = 0; //[rowFirst, rowLast)
    virtual void onColumnsReset() = 0; //column count, titles, widths or order changed
    virtual void onSelectionChanged() = 0; //the model's selection differs from the one shown
    virtual void onSortIndicatorChanged() = 0;
};


/*  list control => model: everything ListCtrl needs to know to show and edit a list of rows
    "viewCol": index of a *visible* column                                                  */
class ListDataProvider
{
public:
    virtual ~ListDataProvider() {}

    void attachView(ListViewNotify* view) { view_ = view; } //nullptr: detach

    //rows:
    virtual size_t  getRowCount() const = 0;
    virtual RowKind getRowKind(size_t row) const = 0;
    virtual std::wstring getCellText (size_t row, size_t viewCol) const = 0;
    virtual int          getCellImage(size_t row, size_t viewCol) const = 0; //-1: none
    virtual std::optional<bool> getCheckState(size_t row) const = 0; //none: no check column or not an object row
    virtual RowFormat    getRowFormat(size_t row) const = 0;
    virtual std::optional<CellFormat> getCellFormat(size_t row, size_t viewCol) const = 0; //none: use the row format
    virtual bool         isGroupExpanded(size_t row) const = 0; //row: group header
    virtual void         prepareCache(size_t rowFirst, size_t rowLast) = 0; //[rowFirst, rowLast)

    //columns:
    virtual size_t getViewColumnCount() const = 0;
    virtual ViewColumnInfo getViewColumnInfo(size_t viewCol) const = 0;
    virtual std::optional<size_t> getCheckViewColumn() const = 0;
    virtual std::optional<std::pair<size_t /*viewCol*/, bool /*ascending*/>> getSortIndicator() const = 0;
    virtual std::vector<size_t> getViewColumnOrder() const = 0;

    //user input:
    virtual void handleColumnClick(size_t viewCol) = 0;
    virtual void setViewColumnWidth(size_t viewCol, int width) = 0;
    virtual void handleCheckClick(size_t row) = 0;
    virtual void toggleGroupExpansion(size_t row) = 0;      //row: group header
    virtual void setGroupExpanded(size_t row, bool expand) = 0; //
    virtual ptrdiff_t findRowByPrefix(const std::wstring& prefix, ptrdiff_t focusedRow) const = 0; //-1 if not found

    //selection:
    virtual std::vector<size_t> getSelectedRows() const = 0;
    virtual void setSelectedRows(const std::vector<size_t>& rows) = 0;
    virtual void selectAllRows() = 0;

    //cell editing:
    virtual bool       isCellEditable(size_t row, size_t viewCol) const = 0;
    virtual Value      getCellValue  (size_t row, size_t viewCol) const = 0;
    virtual bool       setCellValue  (size_t row, size_t viewCol, const Value& v) = 0; //throw ValueConversionError
    virtual EditorKind getEditorKind (size_t row, size_t viewCol) const = 0;

    virtual std::wstring getEmptyListMsg() const = 0;
    virtual ClipboardContent copySelection() const = 0;

protected:
    ListViewNotify* getView() const { return view_; }

private:
    ListViewNotify* view_ = nullptr;
};
}

#endif //LIST_DATA_H_8102937465102938476
