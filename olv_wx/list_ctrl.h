// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef LIST_CTRL_H_6619203847561029384
#define LIST_CTRL_H_6619203847561029384

#include <optional>
#include <vector>
#include <wx/listctrl.h>
#include <wx/stattext.h>
#include <olv/cell_edit.h>
#include <olv/list_data.h>
#include <olv/typing_search.h>
#include "cell_editor.h"
#include "olv_event.h"


namespace olv
{
/*  virtual report list control showing the rows of a ListDataProvider

    - rows are pulled on demand: OnGetItemText(), OnGetItemColumnImage(), OnGetItemAttr(), OnGetItemColumnAttr()
    - image list: RESERVED_IMAGE_COUNT internal images (check boxes, group expanders) followed by the user's images
    - raises EVENT_OLV_CELL_EDIT_STARTING/EVENT_OLV_CELL_EDIT_FINISHING                                              */
class ListCtrl : public wxListCtrl, private ListViewNotify
{
public:
    ListCtrl(wxWindow* parent,
             wxWindowID id        = wxID_ANY,
             const wxPoint& pos   = wxDefaultPosition,
             const wxSize& size   = wxDefaultSize,
             long style           = wxBORDER_THEME,
             const wxString& name = L"ObjectListView");
    ~ListCtrl();

    void setDataProvider(ListDataProvider* provider); //nullptr: detach; ownership stays with caller
    ListDataProvider* getDataProvider() const { return provider_; }

    void setSmallImages(const std::vector<wxBitmap>& images); //index into "images" == ImageGetter result

    void setCellEditMode(CellEditMode mode) { editMode_ = mode; }
    CellEditMode getCellEditMode() const { return editMode_; }

    bool startCellEdit(size_t row, size_t viewCol);
    bool finishCellEdit() { return finishCellEdit(true /*commit*/); }
    void cancelCellEdit() { finishCellEdit(false); }
    bool isCellEditing() const { return static_cast<bool>(activeEdit_); }

    void copySelectionToClipboard();

    void refreshAllRows() { onRowsReset(); }
    void refreshAllColumns() { onColumnsReset(); }

    static const int RESERVED_IMAGE_COUNT = 4;

private:
    //wxListCtrl virtual mode:
    wxString  OnGetItemText       (long item, long column) const override;
    int       OnGetItemColumnImage(long item, long column) const override;
    int       OnGetItemImage      (long item) const override { return OnGetItemColumnImage(item, 0); }
    wxItemAttr* OnGetItemAttr     (long item) const override;
    wxItemAttr* OnGetItemColumnAttr(long item, long column) const override;

    //ListViewNotify:
    void onRowsReset() override;
    void onRowsRefreshed(size_t rowFirst, size_t rowLast) override;
    void onColumnsReset() override;
    void onSelectionChanged() override;
    void onSortIndicatorChanged() override;

    void onMouseLeftDown  (wxMouseEvent& event);
    void onMouseLeftDouble(wxMouseEvent& event);
    void onKeyDown(wxKeyEvent& event);
    void onChar   (wxKeyEvent& event);
    void onColumnBeginDrag(wxListEvent& event);
    void onColumnEndDrag  (wxListEvent& event);
    void onNativeSelectionChanged();

    bool finishCellEdit(bool commit);
    void abortCellEdit(); //no events, no selection restore
    void moveCellEdit(bool forward);
    void onEditorKey(wxKeyEvent& event);
    void onEditorKillFocus();

    std::optional<size_t> getViewColumnAt(size_t row, int xClient) const;
    std::optional<size_t> getNextEditableViewColumn(size_t row, size_t viewCol, bool forward) const; //in display order
    std::optional<size_t> getRowAt(const wxPoint& posClient) const;
    ptrdiff_t getFocusedRow() const;

    void updateImageList();
    void updateColumnWidths(); //space-filling columns
    void updateSortIndicator();
    void updateEmptyListMsg();
    void syncSelectionToNative();

    ListDataProvider* provider_ = nullptr;

    std::vector<wxBitmap> userImages_;
    wxImageList* imageList_ = nullptr; //owned by wxListCtrl::AssignImageList()

    mutable wxItemAttr rowAttr_;  //buffer for OnGetItemAttr()
    mutable wxItemAttr cellAttr_; //buffer for OnGetItemColumnAttr()

    wxStaticText* emptyListLabel_ = nullptr;

    TypingSearchBuffer typingSearch_;

    bool syncingSelection_ = false; //we're updating the native selection ourselves
    bool selectionSyncPending_ = false;

    CellEditMode editMode_ = CellEditMode::doubleClick;

    struct CellEdit
    {
        CellEditor* editor = nullptr; //owned by wxWidgets parent-child
        size_t row     = 0;
        size_t viewCol = 0;
        wxRect bounds;
        Value  initialValue;
        std::vector<size_t> savedSelection;
    };
    std::optional<CellEdit> activeEdit_;
    bool finishingEdit_ = false; //avoid recursion: killing the editor's focus while committing
};
}

#endif //LIST_CTRL_H_6619203847561029384
