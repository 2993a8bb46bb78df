// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "list_ctrl.h"
#include <functional>
#include <iterator>
#include <wx/clipbrd.h>
#include <wx/dataobj.h>
#include <wx/dcmemory.h>
#include <wx/imaglist.h>
#include <wx/renderer.h>
#include <wx/settings.h>
#include <wx/utils.h>
#include <olv/error_log.h>
#include <olv/scope_guard.h>

using namespace olv;


namespace
{
enum ReservedImage
{
    IMAGE_UNCHECKED,
    IMAGE_CHECKED,
    IMAGE_EXPANDED,
    IMAGE_COLLAPSED,
};
static_assert(IMAGE_COLLAPSED + 1 == ListCtrl::RESERVED_IMAGE_COUNT);


wxListColumnFormat toListFormat(ColumnAlignment align)
{
    switch (align)
    {
        case ColumnAlignment::left:
            break;
        case ColumnAlignment::centre:
            return wxLIST_FORMAT_CENTRE;
        case ColumnAlignment::right:
            return wxLIST_FORMAT_RIGHT;
    }
    return wxLIST_FORMAT_LEFT;
}


inline
bool isFixedWidth(const ColumnWidthInfo& wi) { return wi.minimumWidth != -1 && wi.maximumWidth != -1 && wi.minimumWidth >= wi.maximumWidth; }


inline
std::wstring fromUtf8(const char* str) { return wxString::FromUTF8(str).ToStdWstring(); }


inline
wxColour toColour(const RgbColour& col) { return wxColour(col.red, col.green, col.blue); }


void applyCellFormat(wxItemAttr& attr, const CellFormat& fmt, const wxFont& font)
{
    if (fmt.textColour)
        attr.SetTextColour(toColour(*fmt.textColour));
    if (fmt.backgroundColour)
        attr.SetBackgroundColour(toColour(*fmt.backgroundColour));
    if (fmt.bold)
        attr.SetFont(font.Bold());
}


//the native control receives mouse/keyboard input and positions rows itself; the generic one delegates both to its "main window"
inline
wxWindow& getRowWindow(wxListCtrl& list)
{
#if defined(__WXMSW__) || defined(__WXQT__)
    return list;
#else
    return *list.GetMainWindow();
#endif
}
}


ListCtrl::ListCtrl(wxWindow* parent,
                   wxWindowID id,
                   const wxPoint& pos,
                   const wxSize& size,
                   long style,
                   const wxString& name) :
    wxListCtrl(parent, id, pos, size, style | wxLC_REPORT | wxLC_VIRTUAL, wxDefaultValidator, name)
{
    wxWindow& rowWin = getRowWindow(*this);

    emptyListLabel_ = new wxStaticText(&rowWin, wxID_ANY, wxString());
    emptyListLabel_->SetForegroundColour(wxSystemSettings::GetColour(wxSYS_COLOUR_GRAYTEXT));
    emptyListLabel_->Hide();

    updateImageList();

    rowWin.Bind(wxEVT_LEFT_DOWN,   [this](wxMouseEvent& event) { onMouseLeftDown  (event); });
    rowWin.Bind(wxEVT_LEFT_DCLICK, [this](wxMouseEvent& event) { onMouseLeftDouble(event); });
    rowWin.Bind(wxEVT_KEY_DOWN,    [this](wxKeyEvent&   event) { onKeyDown(event); });
    rowWin.Bind(wxEVT_CHAR,        [this](wxKeyEvent&   event) { onChar   (event); });

    Bind(wxEVT_SIZE, [this](wxSizeEvent& event)
    {
        CallAfter([this] //wait until the generic control has resized its main window
        {
            updateColumnWidths();
            updateEmptyListMsg();
        });
        event.Skip();
    });

    Bind(wxEVT_LIST_COL_CLICK, [this](wxListEvent& event)
    {
        if (provider_ && event.GetColumn() >= 0 && finishCellEdit(true /*commit*/))
            provider_->handleColumnClick(event.GetColumn());
    });
    Bind(wxEVT_LIST_COL_BEGIN_DRAG, [this](wxListEvent& event) { onColumnBeginDrag(event); });
    Bind(wxEVT_LIST_COL_END_DRAG,   [this](wxListEvent& event) { onColumnEndDrag  (event); });

    Bind(wxEVT_LIST_CACHE_HINT, [this](wxListEvent& event)
    {
        if (provider_ && event.GetCacheFrom() >= 0 && event.GetCacheTo() >= event.GetCacheFrom())
            provider_->prepareCache(event.GetCacheFrom(), event.GetCacheTo() + 1);
    });

    //virtual lists may report range selections as single events: re-read the complete native selection once
    auto onNativeSelection = [this](wxListEvent& event)
    {
        if (!syncingSelection_ && !selectionSyncPending_)
        {
            selectionSyncPending_ = true;
            CallAfter([this]
            {
                selectionSyncPending_ = false;
                onNativeSelectionChanged();
            });
        }
        event.Skip();
    };
    Bind(wxEVT_LIST_ITEM_SELECTED,   onNativeSelection);
    Bind(wxEVT_LIST_ITEM_DESELECTED, onNativeSelection);
    Bind(wxEVT_LIST_ITEM_FOCUSED,    onNativeSelection);
}


ListCtrl::~ListCtrl()
{
    if (provider_)
        provider_->attachView(nullptr);
}


void ListCtrl::setDataProvider(ListDataProvider* provider)
{
    abortCellEdit();

    if (provider_)
        provider_->attachView(nullptr);

    provider_ = provider;

    if (provider_)
        provider_->attachView(this);

    onColumnsReset();
}


void ListCtrl::setSmallImages(const std::vector<wxBitmap>& images)
{
    userImages_ = images;
    updateImageList();
    Refresh();
}


void ListCtrl::updateImageList()
{
    const wxSize imgSize = FromDIP(wxSize(16, 16));

    imageList_ = new wxImageList(imgSize.GetWidth(), imgSize.GetHeight(), false /*mask*/);

    auto addRenderedImage = [&](const std::function<void(wxDC& dc, const wxRect& rect)>& draw)
    {
        wxBitmap bmp(imgSize);
        {
            wxMemoryDC dc(bmp);
            dc.SetBackground(wxBrush(GetBackgroundColour()));
            dc.Clear();
            draw(dc, wxRect(imgSize));
        }
        imageList_->Add(bmp);
    };

    wxRendererNative& renderer = wxRendererNative::Get();
    addRenderedImage([&](wxDC& dc, const wxRect& rect) { renderer.DrawCheckBox(this, dc, rect, 0); });
    addRenderedImage([&](wxDC& dc, const wxRect& rect) { renderer.DrawCheckBox(this, dc, rect, wxCONTROL_CHECKED); });
    addRenderedImage([&](wxDC& dc, const wxRect& rect) { renderer.DrawTreeItemButton(this, dc, rect, wxCONTROL_EXPANDED); });
    addRenderedImage([&](wxDC& dc, const wxRect& rect) { renderer.DrawTreeItemButton(this, dc, rect, 0); });

    for (const wxBitmap& img : userImages_)
        if (img.GetSize() == imgSize)
            imageList_->Add(img);
        else
            imageList_->Add(wxBitmap(img.ConvertToImage().Rescale(imgSize.GetWidth(), imgSize.GetHeight(), wxIMAGE_QUALITY_HIGH)));

    AssignImageList(imageList_, wxIMAGE_LIST_SMALL); //ownership passed
}


wxString ListCtrl::OnGetItemText(long item, long column) const
{
    if (provider_ && item >= 0 && column >= 0)
        try
        {
            if (static_cast<size_t>(item)   < provider_->getRowCount() &&
                static_cast<size_t>(column) < provider_->getViewColumnCount())
                return provider_->getCellText(item, column);
        }
        catch (const OlvError& e) { logExtraError(e.toString()); }
        catch (const std::exception& e) { logExtraError(_("Cannot show cell text.") + L' ' + fromUtf8(e.what())); }

    return wxString();
}


int ListCtrl::OnGetItemColumnImage(long item, long column) const
{
    if (provider_ && item >= 0 && column >= 0 && static_cast<size_t>(item) < provider_->getRowCount())
        try
        {
            switch (provider_->getRowKind(item))
            {
                case RowKind::groupHeader:
                    if (column == 0)
                        return provider_->isGroupExpanded(item) ? IMAGE_EXPANDED : IMAGE_COLLAPSED;
                    return -1;

                case RowKind::blank:
                    return -1;

                case RowKind::object:
                    if (const std::optional<size_t> checkCol = provider_->getCheckViewColumn();
                        checkCol && *checkCol == static_cast<size_t>(column))
                    {
                        if (const std::optional<bool> checked = provider_->getCheckState(item))
                            return *checked ? IMAGE_CHECKED : IMAGE_UNCHECKED;
                        return -1;
                    }

                    if (const int img = provider_->getCellImage(item, column);
                        0 <= img && img < std::ssize(userImages_))
                        return RESERVED_IMAGE_COUNT + img;
                    return -1;
            }
        }
        catch (const OlvError& e) { logExtraError(e.toString()); }
        catch (const std::exception& e) { logExtraError(_("Cannot show cell image.") + L' ' + fromUtf8(e.what())); }

    return -1;
}


wxItemAttr* ListCtrl::OnGetItemAttr(long item) const
{
    rowAttr_ = wxItemAttr();

    if (provider_ && item >= 0 && static_cast<size_t>(item) < provider_->getRowCount())
        try
        {
            applyCellFormat(rowAttr_, provider_->getRowFormat(item), GetFont());
        }
        catch (const OlvError& e) { logExtraError(e.toString()); }
        catch (const std::exception& e) { logExtraError(_("Cannot show row format.") + L' ' + fromUtf8(e.what())); }

    return &rowAttr_;
}


wxItemAttr* ListCtrl::OnGetItemColumnAttr(long item, long column) const
{
    if (provider_ && item >= 0 && column >= 0 && static_cast<size_t>(item) < provider_->getRowCount())
        try
        {
            if (const std::optional<CellFormat> fmt = provider_->getCellFormat(item, column))
            {
                cellAttr_ = wxItemAttr();
                applyCellFormat(cellAttr_, *fmt, GetFont());
                return &cellAttr_;
            }
        }
        catch (const OlvError& e) { logExtraError(e.toString()); }
        catch (const std::exception& e) { logExtraError(_("Cannot show cell format.") + L' ' + fromUtf8(e.what())); }

    return OnGetItemAttr(item);
}


void ListCtrl::onRowsReset()
{
    abortCellEdit(); //row numbers are void

    SetItemCount(provider_ ? provider_->getRowCount() : 0);
    Refresh();

    updateEmptyListMsg();
    syncSelectionToNative();
}


void ListCtrl::onRowsRefreshed(size_t rowFirst, size_t rowLast)
{
    rowLast = std::min<size_t>(rowLast, GetItemCount());
    if (rowFirst < rowLast)
        RefreshItems(rowFirst, rowLast - 1); //closed range
}


void ListCtrl::onColumnsReset()
{
    abortCellEdit();

    DeleteAllColumns();

    if (provider_)
    {
        const size_t colCount = provider_->getViewColumnCount();
        for (size_t viewCol = 0; viewCol < colCount; ++viewCol)
        {
            const ViewColumnInfo info = provider_->getViewColumnInfo(viewCol);
            AppendColumn(info.title, toListFormat(info.align), info.widthInfo.width);
        }

#ifdef wxHAS_LISTCTRL_COLUMN_ORDER
        const std::vector<size_t> order = provider_->getViewColumnOrder();
        if (order.size() == colCount && colCount > 0)
        {
            wxArrayInt nativeOrder;
            for (const size_t viewCol : order)
                nativeOrder.push_back(static_cast<int>(viewCol));
            SetColumnsOrder(nativeOrder);
        }
#endif
    }

    updateColumnWidths();
    updateSortIndicator();
    onRowsReset();
}


void ListCtrl::onSelectionChanged()
{
    syncSelectionToNative();
}


void ListCtrl::onSortIndicatorChanged()
{
    updateSortIndicator();
}


void ListCtrl::updateSortIndicator()
{
    if (provider_)
        if (const std::optional<std::pair<size_t, bool>> sortInd = provider_->getSortIndicator();
            sortInd && sortInd->first < static_cast<size_t>(GetColumnCount()))
        {
            ShowSortIndicator(static_cast<int>(sortInd->first), sortInd->second);
            return;
        }
    RemoveSortIndicator();
}


void ListCtrl::updateEmptyListMsg()
{
    const bool showMsg = provider_ && provider_->getRowCount() == 0;
    if (showMsg)
    {
        emptyListLabel_->SetLabel(provider_->getEmptyListMsg());
        emptyListLabel_->SetBackgroundColour(GetBackgroundColour());

        const wxSize labelSize = emptyListLabel_->GetBestSize();
        const int clientWidth  = getRowWindow(*this).GetClientSize().GetWidth();
#if defined(__WXMSW__) || defined(__WXQT__)
        const int posY = 2 * GetCharHeight(); //below the column header
#else
        const int posY = GetCharHeight() / 2;
#endif
        emptyListLabel_->SetSize(std::max(0, (clientWidth - labelSize.GetWidth()) / 2), posY, labelSize.GetWidth(), labelSize.GetHeight());
    }
    emptyListLabel_->Show(showMsg);
}


void ListCtrl::updateColumnWidths()
{
    if (!provider_)
        return;

    const size_t colCount = std::min<size_t>(provider_->getViewColumnCount(), GetColumnCount());

    std::vector<ColumnWidthInfo> widthInfos;
    bool haveSpaceFilling = false;
    for (size_t viewCol = 0; viewCol < colCount; ++viewCol)
    {
        ColumnWidthInfo wi = provider_->getViewColumnInfo(viewCol).widthInfo;
        wi.width = GetColumnWidth(static_cast<int>(viewCol));
        haveSpaceFilling |= wi.isSpaceFilling;
        widthInfos.push_back(wi);
    }
    if (!haveSpaceFilling)
        return;

    const std::vector<int> widths = calcSpaceFillingWidths(widthInfos, getRowWindow(*this).GetClientSize().GetWidth());

    for (size_t viewCol = 0; viewCol < colCount; ++viewCol)
        if (widthInfos[viewCol].isSpaceFilling && widths[viewCol] != widthInfos[viewCol].width)
        {
            SetColumnWidth(static_cast<int>(viewCol), widths[viewCol]);
            provider_->setViewColumnWidth(viewCol, widths[viewCol]);
        }
}


void ListCtrl::onColumnBeginDrag(wxListEvent& event)
{
    if (provider_ && event.GetColumn() >= 0 && static_cast<size_t>(event.GetColumn()) < provider_->getViewColumnCount())
    {
        const ColumnWidthInfo wi = provider_->getViewColumnInfo(event.GetColumn()).widthInfo;
        if (isFixedWidth(wi) || wi.isSpaceFilling) //space-filling columns are sized by the list
        {
            event.Veto();
            return;
        }
    }
    abortCellEdit();
    event.Skip();
}


void ListCtrl::onColumnEndDrag(wxListEvent& event)
{
    const int viewCol = event.GetColumn();

    CallAfter([this, viewCol] //native width is not yet updated
    {
        if (provider_ && 0 <= viewCol && viewCol < GetColumnCount() &&
            static_cast<size_t>(viewCol) < provider_->getViewColumnCount())
        {
            const ColumnWidthInfo wi = provider_->getViewColumnInfo(viewCol).widthInfo;
            const int width   = GetColumnWidth(viewCol);
            const int bounded = calcBoundedWidth(width, wi.minimumWidth, wi.maximumWidth);
            if (bounded != width)
                SetColumnWidth(viewCol, bounded);

            provider_->setViewColumnWidth(viewCol, bounded);
            updateColumnWidths();
        }
    });
    event.Skip();
}


std::optional<size_t> ListCtrl::getRowAt(const wxPoint& posClient) const
{
    int flags = 0;
    const long row = HitTest(posClient, flags);
    if (row >= 0 && (flags & wxLIST_HITTEST_ONITEM) && provider_ && static_cast<size_t>(row) < provider_->getRowCount())
        return row;
    return {};
}


std::optional<size_t> ListCtrl::getViewColumnAt(size_t row, int xClient) const
{
    const int colCount = GetColumnCount();
    for (int viewCol = colCount - 1; viewCol >= 0; --viewCol) //column 0 last: some backends report the full row for it
    {
        wxRect rect;
        if (GetSubItemRect(static_cast<long>(row), viewCol, rect) &&
            rect.GetLeft() <= xClient && xClient <= rect.GetRight())
            return viewCol;
    }
    return {};
}


ptrdiff_t ListCtrl::getFocusedRow() const
{
    return GetNextItem(-1, wxLIST_NEXT_ALL, wxLIST_STATE_FOCUSED);
}


void ListCtrl::onMouseLeftDown(wxMouseEvent& event)
{
    if (activeEdit_ && !finishCellEdit(true /*commit*/))
        return; //keep the editor until its value is valid

    if (provider_)
        if (const std::optional<size_t> row = getRowAt(event.GetPosition()))
            if (const std::optional<size_t> viewCol = getViewColumnAt(*row, event.GetPosition().x))
                switch (provider_->getRowKind(*row))
                {
                    case RowKind::groupHeader:
                        if (*viewCol == 0)
                        {
                            wxRect rect;
                            if (GetSubItemRect(static_cast<long>(*row), 0, rect) &&
                                event.GetPosition().x < rect.GetLeft() + imageList_->GetSize().GetWidth() + FromDIP(4)) //click on expander
                            {
                                provider_->toggleGroupExpansion(*row);
                                return;
                            }
                        }
                        break;

                    case RowKind::blank:
                        return;

                    case RowKind::object:
                        if (const std::optional<size_t> checkCol = provider_->getCheckViewColumn();
                            checkCol && *checkCol == *viewCol && provider_->getCheckState(*row))
                        {
                            provider_->handleCheckClick(*row);
                            return; //keep selection as is
                        }

                        if (shouldStartEditOnClick(editMode_, {*viewCol, false /*doubleClick*/, event.AltDown(), event.ControlDown(), event.ShiftDown()}) &&
                            provider_->isCellEditable(*row, *viewCol))
                        {
                            const size_t rowEdit = *row;
                            const size_t colEdit = *viewCol;
                            CallAfter([this, rowEdit, colEdit] { startCellEdit(rowEdit, colEdit); }); //after native selection handling
                        }
                        break;
                }
    event.Skip();
}


void ListCtrl::onMouseLeftDouble(wxMouseEvent& event)
{
    if (provider_ && !activeEdit_)
        if (const std::optional<size_t> row = getRowAt(event.GetPosition()))
            switch (provider_->getRowKind(*row))
            {
                case RowKind::groupHeader:
                    provider_->toggleGroupExpansion(*row);
                    return;

                case RowKind::blank:
                    return;

                case RowKind::object:
                    if (const std::optional<size_t> viewCol = getViewColumnAt(*row, event.GetPosition().x))
                        if (shouldStartEditOnClick(editMode_, {*viewCol, true /*doubleClick*/, event.AltDown(), event.ControlDown(), event.ShiftDown()}))
                            if (startCellEdit(*row, *viewCol))
                                return;
                    break;
            }
    event.Skip();
}


void ListCtrl::onKeyDown(wxKeyEvent& event)
{
    if (!provider_ || activeEdit_)
    {
        event.Skip();
        return;
    }

    int keyCode = event.GetKeyCode();
    if (GetLayoutDirection() == wxLayout_RightToLeft)
    {
        if (keyCode == WXK_LEFT || keyCode == WXK_NUMPAD_LEFT)
            keyCode = WXK_RIGHT;
        else if (keyCode == WXK_RIGHT || keyCode == WXK_NUMPAD_RIGHT)
            keyCode = WXK_LEFT;
    }

    const ptrdiff_t focusedRow = getFocusedRow();
    const bool haveFocusedRow = 0 <= focusedRow && static_cast<size_t>(focusedRow) < provider_->getRowCount();

    if (event.ControlDown())
        switch (keyCode)
        {
            case 'A':
                provider_->selectAllRows();
                syncSelectionToNative();
                return;

            case 'C':
            case WXK_INSERT: //CTRL + C || CTRL + INS
                copySelectionToClipboard();
                return;
        }

    switch (keyCode)
    {
        case WXK_F2:
            if (shouldStartEditOnF2(editMode_) && haveFocusedRow && provider_->getRowKind(focusedRow) == RowKind::object)
            {
                if (provider_->getViewColumnCount() > 0 && provider_->isCellEditable(focusedRow, 0))
                    startCellEdit(focusedRow, 0);
                else if (const std::optional<size_t> viewCol = getNextEditableViewColumn(focusedRow, 0, true /*forward*/))
                    startCellEdit(focusedRow, *viewCol);
                return;
            }
            break;

        case WXK_LEFT:
        case WXK_NUMPAD_LEFT:
        case WXK_RIGHT:
        case WXK_NUMPAD_RIGHT:
            if (haveFocusedRow && provider_->getRowKind(focusedRow) == RowKind::groupHeader)
            {
                provider_->setGroupExpanded(focusedRow, keyCode == WXK_RIGHT || keyCode == WXK_NUMPAD_RIGHT);
                return;
            }
            break;

        case WXK_SPACE:
            if (haveFocusedRow && provider_->getCheckViewColumn() && provider_->getCheckState(focusedRow))
            {
                provider_->handleCheckClick(focusedRow);
                return;
            }
            break;
    }
    event.Skip();
}


void ListCtrl::onChar(wxKeyEvent& event)
{
    const wxChar c = event.GetUnicodeKey();

    if (!provider_ || activeEdit_ || c == WXK_NONE || c < 32 || event.ControlDown() || event.AltDown())
    {
        event.Skip();
        return;
    }

    const std::wstring& prefix = typingSearch_.addChar(c, std::chrono::steady_clock::now());
    if (prefix == L" ") //space is a command key unless part of a prefix
    {
        typingSearch_.clear();
        event.Skip();
        return;
    }

    const ptrdiff_t row = provider_->findRowByPrefix(prefix, getFocusedRow());
    if (row < 0)
    {
        wxBell();
        return;
    }

    {
        syncingSelection_ = true;
        OLV_ON_SCOPE_EXIT(syncingSelection_ = false);

        SetItemState(-1, 0, wxLIST_STATE_SELECTED);
        SetItemState(row, wxLIST_STATE_SELECTED | wxLIST_STATE_FOCUSED, wxLIST_STATE_SELECTED | wxLIST_STATE_FOCUSED);
        EnsureVisible(row);
    }
    provider_->setSelectedRows({static_cast<size_t>(row)});
}


void ListCtrl::onNativeSelectionChanged()
{
    if (!provider_ || activeEdit_)
        return;

    std::vector<size_t> rows;
    for (long row = GetNextItem(-1, wxLIST_NEXT_ALL, wxLIST_STATE_SELECTED);
         row >= 0;
         row = GetNextItem(row, wxLIST_NEXT_ALL, wxLIST_STATE_SELECTED))
        rows.push_back(row);

    provider_->setSelectedRows(rows);
}


void ListCtrl::syncSelectionToNative()
{
    if (!provider_)
        return;

    syncingSelection_ = true;
    OLV_ON_SCOPE_EXIT(syncingSelection_ = false);

    const size_t rowCount = GetItemCount();

    SetItemState(-1, 0, wxLIST_STATE_SELECTED);
    for (const size_t row : provider_->getSelectedRows())
        if (row < rowCount)
            SetItemState(row, wxLIST_STATE_SELECTED, wxLIST_STATE_SELECTED);
}


void ListCtrl::copySelectionToClipboard()
{
    if (!provider_)
        return;

    const ClipboardContent content = provider_->copySelection();
    if (content.text.empty())
        return;

    wxClipboard& clip = *wxClipboard::Get();
    if (clip.Open())
    {
        OLV_ON_SCOPE_EXIT(clip.Close());

        auto dataObj = new wxDataObjectComposite(); //ownership passed
        dataObj->Add(new wxHTMLDataObject(content.html));
        dataObj->Add(new wxTextDataObject(content.text), true /*preferred*/);

        if (!clip.SetData(dataObj))
            logExtraError(_("Cannot copy the selected rows to the clipboard."));
    }
    else
        logExtraError(_("Cannot open the clipboard."));
}


std::optional<size_t> ListCtrl::getNextEditableViewColumn(size_t row, size_t viewCol, bool forward) const
{
    //walk the columns the way the user sees them
    const std::vector<size_t> order = provider_->getViewColumnOrder();

    std::vector<bool> editable;
    std::optional<size_t> pos;
    for (size_t i = 0; i < order.size(); ++i)
    {
        editable.push_back(provider_->isCellEditable(row, order[i]));
        if (order[i] == viewCol)
            pos = i;
    }
    if (!pos)
        return {};

    if (const std::optional<size_t> nextPos = getNextEditableColumn(editable, *pos, forward))
        return order[*nextPos];
    return {};
}


bool ListCtrl::startCellEdit(size_t row, size_t viewCol)
{
    if (!provider_ || editMode_ == CellEditMode::none)
        return false;

    if (activeEdit_ && !finishCellEdit(true /*commit*/))
        return false;

    if (row     >= provider_->getRowCount() ||
        viewCol >= provider_->getViewColumnCount() ||
        !provider_->isCellEditable(row, viewCol))
        return false;

    EnsureVisible(row);

    wxRect cellBounds;
    if (!GetSubItemRect(static_cast<long>(row), static_cast<long>(viewCol), cellBounds))
        return false;

    const std::vector<size_t> savedSelection = provider_->getSelectedRows();
    const Value cellValue = provider_->getCellValue(row, viewCol);

    CellEditor* editor = CellEditorRegistry::instance().createEditor(provider_->getEditorKind(row, viewCol), getRowWindow(*this));
    editor->getWindow().Hide();

    CellEditEvent startEvent(EVENT_OLV_CELL_EDIT_STARTING, row, viewCol, cellValue, cellBounds, editor);
    GetEventHandler()->ProcessEvent(startEvent);

    if (startEvent.newEditor_ && startEvent.newEditor_ != editor)
    {
        editor->getWindow().Destroy();
        editor = startEvent.newEditor_;
    }

    if (!startEvent.IsAllowed())
    {
        editor->getWindow().Destroy();
        return false;
    }

    wxWindow& editorWin = editor->getWindow();
    if (startEvent.shouldConfigureEditor_)
    {
        editor->setValue(startEvent.cellValue_);
        editorWin.SetSize(startEvent.cellBounds_);
    }

    editorWin.Bind(wxEVT_CHAR_HOOK,  [this](wxKeyEvent& event) { onEditorKey(event); });
    editorWin.Bind(wxEVT_KILL_FOCUS, [this](wxFocusEvent& event)
    {
        CallAfter([this] { onEditorKillFocus(); }); //focus has not yet moved
        event.Skip();
    });

    activeEdit_ = CellEdit{editor, row, viewCol, startEvent.cellBounds_, cellValue, savedSelection};

    editorWin.Show();
    editorWin.SetFocus();
    editor->selectAll();
    return true;
}


bool ListCtrl::finishCellEdit(bool commit)
{
    if (!activeEdit_)
        return true;
    if (finishingEdit_)
        return false;

    finishingEdit_ = true;
    OLV_ON_SCOPE_EXIT(finishingEdit_ = false);

    Value newValue = activeEdit_->initialValue;
    if (commit)
        try
        {
            newValue = activeEdit_->editor->getValue(); //throw ParseError
        }
        catch (const ParseError& e)
        {
            activeEdit_->editor->getWindow().SetToolTip(e.toString());
            wxBell();
            return false;
        }

    CellEditEvent finishEvent(EVENT_OLV_CELL_EDIT_FINISHING, activeEdit_->row, activeEdit_->viewCol, newValue, activeEdit_->bounds, activeEdit_->editor);
    finishEvent.userCancelled_ = !commit;
    GetEventHandler()->ProcessEvent(finishEvent);

    if (commit && !finishEvent.IsAllowed())
        return false; //continue editing

    const CellEdit edit = std::move(*activeEdit_);
    activeEdit_.reset();

    wxWindow& editorWin = edit.editor->getWindow();
    editorWin.Hide();
    editorWin.Destroy();

    if (provider_)
    {
        provider_->setSelectedRows(edit.savedSelection); //rows are still valid: row changes abort the edit
        syncSelectionToNative();

        if (commit && !finishEvent.userCancelled_)
            try
            {
                provider_->setCellValue(edit.row, edit.viewCol, finishEvent.cellValue_); //throw ValueConversionError
            }
            catch (const ValueConversionError& e) { logExtraError(e.toString()); }

        if (edit.row < static_cast<size_t>(GetItemCount()))
            RefreshItem(edit.row);
    }

    SetFocus();
    return true;
}


void ListCtrl::abortCellEdit()
{
    if (activeEdit_)
    {
        wxWindow& editorWin = activeEdit_->editor->getWindow();
        activeEdit_.reset();

        editorWin.Hide();
        editorWin.Destroy();
    }
}


void ListCtrl::moveCellEdit(bool forward)
{
    if (!activeEdit_ || !provider_)
        return;

    const size_t row = activeEdit_->row;
    if (const std::optional<size_t> nextCol = getNextEditableViewColumn(row, activeEdit_->viewCol, forward))
    {
        if (finishCellEdit(true /*commit*/))
            startCellEdit(row, *nextCol);
    }
    else
        finishCellEdit(true);
}


void ListCtrl::onEditorKey(wxKeyEvent& event)
{
    switch (event.GetKeyCode())
    {
        case WXK_RETURN:
        case WXK_NUMPAD_ENTER:
            finishCellEdit(true /*commit*/);
            return;

        case WXK_ESCAPE:
            finishCellEdit(false /*commit*/);
            return;

        case WXK_TAB:
            moveCellEdit(!event.ShiftDown());
            return;
    }
    event.Skip();
}


void ListCtrl::onEditorKillFocus()
{
    if (!activeEdit_ || finishingEdit_)
        return;

    wxWindow& editorWin = activeEdit_->editor->getWindow();
    wxWindow* focus = wxWindow::FindFocus();
    if (focus == &editorWin || (focus && editorWin.IsDescendant(focus))) //e.g. drop-down of a date picker
        return;

    if (!finishCellEdit(true /*commit*/))
        finishCellEdit(false); //invalid input: nowhere to show the error once focus has moved
}
