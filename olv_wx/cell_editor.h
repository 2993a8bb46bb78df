// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef CELL_EDITOR_H_7402918365019283746
#define CELL_EDITOR_H_7402918365019283746

#include <functional>
#include <map>
#include <wx/choice.h>
#include <wx/datectrl.h>
#include <wx/textctrl.h>
#include <olv/cell_edit.h>


namespace olv
{
/*  transient input control placed over a cell while it is edited
    lifetime: like any wxWindow, destroy via getWindow().Destroy()       */
class CellEditor
{
public:
    virtual ~CellEditor() {}

    virtual wxWindow& getWindow() = 0;

    virtual void  setValue(const Value& v) = 0;
    virtual Value getValue() const = 0; //throw ParseError

    virtual void selectAll() {}
};


//text based editor for text, numbers, times and date/times typed as text
class TextCellEditor : public wxTextCtrl, public CellEditor
{
public:
    TextCellEditor(wxWindow* parent, EditorKind kind);

    wxWindow& getWindow() override { return *this; }

    void  setValue(const Value& v) override;
    Value getValue() const override { return parseEditorText(kind_, GetValue().ToStdWstring()); } //throw ParseError

    void selectAll() override { SelectAll(); }

private:
    const EditorKind kind_;
};


class BooleanCellEditor : public wxChoice, public CellEditor
{
public:
    explicit BooleanCellEditor(wxWindow* parent);

    wxWindow& getWindow() override { return *this; }

    void  setValue(const Value& v) override;
    Value getValue() const override { return GetSelection() == 0; }
};


class DateCellEditor : public wxDatePickerCtrl, public CellEditor
{
public:
    explicit DateCellEditor(wxWindow* parent);

    wxWindow& getWindow() override { return *this; }

    void  setValue(const Value& v) override;
    Value getValue() const override;
};


//map cell value kinds to editor factories; applications may replace the default editors
class CellEditorRegistry
{
public:
    using EditorCreator = std::function<CellEditor*(wxWindow& parent)>; //ownership: wxWidgets parent-child

    static CellEditorRegistry& instance();

    void registerCreator(EditorKind kind, const EditorCreator& creator) { creators_[kind] = creator; }
    CellEditor* createEditor(EditorKind kind, wxWindow& parent) const; //falls back to text editor

private:
    CellEditorRegistry();
    CellEditorRegistry           (const CellEditorRegistry&) = delete;
    CellEditorRegistry& operator=(const CellEditorRegistry&) = delete;

    std::map<EditorKind, EditorCreator> creators_;
};
}

#endif //CELL_EDITOR_H_7402918365019283746
