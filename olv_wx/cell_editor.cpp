// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include "cell_editor.h"
#include <wx/datetime.h>
#include <wx/valtext.h>

using namespace olv;


namespace
{
long getTextStyle(EditorKind kind)
{
    switch (kind)
    {
        case EditorKind::integer:
        case EditorKind::floating:
            return wxTE_PROCESS_ENTER | wxTE_RIGHT;
        default:
            return wxTE_PROCESS_ENTER | wxTE_LEFT;
    }
}


//empty char list: no filtering
const wchar_t* getCharIncludes(EditorKind kind)
{
    switch (kind)
    {
        case EditorKind::integer:
            return L"0123456789-+";
        case EditorKind::floating:
            return L"0123456789-+.eE";
        default:
            return L"";
    }
}
}
}


TextCellEditor::TextCellEditor(wxWindow* parent, EditorKind kind) :
    wxTextCtrl(parent, wxID_ANY, wxString(), wxDefaultPosition, wxDefaultSize, getTextStyle(kind)),
    kind_(kind)
{
    if (const wchar_t* charIncludes = getCharIncludes(kind);
        *charIncludes != L'\0')
    {
        wxTextValidator validator(wxFILTER_INCLUDE_CHAR_LIST);
        validator.SetCharIncludes(charIncludes);
        SetValidator(validator); //validator is copied
    }
}


void TextCellEditor::setValue(const Value& v)
{
    ChangeValue(toDisplayString(v));
}


BooleanCellEditor::BooleanCellEditor(wxWindow* parent) : wxChoice(parent, wxID_ANY)
{
    Append(_("True"));
    Append(_("False"));
    SetSelection(0);
}


void BooleanCellEditor::setValue(const Value& v)
{
    const bool* b = v.get<bool>();
    SetSelection(b && !*b ? 1 : 0);
}


DateCellEditor::DateCellEditor(wxWindow* parent) :
    wxDatePickerCtrl(parent, wxID_ANY, wxDefaultDateTime, wxDefaultPosition, wxDefaultSize, wxDP_DROPDOWN | wxDP_SHOWCENTURY | wxDP_ALLOWNONE) {}


void DateCellEditor::setValue(const Value& v)
{
    std::optional<Date> date;
    if (const Date* d = v.get<Date>())
        date = *d;
    else if (const DateTime* dt = v.get<DateTime>())
        date = dt->date;

    if (date)
        SetValue(wxDateTime(static_cast<wxDateTime::wxDateTime_t>(date->day),
                            static_cast<wxDateTime::Month>(date->month - 1), date->year));
    else
        SetValue(wxDefaultDateTime); //wxDP_ALLOWNONE: no date
}


Value DateCellEditor::getValue() const
{
    const wxDateTime dt = GetValue();
    if (!dt.IsValid())
        return Value();

    return Date{dt.GetYear(), static_cast<int>(dt.GetMonth()) + 1, static_cast<int>(dt.GetDay())};
}


CellEditorRegistry& CellEditorRegistry::instance()
{
    static CellEditorRegistry inst;
    return inst;
}


CellEditorRegistry::CellEditorRegistry()
{
    auto textCreator = [](EditorKind kind)
    {
        return [kind](wxWindow& parent) -> CellEditor* { return new TextCellEditor(&parent, kind); };
    };

    creators_[EditorKind::boolean ] = [](wxWindow& parent) -> CellEditor* { return new BooleanCellEditor(&parent); };
    creators_[EditorKind::integer ] = textCreator(EditorKind::integer);
    creators_[EditorKind::floating] = textCreator(EditorKind::floating);
    creators_[EditorKind::text    ] = textCreator(EditorKind::text);
    creators_[EditorKind::date    ] = [](wxWindow& parent) -> CellEditor* { return new DateCellEditor(&parent); };
    creators_[EditorKind::time    ] = textCreator(EditorKind::time);
    creators_[EditorKind::dateTime] = textCreator(EditorKind::dateTime);
}


CellEditor* CellEditorRegistry::createEditor(EditorKind kind, wxWindow& parent) const
{
    if (auto it = creators_.find(kind);
        it != creators_.end() && it->second)
        return it->second(parent);

    return new TextCellEditor(&parent, EditorKind::text);
}
