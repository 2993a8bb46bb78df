// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef CELL_EDIT_H_2281930475610293856
#define CELL_EDIT_H_2281930475610293856

#include <functional>
#include <optional>
#include <vector>
#include "column.h"
#include "error.h"


namespace olv
{
enum class CellEditMode
{
    none,
    singleClick,
    doubleClick,
    f2Only,
};

struct MouseClick
{
    size_t col = 0;
    bool doubleClick = false;
    bool altDown     = false;
    bool controlDown = false;
    bool shiftDown   = false;
};

bool shouldStartEditOnClick(CellEditMode mode, const MouseClick& click);
bool shouldStartEditOnF2   (CellEditMode mode);

//cycle through the columns starting after "col", wrapping at the edges; none if no other column is editable
std::optional<size_t> getNextEditableColumn(const std::vector<bool>& editable /*and visible*/, size_t col, bool forward);

std::optional<EditorKind> getEditorKindForValue(const Value& v); //none for null and records

const size_t EDITOR_GUESS_MAX_ROWS = 1000;

/*  editor of a cell: 1. column override 2. kind of the cell value
    3. kind of the first non-null value of the column within the first EDITOR_GUESS_MAX_ROWS rows  4. text     */
EditorKind selectEditorKind(const std::optional<EditorKind>& columnOverride, const Value& cellValue,
                            size_t rowCount, const std::function<Value(size_t row)>& getColumnValue);

//convert editor text into a cell value: empty text => null
Value parseEditorText(EditorKind kind, const std::wstring& text); //throw ParseError
}

#endif //CELL_EDIT_H_2281930475610293856
