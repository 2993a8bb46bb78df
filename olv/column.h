// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef COLUMN_H_8830124576092318476
#define COLUMN_H_8830124576092318476

#include <optional>
#include "aspect.h"
#include "column_layout.h"


namespace olv
{
enum class ColumnAlignment
{
    left,
    centre,
    right,
};
ColumnAlignment parseAlignment(const std::wstring& align); //"left", "centre"/"center", "right"; anything else => left


//kinds of default cell editors: see CellEditorRegistry
enum class EditorKind
{
    boolean,
    integer,
    floating,
    text,
    date,
    time,
    dateTime,
};


using StringConverter = std::function<std::wstring(const Value& v)>;


//image of a cell: none, fixed image index, computed by callable or by aspect
template <class T>
class ImageGetter
{
public:
    ImageGetter() {}
    ImageGetter(int imageIndex) : munger_(imageIndex) {}
    ImageGetter(const Aspect<T>& aspect) : munger_(aspect) {}
    template <class F, std::enable_if_t<std::is_invocable_r_v<int, const F&, const T&>, int> = 0>
    ImageGetter(F fun) : munger_(Aspect<T>(std::function<Value(const T&)>([fun](const T& obj) { return Value(fun(obj)); }))) {}
    ImageGetter(const wchar_t* path) : munger_(Aspect<T>(path)) {}

    int getImage(const T& obj) const //-1: no image
    {
        if (const int* imageIndex = std::get_if<int>(&munger_))
            return *imageIndex;
        if (const Aspect<T>* aspect = std::get_if<Aspect<T>>(&munger_))
            if (const std::optional<int64_t> n = getInteger(aspect->get(obj)))
                return static_cast<int>(*n);
        return -1;
    }

private:
    std::variant<std::monostate, int, Aspect<T>> munger_;
};


//"ColumnDefn": how one column derives its texts, images, group keys and check states from a model object of type T
template <class T>
struct ColumnDefn
{
    ColumnDefn() {}
    ColumnDefn(const std::wstring& titleIn, ColumnAlignment alignIn, int widthIn, const Aspect<T>& valueGetterIn, const std::wstring& format = std::wstring()) :
        title(titleIn), align(alignIn), width(widthIn), valueGetter(valueGetterIn), stringFormat(format) {}

    std::wstring    title = L"title";
    ColumnAlignment align = ColumnAlignment::left;
    int width = -1; //-1: autosize
    int minimumWidth = -1; //-1: no limit
    int maximumWidth = -1; //
    bool isSpaceFilling = false;
    int freeSpaceProportion = 1;
    bool isVisible = true;

    Aspect<T>       valueGetter;
    AspectSetter<T> valueSetter;
    ImageGetter<T>  imageGetter;
    std::wstring    stringFormat;    //printf/strftime style, used when no stringConverter is set
    StringConverter stringConverter;

    bool isEditable = true;
    std::optional<EditorKind> cellEditorKind; //override editor guessed from the cell value

    bool isSearchable = true;
    std::optional<bool> useBinarySearch; //default: only if list is sorted by this column and no grouping is active

    Aspect<T>       groupKeyGetter;
    StringConverter groupKeyConverter;
    bool useInitialLetterForGroupKey = false;
    std::wstring groupTitleSingleItem;  //"%x" placeholder: item count; empty: "%x item"
    std::wstring groupTitlePluralItems; //                              empty: "%x items"

    std::function<bool(const T& obj)>              checkStateGetter;
    std::function<void(T& obj, bool checked)>      checkStateSetter;

    //---------------------------------------------------------------------
    Value getValue(const T& obj) const { return valueGetter.get(obj); }

    std::wstring getStringValue(const T& obj) const { return valueToString(getValue(obj)); }

    std::wstring valueToString(const Value& v) const
    {
        if (stringConverter)
            return stringConverter(v);
        if (!stringFormat.empty())
            return formatValue(stringFormat, v);
        return toDisplayString(v);
    }

    int getImage(const T& obj) const { return imageGetter.getImage(obj); }

    //false if the value could not be written: no setter, read-only aspect, callable getter
    bool setValue(T& obj, const Value& v) const //throw ValueConversionError
    {
        if (!valueSetter.empty())
            return valueSetter.set(obj, v);
        return valueGetter.set(obj, v);
    }

    int calcBoundedWidth(int w) const { return olv::calcBoundedWidth(w, minimumWidth, maximumWidth); } //w < 0: special meaning, returned as is

    bool isFixedWidth() const { return minimumWidth != -1 && maximumWidth != -1 && minimumWidth >= maximumWidth; }

    void setFixedWidth(int w) { width = minimumWidth = maximumWidth = w; }

    //--------------------------- grouping -------------------------------
    Value getGroupKey(const T& obj) const
    {
        const Value key = groupKeyGetter.empty() ? getValue(obj) : groupKeyGetter.get(obj);

        if (useInitialLetterForGroupKey)
        {
            const std::wstring text = valueToString(key);
            return text.empty() ? std::wstring() : std::wstring(1, getUpperCase(text[0]));
        }
        return key;
    }

    std::wstring getGroupKeyAsString(const Value& groupKey) const
    {
        if (groupKeyConverter)
            return groupKeyConverter(groupKey);
        if (useInitialLetterForGroupKey)
            return toDisplayString(groupKey);
        return valueToString(groupKey);
    }

    std::wstring getGroupTitle(const std::wstring& keyText, size_t itemCount, bool showItemCount) const
    {
        if (!showItemCount)
            return keyText;

        if (itemCount == 1 && !groupTitleSingleItem.empty())
            return replaceCpy(replaceCpy(groupTitleSingleItem, L"%title%", keyText), L"%x", std::to_wstring(itemCount));
        if (itemCount != 1 && !groupTitlePluralItems.empty())
            return replaceCpy(replaceCpy(groupTitlePluralItems, L"%title%", keyText), L"%x", std::to_wstring(itemCount));

        return keyText + L" (" + _P("%x item", "%x items", itemCount) + L')';
    }

    //--------------------------- check state ----------------------------
    bool hasCheckState() const { return static_cast<bool>(checkStateGetter); }
};


inline
ColumnAlignment parseAlignment(const std::wstring& align)
{
    if (equalNoCase(align, L"centre") || equalNoCase(align, L"center"))
        return ColumnAlignment::centre;
    if (equalNoCase(align, L"right"))
        return ColumnAlignment::right;
    return ColumnAlignment::left;
}
}

#endif //COLUMN_H_8830124576092318476
