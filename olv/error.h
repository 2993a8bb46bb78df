// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef ERROR_H_5801736428016392817
#define ERROR_H_5801736428016392817

#include <string>
#include "i18n.h" //not used by this header, but the "rest of the world" needs it!


namespace olv
{
class OlvError //high-level exception class giving detailed context information for end users
{
public:
    explicit OlvError(const std::wstring& msg) : msg_(msg) {}
    OlvError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~OlvError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_OLV_ERROR(X) struct X : public olv::OlvError { X(const std::wstring& msg) : OlvError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : OlvError(msg, descr) {} };

DEFINE_NEW_OLV_ERROR(ParseError)           //text cannot be converted into a cell value
DEFINE_NEW_OLV_ERROR(ValueConversionError) //cell value has wrong kind for the target aspect
DEFINE_NEW_OLV_ERROR(ColumnStateError)     //corrupted column state blob


inline std::wstring fmtText(const std::wstring& text) { return L'"' + text + L'"'; }
}

#endif //ERROR_H_5801736428016392817
