// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef STRING_TOOLS_H_4518802753619036842
#define STRING_TOOLS_H_4518802753619036842

#include <compare>
#include <cwchar>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//string helpers for cell texts: wchar_t holds a full Unicode code point on the supported platforms
namespace olv
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> Char asciiToLower(Char c);
template <class Char> Char asciiToUpper(Char c);

bool startsWith(std::wstring_view str, std::wstring_view prefix);
bool endsWith  (std::wstring_view str, std::wstring_view postfix);
bool contains  (std::wstring_view str, std::wstring_view term);

//Unicode-aware, locale-independent case folding (upper case)
std::wstring getUpperCase(std::wstring_view str);
wchar_t      getUpperCase(wchar_t c);

std::weak_ordering compareNoCase(std::wstring_view lhs, std::wstring_view rhs);
bool equalNoCase     (std::wstring_view lhs, std::wstring_view rhs);
bool startsWithNoCase(std::wstring_view str, std::wstring_view prefix);
bool containsNoCase  (std::wstring_view str, std::wstring_view term);

enum class TrimSide
{
    both,
    left,
    right,
};
[[nodiscard]] std::wstring trimCpy(std::wstring_view str, TrimSide side = TrimSide::both);

enum class SplitOnEmpty
{
    allow,
    skip
};
[[nodiscard]] std::vector<std::wstring> splitCpy(std::wstring_view str, wchar_t delimiter, SplitOnEmpty soe);

[[nodiscard]] std::wstring replaceCpy(std::wstring str, std::wstring_view oldTerm, std::wstring_view newTerm);

//format a single number using std::swprintf(); returns std::nullopt for an invalid format string
template <class Num> std::optional<std::wstring> printNumber(const std::wstring& format, const Num& number);






//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ')  || c == static_cast<Char>('\t') || c == static_cast<Char>('\n') ||
           c == static_cast<Char>('\r') || c == static_cast<Char>('\v') || c == static_cast<Char>('\f') ||
           static_cast<unsigned int>(c) == 0xa0; //NBSP
}


template <class Char> inline
bool isDigit(Char c) //similar to implementation of std::isdigit()!
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class Char> inline
Char asciiToUpper(Char c)
{
    if (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'))
        return static_cast<Char>(c - static_cast<Char>('a') + static_cast<Char>('A'));
    return c;
}


inline bool startsWith(std::wstring_view str, std::wstring_view prefix) { return str.starts_with(prefix); }
inline bool endsWith  (std::wstring_view str, std::wstring_view postfix) { return str.ends_with(postfix); }
inline bool contains  (std::wstring_view str, std::wstring_view term) { return str.find(term) != std::wstring_view::npos; }


template <class Num> inline
std::optional<std::wstring> printNumber(const std::wstring& format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);

    wchar_t buffer[128]; //zero-initialize?
    const int charsWritten = std::swprintf(buffer, std::size(buffer), format.c_str(), number);
    if (charsWritten < 0 || charsWritten >= static_cast<int>(std::size(buffer)))
        return std::nullopt;
    return std::wstring(buffer, charsWritten);
}
}

#endif //STRING_TOOLS_H_4518802753619036842
