// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef I18N_H_7204519836310487265
#define I18N_H_7204519836310487265

#include <memory>
#include <mutex>
#include <string>
#include <cstdint>


//translation layer for all user-visible texts of the list widgets - no toolkit dependencies!

#define OLV_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        olv::translate(OLV_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) olv::translate(OLV_TRANS_CONCAT_SUB(L, s), OLV_TRANS_CONCAT_SUB(L, p), n)
//plural forms use %x as number placeholder

namespace olv
{
struct TranslationHandler
{
    //THREAD-SAFETY: "const" member must model thread-safe access!
    TranslationHandler() {}
    virtual ~TranslationHandler() {}

    virtual std::wstring translate(const std::wstring& text) const = 0;
    virtual std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const = 0;

private:
    TranslationHandler           (const TranslationHandler&) = delete;
    TranslationHandler& operator=(const TranslationHandler&) = delete;
};

void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler); //take ownership
std::shared_ptr<const TranslationHandler> getTranslator();








//######################## implementation ##############################
namespace impl
{
struct GlobalTranslator
{
    std::mutex lock;
    std::shared_ptr<const TranslationHandler> handler;
};

inline GlobalTranslator& globalTranslator()
{
    static GlobalTranslator inst; //function-local static: usable during static initialization of other translation units
    return inst;
}
}


inline
std::shared_ptr<const TranslationHandler> getTranslator()
{
    impl::GlobalTranslator& gt = impl::globalTranslator();
    std::lock_guard dummy(gt.lock);
    return gt.handler;
}


inline
void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler)
{
    impl::GlobalTranslator& gt = impl::globalTranslator();
    std::lock_guard dummy(gt.lock);
    gt.handler = std::move(newHandler);
}


inline
std::wstring translate(const std::wstring& text)
{
    if (std::shared_ptr<const TranslationHandler> t = getTranslator()) //temporarily take (shared) ownership while using the interface!
        return t->translate(text);
    return text;
}


//translate plural forms: "%x item" "%x items"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    if (std::shared_ptr<const TranslationHandler> t = getTranslator())
        return t->translate(singular, plural, n64);

    //fallback:
    std::wstring out = (n64 == 1 || n64 == -1) ? singular : plural;
    const std::wstring number = std::to_wstring(n64);
    for (size_t pos = out.find(L"%x"); pos != std::wstring::npos; pos = out.find(L"%x", pos + number.size()))
        out.replace(pos, 2, number);
    return out;
}
}

#endif //I18N_H_7204519836310487265
