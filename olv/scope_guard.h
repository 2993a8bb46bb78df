// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_6602918374650128343
#define SCOPE_GUARD_H_6602918374650128343

#include <cstring>
#include <exception>
#include <type_traits>
#include <utility>
#include "error.h"
#include "error_log.h"


namespace olv
{
/*  Scope Guard

        auto guardEdit = olv::makeGuard<ScopeGuardRunMode::onFail>([&] { restoreSelection(); });
            ...
        guardEdit.dismiss();

    Scope Exit:
        OLV_ON_SCOPE_EXIT(inUpdate_ = false);
        OLV_ON_SCOPE_FAIL(rollback());                       */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onExit)
        {
            if (!failed)
                fun_(); //throw X
            else
                runNoThrow(); //exception already in flight
        }
        else if (failed)
            runNoThrow();
    }

    void dismiss() { dismissed_ = true; }

private:
    void runNoThrow() noexcept
    {
        try { fun_(); }
        catch (const OlvError& e) { logExtraError(e.toString()); }
        catch (const std::exception& e) { logExtraError(_("Cleanup failed.") + L' ' + std::wstring(e.what(), e.what() + std::strlen(e.what()))); }
    }

    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define OLV_CONCAT_SUB(X, Y) X ## Y
#define OLV_CONCAT(X, Y) OLV_CONCAT_SUB(X, Y)

#define OLV_ON_SCOPE_EXIT(X) [[maybe_unused]] auto OLV_CONCAT(scopeGuard, __LINE__) = olv::makeGuard<olv::ScopeGuardRunMode::onExit>([&]{ X; });
#define OLV_ON_SCOPE_FAIL(X) [[maybe_unused]] auto OLV_CONCAT(scopeGuard, __LINE__) = olv::makeGuard<olv::ScopeGuardRunMode::onFail>([&]{ X; });

#endif //SCOPE_GUARD_H_6602918374650128343
