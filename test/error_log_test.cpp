// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#include <stdexcept>
#include <gtest/gtest.h>
#include <olv/error_log.h>
#include <olv/i18n.h>
#include <olv/scope_guard.h>
#include <olv/typing_search.h>

using namespace olv;
using namespace std::chrono_literals;


TEST(ErrorLog, Stats)
{
    ErrorLog log;
    logMsg(log, L"started", MSG_TYPE_INFO);
    logMsg(log, L"slow", MSG_TYPE_WARNING);
    logMsg(log, L"failed", MSG_TYPE_ERROR);
    logMsg(log, L"failed again", MSG_TYPE_ERROR);

    const ErrorLogStats stats = getStats(log);
    EXPECT_EQ(stats.info,    1);
    EXPECT_EQ(stats.warning, 1);
    EXPECT_EQ(stats.error,   2);
}


TEST(ErrorLog, FormatMessage)
{
    const LogEntry entry{0, MSG_TYPE_ERROR, L"line1\n\nline2"};
    const std::wstring msg = formatMessage(entry);

    const size_t prefixLen = msg.find(L"line1");
    ASSERT_NE(prefixLen, std::wstring::npos);
    EXPECT_NE(msg.find(L"Error:  "), std::wstring::npos);
    EXPECT_EQ(msg.substr(prefixLen), L"line1\n" + std::wstring(prefixLen, L' ') + L"line2\n");
}


TEST(ErrorLog, ExtraLog)
{
    fetchExtraLog();

    logExtraError(L"cell text failed");
    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, MSG_TYPE_ERROR);
    EXPECT_EQ(log[0].message, L"cell text failed");

    EXPECT_TRUE(fetchExtraLog().empty());
}


TEST(ScopeGuard, RunMode)
{
    int exitCount = 0;
    int failCount = 0;
    {
        OLV_ON_SCOPE_EXIT(++exitCount);
        OLV_ON_SCOPE_FAIL(++failCount);
    }
    EXPECT_EQ(exitCount, 1);
    EXPECT_EQ(failCount, 0);

    try
    {
        OLV_ON_SCOPE_EXIT(++exitCount);
        OLV_ON_SCOPE_FAIL(++failCount);
        throw ParseError(L"bad input");
    }
    catch (const ParseError&) {}
    EXPECT_EQ(exitCount, 2);
    EXPECT_EQ(failCount, 1);

    {
        auto guard = makeGuard<ScopeGuardRunMode::onExit>([&] { ++exitCount; });
        guard.dismiss();
    }
    EXPECT_EQ(exitCount, 2);
}


TEST(ScopeGuard, CleanupErrorDuringUnwindingIsLogged)
{
    fetchExtraLog();
    try
    {
        OLV_ON_SCOPE_FAIL(throw ValueConversionError(L"rollback failed"));
        throw std::runtime_error("edit failed");
    }
    catch (const std::runtime_error&) {}

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].message, L"rollback failed");
}


TEST(TypingSearch, Buffer)
{
    TypingSearchBuffer buf;
    const auto start = std::chrono::steady_clock::now();

    EXPECT_EQ(buf.addChar(L'e', start), L"e");
    EXPECT_EQ(buf.addChar(L'r', start + 300ms), L"er");
    EXPECT_EQ(buf.addChar(L'i', start + 1000ms), L"eri");
    EXPECT_EQ(buf.addChar(L'z', start + 2000ms), L"z"); //pause starts a new prefix

    buf.clear();
    EXPECT_EQ(buf.addChar(L'a', start + 2100ms), L"a");
}


TEST(TypingSearch, Bisect)
{
    const std::vector<std::wstring> ascending{L"ae cummings", L"Alex Bawling", L"Cindy Dawn", L"Eric Fandango", L"Zoe Meliko"};
    auto getText = [&](size_t row) { return ascending[row]; };

    EXPECT_EQ(findRowBisect(0, 5, L"a",  true, getText), 0);
    EXPECT_EQ(findRowBisect(0, 5, L"AL", true, getText), 1);
    EXPECT_EQ(findRowBisect(0, 5, L"e",  true, getText), 3);
    EXPECT_EQ(findRowBisect(0, 5, L"b",  true, getText), -1);
    EXPECT_EQ(findRowBisect(2, 5, L"a",  true, getText), -1);
    EXPECT_EQ(findRowBisect(0, 0, L"a",  true, getText), -1);

    const std::vector<std::wstring> descending(ascending.rbegin(), ascending.rend());
    auto getTextDesc = [&](size_t row) { return descending[row]; };
    EXPECT_EQ(findRowBisect(0, 5, L"c", false, getTextDesc), 2);
    EXPECT_EQ(findRowBisect(0, 5, L"a", false, getTextDesc), 3);
}


namespace
{
struct GermanTranslation : public TranslationHandler
{
    std::wstring translate(const std::wstring& text) const override
    {
        return text == L"Error" ? L"Fehler" : text;
    }

    std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const override
    {
        return std::to_wstring(n) + (n == 1 ? L" Eintrag" : L" Eintr\u00E4ge");
    }
};
}


TEST(Translation, Handler)
{
    EXPECT_EQ(_("Error"), L"Error");
    EXPECT_EQ(_P("%x item", "%x items", 1), L"1 item");
    EXPECT_EQ(_P("%x item", "%x items", 3), L"3 items");

    setTranslator(std::make_unique<GermanTranslation>());
    OLV_ON_SCOPE_EXIT(setTranslator(nullptr));

    EXPECT_EQ(_("Error"), L"Fehler");
    EXPECT_EQ(_("Warning"), L"Warning");
    EXPECT_EQ(_P("%x item", "%x items", 3), L"3 Eintr\u00E4ge");

    ErrorLog log;
    logMsg(log, L"disk full", MSG_TYPE_ERROR);
    EXPECT_NE(formatMessage(log[0]).find(L"Fehler:  disk full"), std::wstring::npos);
}
