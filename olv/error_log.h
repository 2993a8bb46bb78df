// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef ERROR_LOG_H_3390127645120938475
#define ERROR_LOG_H_3390127645120938475

#include <cassert>
#include <ctime>
#include <cwchar>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include <iterator>
#include "i18n.h"


namespace olv
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::wstring message;
};

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);

std::wstring formatMessage(const LogEntry& entry);


/*  log errors in "exceptional situations" when no other means are available, e.g.
    - nothrow wxListCtrl callbacks: OnGetItemText() and friends
    - event handlers running inside the toolkit's message loop           */
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/);
ErrorLog fetchExtraLog();
void logExtraError(const std::wstring& msg); //nothrow!







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, msg});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_INFO:
                ++count.info;
                break;
            case MSG_TYPE_WARNING:
                ++count.warning;
                break;
            case MSG_TYPE_ERROR:
                ++count.error;
                break;
        }
    assert(std::ssize(log) == count.info + count.warning + count.error);
    return count;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


inline
std::wstring formatMessage(const LogEntry& entry)
{
    wchar_t timeTag[32] = {};
    if (std::tm* ltm = std::localtime(&entry.time))
        std::wcsftime(timeTag, std::size(timeTag), L"%H:%M:%S", ltm);

    std::wstring msgFmt = L'[' + std::wstring(timeTag) + L"]  " + getMessageTypeLabel(entry.type) + L":  ";
    const size_t prefixLen = msgFmt.size();

    for (auto it = entry.message.begin(); it != entry.message.end(); )
        if (*it == L'\n')
        {
            msgFmt += *it++;
            msgFmt.append(prefixLen, L' ');
            //skip duplicate newlines
            for (; it != entry.message.end() && *it == L'\n'; ++it)
                ;
        }
        else
            msgFmt += *it++;

    msgFmt += L'\n';
    return msgFmt;
}


namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        assert(!reportOutstandingLog_);
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void logError(const std::wstring& msg) { logMsg(log_, msg, MSG_TYPE_ERROR); }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


struct GlobalExtraLog
{
    std::mutex lock;
    ExtraLog log;
};

inline GlobalExtraLog& globalExtraLog()
{
    static GlobalExtraLog inst;
    return inst;
}

template <class Function>
void accessExtraLog(Function fun)
{
    GlobalExtraLog& gel = globalExtraLog();
    std::lock_guard dummy(gel.lock);
    fun(gel.log);
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraError(const std::wstring& msg)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.logError(msg); });
}
}

#endif //ERROR_LOG_H_3390127645120938475
