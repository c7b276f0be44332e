// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 1998 Bernie Bright - bbright@c031.aone.net.au

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#include <metgear_config.h>

#include "logstream.hxx"

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <metgear/debug/LogCallback.hxx>
#include <metgear/debug/LogEntry.hxx>
#include <metgear/structure/exception.hxx>

namespace metgear
{

namespace
{

const char* debugPriorityToString(mgDebugPriority p)
{
    switch (p) {
    case MG_BULK:           return "BULK";
    case MG_DEBUG:          return "DBUG";
    case MG_INFO:           return "INFO";
    case MG_WARN:           return "WARN";
    case MG_ALERT:          return "ALRT";
    case MG_MANDATORY_INFO: return "MAND";
    }
    return "UNKN";
}

const char* debugClassToString(mgDebugClass c)
{
    switch (c) {
    case MG_NONE:        return "none";
    case MG_GENERAL:     return "general";
    case MG_ENVIRONMENT: return "environment";
    case MG_IO:          return "io";
    default:             return "unknown";
    }
}

class StderrLogCallback : public LogCallback
{
public:
    StderrLogCallback(mgDebugClass c, mgDebugPriority p) :
        LogCallback(c, p)
    {
    }

    bool doProcessEntry(const LogEntry& e) override
    {
        std::cerr << std::setw(11) << std::left << debugClassToString(e.debugClass)
                  << " " << debugPriorityToString(e.debugPriority) << " "
                  << e.originString() << std::endl;
        return true;
    }
};

} // of anonymous namespace

class logstream::LogStreamPrivate
{
public:
    LogStreamPrivate() :
        m_stderrCallback(MG_ALL, MG_ALERT)
    {
    }

    mutable std::mutex m_lock;
    std::vector<LogCallback*> m_callbacks;
    StderrLogCallback m_stderrCallback;
    bool m_stderrEnabled = true;

    // read without the lock from would_log()
    std::atomic<unsigned int> m_logClass{MG_ALL};
    std::atomic<int> m_logPriority{MG_ALERT};
};

logstream::logstream() :
    d(new LogStreamPrivate)
{
}

logstream::~logstream() = default;

void logstream::setLogLevels(mgDebugClass c, mgDebugPriority p)
{
    d->m_logClass = static_cast<unsigned int>(c);
    d->m_logPriority = static_cast<int>(p);
}

mgDebugClass logstream::get_log_classes() const
{
    return static_cast<mgDebugClass>(d->m_logClass.load());
}

mgDebugPriority logstream::get_log_priority() const
{
    return static_cast<mgDebugPriority>(d->m_logPriority.load());
}

void logstream::setStderrPriority(mgDebugPriority p)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    d->m_stderrCallback.setLogLevels(MG_ALL, p);
}

void logstream::setStderrEnabled(bool enabled)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    d->m_stderrEnabled = enabled;
}

bool logstream::would_log(mgDebugClass c, mgDebugPriority p) const
{
    if (p == MG_MANDATORY_INFO)
        return true;
    return (c & d->m_logClass) != 0 && static_cast<int>(p) >= d->m_logPriority;
}

void logstream::log(mgDebugClass c, mgDebugPriority p,
                    const char* fileName, int line, const char* function,
                    const std::string& msg)
{
    LogEntry entry(c, p, fileName, line, function, msg);

    std::vector<LogCallback*> callbacks;
    {
        std::lock_guard<std::mutex> g(d->m_lock);
        if (d->m_stderrEnabled)
            d->m_stderrCallback.processEntry(entry);
        callbacks = d->m_callbacks;
    }

    // unlocked, so a callback may log itself
    for (auto cb : callbacks)
        cb->processEntry(entry);
}

void logstream::addCallback(LogCallback* cb)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    if (std::find(d->m_callbacks.begin(), d->m_callbacks.end(), cb) == d->m_callbacks.end())
        d->m_callbacks.push_back(cb);
}

void logstream::removeCallback(LogCallback* cb)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    auto it = std::find(d->m_callbacks.begin(), d->m_callbacks.end(), cb);
    if (it != d->m_callbacks.end())
        d->m_callbacks.erase(it);
}

mgDebugPriority logstream::priorityFromString(const std::string& s)
{
    const std::string p = boost::to_lower_copy(boost::trim_copy(s));
    if (p == "bulk")  return MG_BULK;
    if (p == "debug") return MG_DEBUG;
    if (p == "info")  return MG_INFO;
    if (p == "warn")  return MG_WARN;
    if (p == "alert") return MG_ALERT;

    throw mg_format_exception("Unknown log priority", s);
}

mgDebugClass logstream::classFromString(const std::string& s)
{
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    const boost::char_separator<char> del(", ");

    unsigned int result = MG_NONE;
    tokenizer tokens(s.begin(), s.end(), del);
    for (tokenizer::const_iterator tok = tokens.begin(); tok != tokens.end(); ++tok) {
        const std::string c = boost::to_lower_copy(*tok);
        if (c == "all")
            result = MG_ALL;
        else if (c == "none")
            ;
        else if (c == "general")
            result |= MG_GENERAL;
        else if (c == "environment")
            result |= MG_ENVIRONMENT;
        else if (c == "io")
            result |= MG_IO;
        else
            throw mg_format_exception("Unknown log class", s);
    }
    return static_cast<mgDebugClass>(result);
}

logstream& mglog()
{
    // Meyers singleton; construction is thread-safe
    static logstream instance;
    return instance;
}

} // namespace metgear
