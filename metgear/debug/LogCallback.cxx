// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Base class for log callbacks
 */

#include <metgear_config.h>

#include "LogCallback.hxx"

using namespace metgear;

LogCallback::LogCallback(mgDebugClass c, mgDebugPriority p) : m_class(c),
                                                              m_priority(p)
{
}

void LogCallback::operator()(mgDebugClass, mgDebugPriority,
                             const char*, int, const std::string&)
{
    // override me
}

bool LogCallback::doProcessEntry(const LogEntry&)
{
    return false;
}

void LogCallback::processEntry(const LogEntry& e)
{
    if (!shouldLog(e.debugClass, e.debugPriority))
        return;

    if (doProcessEntry(e))
        return; // derived class handled the whole entry

    (*this)(e.debugClass, e.debugPriority, e.file.c_str(), e.line, e.message);
}


bool LogCallback::shouldLog(mgDebugClass c, mgDebugPriority p) const
{
    if (p == MG_MANDATORY_INFO)
        return true;
    return (c & m_class) != 0 && p >= m_priority;
}

void LogCallback::setLogLevels(mgDebugClass c, mgDebugPriority p)
{
    m_priority = p;
    m_class = c;
}
