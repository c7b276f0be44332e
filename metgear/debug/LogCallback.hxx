// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Base class for log callbacks
 */

#pragma once

#include <string>

#include "LogEntry.hxx"
#include "debug_types.h"

namespace metgear {

class LogCallback
{
public:
    virtual ~LogCallback() = default;

    // return true if you handled the message, otherwise
    // operator() will be called with the unpacked entry
    virtual bool doProcessEntry(const LogEntry& e);

    virtual void operator()(mgDebugClass c, mgDebugPriority p,
                            const char* file, int line, const std::string& aMessage);

    void setLogLevels(mgDebugClass c, mgDebugPriority p);

    void processEntry(const LogEntry& e);

protected:
    LogCallback(mgDebugClass c, mgDebugPriority p);

    bool shouldLog(mgDebugClass c, mgDebugPriority p) const;
private:
    mgDebugClass m_class;
    mgDebugPriority m_priority;
};


} // namespace metgear
