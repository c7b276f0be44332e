// SPDX-License-Identifier: LGPL-2.1-or-later

#pragma once

#include <string>

#include "debug_types.h"

namespace metgear {
/**
 * storage of a single log entry. Entries are built by the logstream and
 * handed to every registered callback; a callback that needs to keep the
 * entry beyond the call must copy it.
 */
class LogEntry final
{
public:
    LogEntry(mgDebugClass c, mgDebugPriority p,
             const char* file, int line, const char* function,
             const std::string& msg)
    :
    debugClass(c),
    debugPriority(p),
    file(file ? file : ""),
    line(line),
    function(function ? function : ""),
    message(msg)
    {
    }

    LogEntry(const LogEntry& c) = default;
    LogEntry& operator=(const LogEntry& c) = delete;

    /**
     * "file:line: message", with the directory part of the file stripped.
     */
    std::string originString() const;

    const mgDebugClass debugClass;
    const mgDebugPriority debugPriority;
    const std::string file;
    const int line;
    const std::string function;
    const std::string message;
};

} // namespace metgear
