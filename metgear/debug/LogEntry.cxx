// SPDX-License-Identifier: LGPL-2.1-or-later

#include <metgear_config.h>

#include "LogEntry.hxx"

namespace metgear {

std::string LogEntry::originString() const
{
    std::string::size_type slash = file.find_last_of("/\\");
    std::string r = (slash == std::string::npos) ? file : file.substr(slash + 1);
    if (line > 0)
        r += ":" + std::to_string(line);
    return r + ": " + message;
}

} // namespace metgear
