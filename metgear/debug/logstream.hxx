// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 1998 Bernie Bright - bbright@c031.aone.net.au

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <metgear/debug/debug_types.h>

namespace metgear
{

class LogCallback;

/**
 * Class to manage the debug logging stream.
 *
 * Messages are filtered twice: once against the global class/priority
 * set with setLogLevels() (which decides whether the message is built
 * at all, see MG_LOG), and once by each callback's own levels.
 */
class logstream
{
public:
    ~logstream();

    /**
     * Set the global log class and priority level.
     * @param c debug class
     * @param p priority
     */
    void setLogLevels(mgDebugClass c, mgDebugPriority p);

    mgDebugClass get_log_classes() const;

    mgDebugPriority get_log_priority() const;

    /**
     * set the default stderr sink to emit messages at priority
     * @a p and above (default MG_ALERT)
     */
    void setStderrPriority(mgDebugPriority p);

    /**
     * enable or disable the default stderr sink, e.g. for tests that
     * check log output through their own callback
     */
    void setStderrEnabled(bool enabled);

    bool would_log(mgDebugClass c, mgDebugPriority p) const;

    void log(mgDebugClass c, mgDebugPriority p,
             const char* fileName, int line, const char* function,
             const std::string& msg);

    /**
     * register a callback. The logstream does not take ownership; the
     * callback must be removed before it is destroyed. Callbacks are
     * invoked without the logstream lock held and may log themselves.
     */
    void addCallback(LogCallback* cb);

    void removeCallback(LogCallback* cb);

    /**
     * Map a priority name ("bulk", "debug", "info", "warn", "alert")
     * to its value; throws mg_format_exception for unknown names.
     */
    static mgDebugPriority priorityFromString(const std::string& s);

    /**
     * Map a class name ("general", "environment", "io", "all", "none")
     * or a comma separated list of them; throws mg_format_exception for
     * unknown names.
     */
    static mgDebugClass classFromString(const std::string& s);

private:
    friend logstream& mglog();
    logstream();

    class LogStreamPrivate;
    std::unique_ptr<LogStreamPrivate> d;
};

/**
 * Return the one and only logstream instance.
 */
logstream& mglog();

} // namespace metgear

#if defined(__GNUC__)
#  define MG_FUNCTION __PRETTY_FUNCTION__
#else
#  define MG_FUNCTION __func__
#endif

/** \def MG_LOG(C,P,M)
 * Log a message.
 * @param C debug class
 * @param P priority
 * @param M message, anything that can be put on an std::ostream
 */
#define MG_LOGX(C,P,M) \
    do { if(metgear::mglog().would_log(C,P)) {                         \
        std::ostringstream os; os << M;                                 \
        metgear::mglog().log(C, P, __FILE__, __LINE__, MG_FUNCTION, os.str()); \
    } } while(0)

#define MG_LOG(C,P,M) MG_LOGX(C,P,M)

#define MG_ORIGIN __FILE__ ":" MG_STRINGIZE(__LINE__)
#define MG_STRINGIZE(X) MG_DO_STRINGIZE(X)
#define MG_DO_STRINGIZE(X) #X
