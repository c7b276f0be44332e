// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Buffer log messages for later retrieval and display
 */

#include <metgear_config.h>
#include <metgear/debug/BufferedLogCallback.hxx>

#include <mutex>

namespace metgear
{

class BufferedLogCallback::BufferedLogCallbackPrivate
{
public:
    mutable std::mutex m_mutex;
    string_list m_buffer;
    unsigned int m_stamp = 0;
    unsigned int m_maxLength = 0xffff;
};

BufferedLogCallback::BufferedLogCallback(mgDebugClass c, mgDebugPriority p) :
    LogCallback(c, p),
    d(new BufferedLogCallbackPrivate)
{
}

BufferedLogCallback::~BufferedLogCallback() = default;

bool BufferedLogCallback::doProcessEntry(const LogEntry& e)
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    if (e.message.size() >= d->m_maxLength)
        d->m_buffer.push_back(e.message.substr(0, d->m_maxLength - 1));
    else
        d->m_buffer.push_back(e.message);
    d->m_stamp++;
    return true;
}

unsigned int BufferedLogCallback::stamp() const
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    return d->m_stamp;
}

unsigned int BufferedLogCallback::threadsafeCopy(string_list& aOutput) const
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    aOutput = d->m_buffer;
    return d->m_stamp;
}

void BufferedLogCallback::clear()
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    d->m_buffer.clear();
    d->m_stamp++;
}

void BufferedLogCallback::truncateAt(unsigned int t)
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    d->m_maxLength = t;
}

} // of namespace metgear
