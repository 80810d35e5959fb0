#include "subscription.h"
#include "../shared/logging.h"

#include <algorithm>
#include <exception>

subscription::subscription(uint64_t id, std::string topic, event_predicate predicate,
                           connection_ref connection, auth_context auth, size_t capacity)
    : m_id(id),
      m_topic(std::move(topic)),
      m_predicate(std::move(predicate)),
      m_connection(connection),
      m_auth(std::move(auth)),
      m_capacity(capacity > 0 ? capacity : DEFAULT_CAPACITY)
{
}

bool subscription::matches(const change_event& ev) const
{
    if (!m_predicate)
        return true;
    try
    {
        return m_predicate(ev, m_auth);
    }
    catch (const std::exception& e)
    {
        LOG_WARNF("subscription %llu: predicate failed: %s",
                  static_cast<unsigned long long>(m_id), e.what());
        return false;
    }
}

bool subscription::enqueue(event_ptr ev)
{
    if (!ev || closed())
        return false;

    std::function<void(subscription&)> notify;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_queue.size() >= m_capacity)
        {
            auto victim = std::find_if(m_queue.begin(), m_queue.end(), [](const event_ptr& e) {
                return e->severity != severity_critical;
            });

            if (victim != m_queue.end())
            {
                m_queue.erase(victim);
                m_dropped.fetch_add(1, std::memory_order_relaxed);
            }
            else if (ev->severity != severity_critical)
            {
                m_dropped.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            // else: all queued events are CRITICAL and so is this one
        }

        bool was_empty = m_queue.empty();
        m_queue.push_back(std::move(ev));
        m_enqueued.fetch_add(1, std::memory_order_relaxed);
        if (was_empty)
            notify = m_on_ready;
    }

    if (notify)
        notify(*this);
    return true;
}

size_t subscription::drain(std::vector<event_ptr>& out, size_t max)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = std::min(max, m_queue.size());
    for (size_t i = 0; i < n; ++i)
    {
        out.push_back(std::move(m_queue.front()));
        m_queue.pop_front();
    }
    return n;
}

size_t subscription::queued() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void subscription::set_on_ready(std::function<void(subscription&)> cb)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_ready = std::move(cb);
}
