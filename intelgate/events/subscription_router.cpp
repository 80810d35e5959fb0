#include "subscription_router.h"
#include "../shared/logging.h"

#include <mutex>
#include <vector>

subscription_router::subscription_router(size_t default_capacity)
    : m_default_capacity(default_capacity > 0 ? default_capacity : subscription::DEFAULT_CAPACITY)
{
}

subscription_ptr subscription_router::subscribe(std::string topic, event_predicate predicate,
                                                connection_ref connection, auth_context auth, size_t capacity)
{
    uint64_t id = m_next_id.fetch_add(1, std::memory_order_relaxed);
    auto sub = std::make_shared<subscription>(id, topic, std::move(predicate), connection, std::move(auth),
                                              capacity > 0 ? capacity : m_default_capacity);

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_topics[topic].emplace(id, sub);
    m_by_connection[connection].insert(id);
    m_by_id.emplace(id, membership{std::move(topic), connection, sub});
    return sub;
}

bool subscription_router::remove_locked(uint64_t id)
{
    auto it = m_by_id.find(id);
    if (it == m_by_id.end())
        return false;

    if (auto sub = it->second.sub.lock())
        sub->close();

    if (auto tit = m_topics.find(it->second.topic); tit != m_topics.end())
    {
        tit->second.erase(id);
        if (tit->second.empty())
            m_topics.erase(tit);
    }

    if (auto cit = m_by_connection.find(it->second.connection); cit != m_by_connection.end())
    {
        cit->second.erase(id);
        if (cit->second.empty())
            m_by_connection.erase(cit);
    }

    m_by_id.erase(it);
    return true;
}

bool subscription_router::unsubscribe(uint64_t id)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return remove_locked(id);
}

size_t subscription_router::disconnect(connection_ref connection)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto cit = m_by_connection.find(connection);
    if (cit == m_by_connection.end())
        return 0;

    // remove_locked() edits the set we would be iterating
    std::vector<uint64_t> ids(cit->second.begin(), cit->second.end());
    for (uint64_t id : ids)
        remove_locked(id);
    return ids.size();
}

void subscription_router::prune(const std::vector<uint64_t>& ids)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (uint64_t id : ids)
    {
        auto it = m_by_id.find(id);
        if (it != m_by_id.end() && it->second.sub.expired())
            remove_locked(id);
    }
}

size_t subscription_router::publish(std::string_view topic, const event_ptr& ev)
{
    if (!ev)
        return 0;
    m_published.fetch_add(1, std::memory_order_relaxed);

    std::vector<subscription_ptr> targets;
    std::vector<uint64_t> expired;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto tit = m_topics.find(topic);
        if (tit == m_topics.end())
            return 0;
        targets.reserve(tit->second.size());
        for (const auto& [id, weak] : tit->second)
        {
            if (auto sub = weak.lock())
                targets.push_back(std::move(sub));
            else
                expired.push_back(id);
        }
    }

    if (!expired.empty())
        prune(expired);

    // Outside the router lock: predicates and queues only touch the
    // subscription's own state
    size_t delivered = 0;
    for (const auto& sub : targets)
    {
        if (sub->closed())
            continue;
        if (!sub->matches(*ev))
        {
            m_filtered.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        uint64_t dropped_before = sub->dropped();
        if (sub->enqueue(ev))
            ++delivered;
        uint64_t dropped_now = sub->dropped();
        if (dropped_now != dropped_before)
        {
            m_dropped.fetch_add(dropped_now - dropped_before, std::memory_order_relaxed);
            LOG_DEBUGF("subscription %llu: queue full, dropped %llu so far",
                       static_cast<unsigned long long>(sub->id()),
                       static_cast<unsigned long long>(dropped_now));
        }
    }

    m_delivered.fetch_add(delivered, std::memory_order_relaxed);
    return delivered;
}

subscription_ptr subscription_router::find(uint64_t id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_by_id.find(id);
    if (it == m_by_id.end())
        return nullptr;
    return it->second.sub.lock();
}

size_t subscription_router::subscription_count() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_by_id.size();
}

size_t subscription_router::connection_count() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_by_connection.size();
}

router_stats subscription_router::stats() const
{
    router_stats s;
    s.published = m_published.load(std::memory_order_relaxed);
    s.delivered = m_delivered.load(std::memory_order_relaxed);
    s.filtered = m_filtered.load(std::memory_order_relaxed);
    s.dropped = m_dropped.load(std::memory_order_relaxed);
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    s.subscriptions = m_by_id.size();
    s.connections = m_by_connection.size();
    return s;
}
