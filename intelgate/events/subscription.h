#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "change_event.h"
#include "../shared/auth_context.h"

using event_predicate = std::function<bool(const change_event&, const auth_context&)>;

// Transport-side identifier of the connection a subscription belongs to
using connection_ref = uint64_t;

// One live subscription. Owned by its connection; the router only holds
// weak references. Each subscription has its own lock so a slow consumer
// never blocks publishers or other subscribers.
class subscription
{
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    subscription(uint64_t id, std::string topic, event_predicate predicate,
                 connection_ref connection, auth_context auth, size_t capacity = DEFAULT_CAPACITY);

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    uint64_t id() const { return m_id; }
    const std::string& topic() const { return m_topic; }
    connection_ref connection() const { return m_connection; }
    const auth_context& auth() const { return m_auth; }
    size_t capacity() const { return m_capacity; }

    // Predicate against the subscriber's auth context; an empty predicate
    // matches everything
    bool matches(const change_event& ev) const;

    // Appends to the queue. When full, the oldest non-critical event is
    // dropped; if only CRITICAL events are queued, a non-critical incoming
    // event is dropped instead and a CRITICAL one is admitted beyond capacity.
    // Returns false if `ev` itself was dropped.
    bool enqueue(event_ptr ev);

    // Moves up to `max` queued events into `out` in FIFO order
    size_t drain(std::vector<event_ptr>& out, size_t max = SIZE_MAX);

    size_t queued() const;
    uint64_t dropped() const { return m_dropped.load(std::memory_order_relaxed); }
    uint64_t enqueued() const { return m_enqueued.load(std::memory_order_relaxed); }

    // Called (outside the queue lock) when the queue goes from empty to non-empty
    void set_on_ready(std::function<void(subscription&)> cb);

    void close() { m_closed.store(true, std::memory_order_release); }
    bool closed() const { return m_closed.load(std::memory_order_acquire); }

private:
    const uint64_t m_id;
    const std::string m_topic;
    const event_predicate m_predicate;
    const connection_ref m_connection;
    const auth_context m_auth;
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::deque<event_ptr> m_queue;
    std::function<void(subscription&)> m_on_ready;

    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_enqueued{0};
    std::atomic<bool> m_closed{false};
};

using subscription_ptr = std::shared_ptr<subscription>;
