#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include "subscription.h"
#include "../shared/string_hash.h"

struct router_stats
{
    uint64_t published = 0;   // publish() calls
    uint64_t delivered = 0;   // events enqueued on subscriptions
    uint64_t filtered = 0;    // subscriptions whose predicate rejected an event
    uint64_t dropped = 0;     // events dropped by full queues
    size_t subscriptions = 0;
    size_t connections = 0;
};

// Topic fan-out. Holds weak references only: a subscription disappears from
// delivery as soon as its owner releases it, and is pruned from the indexes
// lazily or by unsubscribe()/disconnect().
class subscription_router
{
public:
    explicit subscription_router(size_t default_capacity = subscription::DEFAULT_CAPACITY);

    subscription_ptr subscribe(std::string topic, event_predicate predicate,
                               connection_ref connection, auth_context auth, size_t capacity = 0);

    bool unsubscribe(uint64_t id);
    bool unsubscribe(const subscription_ptr& sub) { return sub && unsubscribe(sub->id()); }

    // Removes every subscription of `connection`; returns how many
    size_t disconnect(connection_ref connection);

    // Enqueues `ev` on every live matching subscription of `topic`.
    // Returns the number of subscriptions it was enqueued on.
    size_t publish(std::string_view topic, const event_ptr& ev);

    subscription_ptr find(uint64_t id) const;
    size_t subscription_count() const;
    size_t connection_count() const;
    router_stats stats() const;

    void set_default_capacity(size_t capacity) { m_default_capacity = capacity; }

private:
    struct membership
    {
        std::string topic;
        connection_ref connection;
        std::weak_ptr<subscription> sub;
    };

    using topic_members = std::unordered_map<uint64_t, std::weak_ptr<subscription>>;

    // Caller holds the unique lock
    bool remove_locked(uint64_t id);
    void prune(const std::vector<uint64_t>& ids);

    size_t m_default_capacity;
    std::atomic<uint64_t> m_next_id{1};

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, topic_members, string_hash, string_equal> m_topics;
    std::unordered_map<uint64_t, membership> m_by_id;
    std::unordered_map<connection_ref, std::unordered_set<uint64_t>> m_by_connection;

    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_filtered{0};
    std::atomic<uint64_t> m_dropped{0};
};
