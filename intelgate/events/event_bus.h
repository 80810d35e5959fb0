#pragma once
#include <cstdint>
#include <string_view>
#include "change_event.h"
#include "subscription_router.h"

class cache_manager;

struct commit_result
{
    int64_t invalidated = 0;   // -1 when the cache was unreachable
    size_t delivered = 0;
    event_ptr event;
};

// Domain-facing side of the pub/sub layer
class event_bus
{
public:
    // `cache` may be null when no shared cache is in use
    event_bus(subscription_router& router, cache_manager* cache);

    size_t publish(std::string_view topic, const event_ptr& ev);

    // Mutation tail: invalidates the changed entity, then publishes the
    // event on its topic (the entity type when no topic is set). Cache
    // failure does not stop the publish.
    commit_result commit_change(change_event ev);

    subscription_router& router() { return m_router; }

private:
    subscription_router& m_router;
    cache_manager* m_cache;
};
