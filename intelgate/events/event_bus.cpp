#include "event_bus.h"
#include "../cache/cache_manager.h"
#include "../shared/logging.h"

event_bus::event_bus(subscription_router& router, cache_manager* cache)
    : m_router(router), m_cache(cache)
{
}

size_t event_bus::publish(std::string_view topic, const event_ptr& ev)
{
    return m_router.publish(topic, ev);
}

commit_result event_bus::commit_change(change_event ev)
{
    if (ev.topic.empty())
        ev.topic = ev.entity_type;

    commit_result result;
    if (m_cache)
    {
        result.invalidated = m_cache->invalidate(ev.entity_type, ev.entity_id);
        if (result.invalidated < 0)
            LOG_WARNF("commit %s:%s: cache invalidation skipped", ev.entity_type.c_str(), ev.entity_id.c_str());
    }

    result.event = make_event(std::move(ev));
    result.delivered = m_router.publish(result.event->topic, result.event);
    LOG_DEBUGF("commit %s %s:%s -> %zu subscribers", change_kind_name(result.event->kind),
               result.event->entity_type.c_str(), result.event->entity_id.c_str(), result.delivered);
    return result;
}
