#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/events/event_bus.h"
#include "../../intelgate/events/predicates.h"
#include "../../intelgate/cache/cache_manager.h"
#include "../../intelgate/store/memory_kv_store.h"

namespace {

change_event threat_change(std::string id, std::string org = "org-a")
{
    change_event ev;
    ev.entity_type = "threat";
    ev.entity_id = std::move(id);
    ev.kind = change_updated;
    ev.severity = severity_high;
    ev.organization_id = std::move(org);
    return ev;
}

} // namespace

TEST_CASE("event_bus commit")
{
    memory_kv_store store;
    cache_manager cache(store);
    subscription_router router;
    event_bus bus(router, &cache);

    auth_context analyst{"u1", "org-a", role_analyst};

    SUBCASE("invalidates before publishing")
    {
        cache.set(entity_key{"threat", "t1", {}}, "{}");
        cache.set(entity_key{"analytics", "weekly", {}}, "{}");
        cache.set(entity_key{"threat", "t2", {}}, "{}");

        bool cache_cleared_at_delivery = false;
        auto sub = router.subscribe("threat", organization_filter(), 7, analyst);
        sub->set_on_ready([&](subscription&) {
            std::string raw;
            cache_cleared_at_delivery = store.get("threat:threat:t1", raw) == kv_miss;
        });

        commit_result r = bus.commit_change(threat_change("t1"));
        CHECK(r.invalidated == 2);
        CHECK(r.delivered == 1);
        CHECK(cache_cleared_at_delivery);

        std::string raw;
        CHECK(store.get("threat:threat:t2", raw) == kv_ok);
    }

    SUBCASE("topic defaults to the entity type")
    {
        auto sub = router.subscribe("threat", nullptr, 7, analyst);
        commit_result r = bus.commit_change(threat_change("t1"));
        REQUIRE(r.event);
        CHECK(r.event->topic == "threat");
        CHECK(r.event->timestamp_ms > 0);

        std::vector<event_ptr> out;
        CHECK(sub->drain(out) == 1);
        CHECK(out[0]->entity_id == "t1");
    }

    SUBCASE("explicit topics are kept")
    {
        auto sub = router.subscribe("alerts", nullptr, 7, analyst);
        change_event ev = threat_change("t1");
        ev.topic = "alerts";
        CHECK(bus.commit_change(std::move(ev)).delivered == 1);
        CHECK(sub->queued() == 1);
    }

    SUBCASE("other organizations are filtered")
    {
        auto sub = router.subscribe("threat", organization_filter(), 7, analyst);
        CHECK(bus.commit_change(threat_change("t1", "org-b")).delivered == 0);
        CHECK(sub->queued() == 0);
    }

    SUBCASE("publish skips the cache")
    {
        cache.set(entity_key{"threat", "t1", {}}, "{}");
        auto sub = router.subscribe("threat", nullptr, 7, analyst);
        CHECK(bus.publish("threat", make_event(threat_change("t1"))) == 1);

        std::string raw;
        CHECK(store.get("threat:threat:t1", raw) == kv_ok);
    }
}

TEST_CASE("event_bus without a cache")
{
    subscription_router router;
    event_bus bus(router, nullptr);
    auto sub = router.subscribe("threat", nullptr, 1, auth_context{"u1", "org-a", role_viewer});

    commit_result r = bus.commit_change(threat_change("t1"));
    CHECK(r.invalidated == 0);
    CHECK(r.delivered == 1);
}
