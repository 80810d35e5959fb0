// Embedding header test: gateway wrapper against an in-memory source (links libintelgate_core.a)
#undef NDEBUG
#include <cassert>
#include <string>
#include "intelgate/gateway.h"

int main()
{
    // Does NOT call start(): everything runs through handle()/drain().

    memory_entity_source src;
    src.put("threat", "t1", "{\"id\":\"t1\"}");
    src.link("threat", "iocs", "t1", "{\"id\":\"i1\"}");

    intelgate::gateway gw(src);
    gw.ttl("threat", 600)
      .dependent("ioc", "reputation:{id}:*")
      .rate_limit(rate_standard_query, 50, 60000)
      .cost_ceiling(1500)
      .max_depth(8)
      .role_scaling(false)
      .batch_size(64)
      .subscription_queue(16);

    assert(gw.admission().limits().ceiling == 1500);
    assert(gw.admission().limits().max_depth == 8);
    assert(gw.cache().policy().ttl_seconds("threat") == 600);

    // Protocol side
    assert(gw.handle("PING") == "+PONG\n");
    assert(gw.handle("GET threat t1") == "*1\n$t1 {\"id\":\"t1\"}\n");
    assert(gw.handle("REL threat iocs t1") == "*1\n$t1 [{\"id\":\"i1\"}]\n");

    // Loaders for a caller-driven unit of work
    {
        auto scope = gw.scope();
        auto f = scope->entities("threat").load("t1");
        scope->flush();
        assert(f.ready() && f.get().has_value());
    }

    // Domain side
    auto sub = gw.subscribe("threat", organization_filter(), auth_context{"svc", "org-a", role_analyst});
    assert(sub->capacity() == 16);

    change_event ev;
    ev.entity_type = "threat";
    ev.entity_id = "t1";
    ev.organization_id = "org-a";
    ev.severity = severity_high;
    commit_result r = gw.commit(std::move(ev));
    assert(r.invalidated == 2);  // entity key and its iocs list
    assert(r.delivered == 1);
    assert(sub->queued() == 1);

    // Protocol subscription on connection 1
    assert(gw.handle("AUTH analyst org-a analyst") == "+OK\n");
    assert(gw.handle("SUB threat") == "+SUB 2\n");
    assert(gw.handle("MUTATE threat t1 updated high") == "+OK committed=1 invalidated=0 delivered=2\n");
    std::string events = gw.drain();
    assert(events.compare(0, 8, "EVENT 2 ") == 0);

    // Escape hatches
    (void)gw.router();
    (void)gw.bus();
    (void)gw.loop();

    return 0;
}
