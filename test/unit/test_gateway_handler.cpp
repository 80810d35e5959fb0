#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/daemon/gateway_handler.h"
#include "../../intelgate/cache/cache_manager.h"
#include "../../intelgate/loader/memory_entity_source.h"
#include "../../intelgate/store/memory_kv_store.h"

namespace {

cost_limits test_limits()
{
    cost_limits l;
    l.ceiling = 300;
    return l;
}

struct gateway_fixture
{
    memory_entity_source source;
    memory_kv_store store;
    cache_manager cache{store};
    subscription_router router;
    event_bus bus{router, &cache};
    rate_limiter limiter{store};
    admission_controller admission{limiter, cost_schema::defaults(), test_limits()};
    gateway_handler handler{gateway_services{source, &cache, router, bus, admission, loader_limits{}}};

    gateway_fixture()
    {
        source.put("threat", "t1", "{\"id\":\"t1\",\"name\":\"Emotet\"}");
        source.put("threat", "t2", "{\"id\":\"t2\"}");
        source.link("threat", "iocs", "t1", "{\"id\":\"i1\"}");
        source.link("threat", "iocs", "t1", "{\"id\":\"i2\"}");
        source.put_enrichment("ioc", "i1", "{\"reputation\":90}");
    }

    std::string run(connection_ref conn, std::string_view line)
    {
        std::string out;
        handler.handle_line(conn, line, out);
        return out;
    }
};

bool starts_with(const std::string& s, std::string_view prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST_CASE_FIXTURE(gateway_fixture, "basic commands")
{
    CHECK(run(1, "PING") == "+PONG\n");
    CHECK(run(1, "ping\r") == "+PONG\n");
    CHECK(run(1, "   ").empty());
    CHECK(run(1, "FROB x") == "-ERR unknown command\n");

    CHECK(run(1, "AUTH alice org-a analyst") == "+OK\n");
    CHECK(run(1, "AUTH alice org-a wizard") == "-ERR unknown role\n");
    CHECK(starts_with(run(1, "AUTH alice"), "-ERR usage"));
}

TEST_CASE_FIXTURE(gateway_fixture, "entity reads")
{
    SUBCASE("GET returns documents in request order")
    {
        CHECK(run(1, "GET threat t2,t1 nope") ==
              "*3\n"
              "$t2 {\"id\":\"t2\"}\n"
              "$t1 {\"id\":\"t1\",\"name\":\"Emotet\"}\n"
              "$nope null\n");
        CHECK(source.find_calls() == 1);

        // second read is served by the shared cache
        run(1, "GET threat t1");
        CHECK(source.find_calls() == 1);
    }

    SUBCASE("documents are flattened onto one line")
    {
        source.put("threat", "t3", "{\n\"id\":\"t3\"\n}");
        CHECK(run(1, "GET threat t3") == "*1\n$t3 { \"id\":\"t3\" }\n");
    }

    SUBCASE("REL")
    {
        CHECK(run(1, "REL threat iocs t1 t2") ==
              "*2\n"
              "$t1 [{\"id\":\"i1\"},{\"id\":\"i2\"}]\n"
              "$t2 []\n");
    }

    SUBCASE("ENRICH")
    {
        CHECK(run(1, "ENRICH ioc i1 i9") ==
              "*2\n"
              "$i1 {\"reputation\":90}\n"
              "$i9 null\n");
    }

    SUBCASE("usage errors")
    {
        CHECK(starts_with(run(1, "GET threat"), "-ERR usage"));
        CHECK(starts_with(run(1, "REL threat iocs"), "-ERR usage"));
    }
}

TEST_CASE_FIXTURE(gateway_fixture, "QUERY")
{
    SUBCASE("single entity with a relation and enrichment")
    {
        CHECK(run(1, "QUERY { threat(id: \"t1\") { id iocs { value } enrichment } }") ==
              "*1\n"
              "$threat {\"id\":\"t1\",\"data\":{\"id\":\"t1\",\"name\":\"Emotet\"},"
              "\"iocs\":[{\"id\":\"i1\"},{\"id\":\"i2\"}],\"enrichment\":null}\n");
    }

    SUBCASE("list roots, aliases and unresolvable fields")
    {
        CHECK(run(1, "QUERY { picked: threats(ids: \"t1,t2\") { id } feeds { id } }") ==
              "*2\n"
              "$picked [{\"id\":\"t1\",\"data\":{\"id\":\"t1\",\"name\":\"Emotet\"}},"
              "{\"id\":\"t2\",\"data\":{\"id\":\"t2\"}}]\n"
              "$feeds null\n");
    }

    SUBCASE("missing entity has null data")
    {
        CHECK(run(1, "QUERY { threat(id: \"zz\") { iocs { value } } }") ==
              "*1\n$threat {\"id\":\"zz\",\"data\":null}\n");
        CHECK(source.relation_calls() == 0);
    }

    SUBCASE("relations of several roots share one batch")
    {
        run(1, "QUERY { a: threat(id: \"t1\") { iocs { value } } b: threat(id: \"t2\") { iocs { value } } }");
        CHECK(source.find_calls() == 1);
        CHECK(source.relation_calls() == 1);
    }

    SUBCASE("over the ceiling")
    {
        CHECK(run(1, "QUERY { threats { iocs { value } } }") == "-TOOCOMPLEX score=325 ceiling=300 depth=3\n");
        CHECK(source.find_calls() == 0);
    }

    SUBCASE("malformed")
    {
        CHECK(starts_with(run(1, "QUERY { threats { ...F } }"), "-ERR fragments are not supported"));
        CHECK(admission.stats().bad_query == 1);
    }
}

TEST_CASE_FIXTURE(gateway_fixture, "COST")
{
    CHECK(run(1, "COST { threats(first: 5) { id iocs(first: 20) { value } } }") ==
          "+cost=230 depth=3 fields=4 ceiling=300 timeout_ms=53000\n");
    CHECK(run(1, "COST { threats { iocs { value } } }") ==
          "-TOOCOMPLEX score=325 depth=3 fields=3 ceiling=300 timeout_ms=62500\n");
    // scoring alone takes no token
    CHECK(limiter.stats().allowed == 0);
}

TEST_CASE_FIXTURE(gateway_fixture, "mutations and subscriptions")
{
    std::vector<connection_ref> ready;
    handler.set_ready_callback([&](connection_ref c) { ready.push_back(c); });

    REQUIRE(run(1, "AUTH watcher org-a analyst") == "+OK\n");
    REQUIRE(run(2, "AUTH writer org-a incident_responder") == "+OK\n");
    REQUIRE(run(1, "SUB threat severity=high") == "+SUB 1\n");
    CHECK(router.subscription_count() == 1);

    run(2, "GET threat t1");

    SUBCASE("commit invalidates, applies and notifies")
    {
        CHECK(run(2, "MUTATE threat t1 updated critical {\"id\":\"t1\",\"v\":2}") ==
              "+OK committed=1 invalidated=1 delivered=1\n");
        CHECK(ready == std::vector<connection_ref>{1});

        std::string events;
        CHECK(handler.drain_events(1, events) == 1);
        CHECK(events == "EVENT 1 threat UPDATED threat:t1 CRITICAL dropped=0 {\"id\":\"t1\",\"v\":2}\n");

        CHECK(run(2, "GET threat t1") == "*1\n$t1 {\"id\":\"t1\",\"v\":2}\n");
    }

    SUBCASE("subscription predicates apply")
    {
        CHECK(run(2, "MUTATE threat t1 updated low") == "+OK committed=1 invalidated=1 delivered=0\n");
        CHECK(run(2, "MUTATE threat t1 updated high org=org-b") == "+OK committed=1 invalidated=0 delivered=0\n");

        std::string events;
        CHECK(handler.drain_events(1, events) == 0);
        CHECK(events.empty());
    }

    SUBCASE("a mutated threat's enrichment is refetched")
    {
        source.put_enrichment("threat", "t1", "{\"score\":90}");
        CHECK(run(2, "ENRICH threat t1") == "*1\n$t1 {\"score\":90}\n");

        source.put_enrichment("threat", "t1", "{\"score\":40}");
        CHECK(run(2, "MUTATE threat t1 updated low") == "+OK committed=1 invalidated=2 delivered=0\n");

        CHECK(run(2, "ENRICH threat t1") == "*1\n$t1 {\"score\":40}\n");
        CHECK(source.enrich_calls() == 2);
    }

    SUBCASE("bulk commits")
    {
        CHECK(run(2, "MUTATE threat t1,t2 deleted high") == "+OK committed=2 invalidated=1 delivered=2\n");
        CHECK(run(2, "GET threat t1 t2") == "*2\n$t1 null\n$t2 null\n");
    }

    SUBCASE("bad mutations")
    {
        CHECK(run(2, "MUTATE threat t1 exploded high") == "-ERR unknown change kind\n");
        CHECK(run(2, "MUTATE threat t1 updated spicy") == "-ERR unknown severity\n");
        CHECK(starts_with(run(2, "MUTATE threat t1"), "-ERR usage"));
    }

    SUBCASE("UNSUB")
    {
        CHECK(run(1, "UNSUB 1") == "+OK\n");
        CHECK(run(1, "UNSUB 1") == "-ERR no such subscription\n");
        CHECK(run(2, "MUTATE threat t1 updated high") == "+OK committed=1 invalidated=1 delivered=0\n");
    }

    SUBCASE("subscriptions belong to their connection")
    {
        CHECK(run(2, "UNSUB 1") == "-ERR no such subscription\n");
        handler.close(1);
        CHECK(router.subscription_count() == 0);
        CHECK(run(2, "MUTATE threat t1 updated high") == "+OK committed=1 invalidated=1 delivered=0\n");
    }

    SUBCASE("bad subscription options")
    {
        CHECK(run(1, "SUB threat severity=spicy") == "-ERR unknown severity\n");
        CHECK(run(1, "SUB threat kinds=created,exploded") == "-ERR unknown change kind\n");
    }
}

TEST_CASE_FIXTURE(gateway_fixture, "cache administration")
{
    run(1, "GET threat t1 t2");

    CHECK(run(1, "INVALIDATE threat t1") == "+OK 1\n");
    CHECK(run(1, "INVALIDATE threat t1") == "+OK 0\n");

    CHECK(run(1, "TAG threat:t2 hot feed-x") == "+OK\n");
    CHECK(run(1, "UNTAG hot") == "+OK 1\n");
    std::string raw;
    CHECK(store.get("threat:threat:t2", raw) == kv_miss);
    CHECK(run(1, "UNTAG hot") == "+OK 0\n");
}

TEST_CASE_FIXTURE(gateway_fixture, "STATS")
{
    run(1, "GET threat t1");
    run(1, "GET threat t1");

    std::string out = run(1, "STATS");
    CHECK(starts_with(out, "*22\n"));
    CHECK(out.find("$loader.batches 1\n") != std::string::npos);
    CHECK(out.find("$loader.shared_hits 1\n") != std::string::npos);
    CHECK(out.find("$admission.admitted 2\n") != std::string::npos);
    CHECK(out.find("$ratelimit.fail_open 0\n") != std::string::npos);
}

TEST_CASE_FIXTURE(gateway_fixture, "rate limiting")
{
    limiter.set_limit(rate_standard_query, {2, 60000});
    run(1, "GET threat t1");
    run(1, "GET threat t1");
    CHECK(starts_with(run(1, "GET threat t1"), "-RATELIMITED retry_after_ms="));
    CHECK(source.find_calls() == 1);

    // another principal has its own bucket
    run(2, "AUTH bob org-a viewer");
    CHECK(starts_with(run(2, "GET threat t1"), "*1\n"));
}

TEST_CASE("handler without a cache")
{
    memory_entity_source source;
    memory_kv_store store;
    subscription_router router;
    event_bus bus(router, nullptr);
    rate_limiter limiter(store);
    admission_controller admission(limiter);
    gateway_handler handler(gateway_services{source, nullptr, router, bus, admission, loader_limits{}});

    source.put("threat", "t1", "{}");

    std::string out;
    handler.handle_line(1, "INVALIDATE threat t1", out);
    handler.handle_line(1, "UNTAG hot", out);
    CHECK(out == "-ERR no cache configured\n-ERR no cache configured\n");

    out.clear();
    handler.handle_line(1, "GET threat t1 t1", out);
    CHECK(out == "*2\n$t1 {}\n$t1 {}\n");
    CHECK(source.find_calls() == 1);
}
