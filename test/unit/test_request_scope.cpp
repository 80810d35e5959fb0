#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/loader/request_scope.h"
#include "../../intelgate/loader/memory_entity_source.h"
#include "../../intelgate/cache/cache_manager.h"
#include "../../intelgate/store/memory_kv_store.h"

namespace {

void seed(memory_entity_source& src)
{
    src.put("threat", "t1", "{\"id\":\"t1\"}");
    src.put("threat", "t2", "{\"id\":\"t2\"}");
    src.put("threat", "t3", "{\"id\":\"t3\"}");
    src.link("threat", "iocs", "t1", "{\"id\":\"i1\"}");
    src.link("threat", "iocs", "t1", "{\"id\":\"i2\"}");
    src.put_enrichment("ioc", "i1", "{\"reputation\":90}");
}

} // namespace

TEST_CASE("request_scope without a cache")
{
    memory_entity_source src;
    seed(src);

    SUBCASE("loads in one round are coalesced")
    {
        request_scope scope(src, nullptr);
        auto& threats = scope.entities("threat");
        auto a = threats.load("t1");
        auto b = threats.load("t2");
        auto c = threats.load("t1");
        auto d = threats.load("t3");
        scope.flush();

        CHECK(src.find_calls() == 1);
        CHECK(src.last_batch_size() == 3);
        REQUIRE(a.ready());
        CHECK(*a.get() == "{\"id\":\"t1\"}");
        CHECK(*c.get() == *a.get());
        CHECK(d.get().has_value());
        CHECK(scope.rounds() == 1);
    }

    SUBCASE("batch size splits the fetch")
    {
        loader_limits limits;
        limits.entity_batch = 2;
        request_scope scope(src, nullptr, limits);
        scope.entities("threat").load_many({"t1", "t2", "t3", "t4", "t5"});
        scope.flush();
        CHECK(src.find_calls() == 3);
        CHECK(scope.stats().batches == 3);
        CHECK(scope.stats().keys_fetched == 5);
    }

    SUBCASE("missing entities resolve empty")
    {
        request_scope scope(src, nullptr);
        auto f = scope.entities("threat").load("nope");
        scope.flush();
        REQUIRE(f.ready());
        CHECK_FALSE(f.get().has_value());
    }

    SUBCASE("the same loader is returned per type")
    {
        request_scope scope(src, nullptr);
        CHECK(&scope.entities("threat") == &scope.entities("threat"));
        CHECK(&scope.entities("threat") != &scope.entities("ioc"));
        CHECK(&scope.relations("threat", "iocs") == &scope.relations("threat", "iocs"));
    }

    SUBCASE("continuations feed the next round")
    {
        request_scope scope(src, nullptr);
        auto& rel = scope.relations("threat", "iocs");
        std::vector<std::string> iocs;
        scope.entities("threat").load("t1").then([&](const std::optional<std::string>& doc) {
            if (doc)
            {
                rel.load("t1").then(
                    [&](const std::vector<std::string>& docs) { iocs = docs; });
            }
        });
        scope.flush();

        CHECK(scope.rounds() == 2);
        CHECK(iocs.size() == 2);
        CHECK(src.relation_calls() == 1);
    }

    SUBCASE("separate scopes do not share memos")
    {
        {
            request_scope scope(src, nullptr);
            scope.entities("threat").load("t1");
            scope.flush();
        }
        request_scope scope(src, nullptr);
        scope.entities("threat").load("t1");
        scope.flush();
        CHECK(src.find_calls() == 2);
    }
}

TEST_CASE("request_scope with the shared cache")
{
    memory_entity_source src;
    seed(src);
    memory_kv_store store;
    cache_manager cache(store);

    SUBCASE("fetched entities are written back and served to later scopes")
    {
        {
            request_scope scope(src, &cache);
            scope.entities("threat").load_many({"t1", "t2"});
            scope.flush();
        }

        std::string raw;
        CHECK(store.get("threat:threat:t1", raw) == kv_ok);
        CHECK(raw == "{\"id\":\"t1\"}");

        request_scope scope(src, &cache);
        auto f = scope.entities("threat").load("t1");
        scope.flush();
        CHECK(src.find_calls() == 1);
        CHECK(scope.stats().shared_hits == 1);
        CHECK(*f.get() == "{\"id\":\"t1\"}");
    }

    SUBCASE("missing entities are not cached")
    {
        {
            request_scope scope(src, &cache);
            scope.entities("threat").load("nope");
            scope.flush();
        }
        request_scope scope(src, &cache);
        scope.entities("threat").load("nope");
        scope.flush();
        CHECK(src.find_calls() == 2);
    }

    SUBCASE("relationship lists are cached, empty ones included")
    {
        {
            request_scope scope(src, &cache);
            scope.relations("threat", "iocs").load_many({"t1", "t2"});
            scope.flush();
        }

        std::string raw;
        CHECK(store.get("threat:rel:threat:t1:iocs", raw) == kv_ok);
        CHECK(store.get("threat:rel:threat:t2:iocs", raw) == kv_ok);

        request_scope scope(src, &cache);
        auto full = scope.relations("threat", "iocs").load("t1");
        auto empty = scope.relations("threat", "iocs").load("t2");
        scope.flush();
        CHECK(src.relation_calls() == 1);
        CHECK(full.get().size() == 2);
        CHECK(empty.get().empty());
    }

    SUBCASE("undeclared relations are fetched but never cached")
    {
        src.link("threat", "siblings", "t1", "{\"id\":\"t2\"}");
        for (int i = 0; i < 2; ++i)
        {
            request_scope scope(src, &cache);
            auto f = scope.relations("threat", "siblings").load("t1");
            scope.flush();
            CHECK(f.get().size() == 1);
        }

        std::string raw;
        CHECK(store.get("threat:rel:threat:t1:siblings", raw) == kv_miss);
        CHECK(src.relation_calls() == 2);
    }

    SUBCASE("a threat change refetches its enrichment")
    {
        src.put_enrichment("threat", "t1", "{\"score\":90}");
        {
            request_scope scope(src, &cache);
            scope.enrichments("threat").load("t1");
            scope.flush();
        }

        src.put_enrichment("threat", "t1", "{\"score\":40}");
        CHECK(cache.invalidate("threat", "t1") == 1);

        request_scope scope(src, &cache);
        auto f = scope.enrichments("threat").load("t1");
        scope.flush();
        CHECK(src.enrich_calls() == 2);
        CHECK(*f.get() == "{\"score\":40}");
    }

    SUBCASE("enrichment is keyed by id and type")
    {
        {
            request_scope scope(src, &cache);
            scope.enrichments("ioc").load("i1");
            scope.flush();
        }

        std::string raw;
        REQUIRE(store.get("threat:enrichment:i1:ioc", raw) == kv_ok);
        CHECK(raw == "{\"reputation\":90}");

        request_scope scope(src, &cache);
        auto f = scope.enrichments("ioc").load("i1");
        scope.flush();
        CHECK(src.enrich_calls() == 1);
        CHECK(f.get().has_value());
    }

    SUBCASE("invalidation forces a refetch")
    {
        {
            request_scope scope(src, &cache);
            scope.entities("threat").load("t1");
            scope.flush();
        }
        src.put("threat", "t1", "{\"id\":\"t1\",\"v\":2}");
        CHECK(cache.invalidate("threat", "t1") >= 1);

        request_scope scope(src, &cache);
        auto f = scope.entities("threat").load("t1");
        scope.flush();
        CHECK(src.find_calls() == 2);
        CHECK(*f.get() == "{\"id\":\"t1\",\"v\":2}");
    }
}
