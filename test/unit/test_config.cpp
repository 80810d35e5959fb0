#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../intelgate/daemon/gateway_config.h"
#include "../../intelgate/cache/cache_policy.h"
#include "../../intelgate/store/memory_kv_store.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

struct temp_dir
{
    fs::path path;

    temp_dir()
    {
        char tmpl[] = "/tmp/intelgate-config-XXXXXX";
        REQUIRE(mkdtemp(tmpl) != nullptr);
        path = tmpl;
    }

    ~temp_dir() { fs::remove_all(path); }

    std::string write(const char* name, const std::string& content)
    {
        fs::path p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("load_gateway_config")
{
    temp_dir dir;

    SUBCASE("missing file fails")
    {
        gateway_config cfg;
        CHECK_FALSE(load_gateway_config((dir.path / "nope.lua").string(), cfg));
    }

    SUBCASE("syntax errors fail")
    {
        gateway_config cfg;
        CHECK_FALSE(load_gateway_config(dir.write("bad.lua", "config = {"), cfg));
    }

    SUBCASE("no config table keeps defaults")
    {
        gateway_config cfg;
        CHECK(load_gateway_config(dir.write("empty.lua", "x = 1"), cfg));
        CHECK(cfg.port == 7420);
        CHECK(cfg.store == store_memory);
        CHECK(cfg.key_prefix == "threat:");
        CHECK_FALSE(cfg.level_set);
    }

    SUBCASE("full table")
    {
        std::string path = dir.write("full.lua", R"(
config = {
    log_level = "debug",
    port = 9000,
    store = { kind = "resp", host = "10.0.0.5", port = 6380, timeout_ms = 250, tls = true },
    key_prefix = "intel:",
    ttl = { default = 60, ioc = 120 },
    rate_limits = {
        enrichment = { points = 3, duration_ms = 1000 },
        bogus = { points = 1 },
    },
    cost = {
        ceiling = 500,
        max_depth = 6,
        role_scaling = true,
        weights = { ["Threat.iocs"] = 5 },
        list_defaults = { ["Query.threats"] = 4 },
    },
    loader = { entity_batch = 10, relation_batch = 0, fetch_timeout_ms = 750 },
    cache = {
        derived = { "reputation" },
        dependents = { ioc = { "reputation:{id}:*" } },
    },
    subscription_queue = 32,
    source = "scripts/source.lua",
}
)");
        gateway_config cfg;
        REQUIRE(load_gateway_config(path, cfg));

        CHECK(cfg.level_set);
        CHECK(cfg.level == log_debug);
        CHECK(cfg.port == 9000);
        CHECK(cfg.store == store_resp);
        CHECK(cfg.resp.host == "10.0.0.5");
        CHECK(cfg.resp.port == 6380);
        CHECK(cfg.resp.timeout_ms == 250);
        CHECK(cfg.resp.tls);
        CHECK(cfg.key_prefix == "intel:");
        CHECK(cfg.ttl_overrides.size() == 2);

        REQUIRE(cfg.rate_limits.size() == 1);
        CHECK(cfg.rate_limits[0].first == rate_enrichment);
        CHECK(cfg.rate_limits[0].second.points == 3);

        CHECK(cfg.cost.ceiling == 500);
        CHECK(cfg.cost.max_depth == 6);
        CHECK(cfg.cost.role_scaling);

        CHECK(cfg.loader.entity_batch == 10);
        CHECK(cfg.loader.relation_batch == 50);
        CHECK(cfg.loader.fetch_timeout.count() == 750);

        CHECK(cfg.subscription_queue == 32);
        CHECK(cfg.source_script == "scripts/source.lua");

        SUBCASE("applied to the components")
        {
            cache_policy policy;
            apply_cache_config(cfg, policy);
            CHECK(policy.ttl_seconds("ioc") == 120);
            CHECK(policy.ttl_seconds("unlisted") == 60);
            CHECK(policy.ttl_seconds("threat") == 3600);
            CHECK(policy.uncovered_derived_types().empty());

            cost_schema schema = cost_schema::defaults();
            apply_cost_config(cfg, schema);
            REQUIRE(schema.find("Threat", "iocs") != nullptr);
            CHECK(schema.find("Threat", "iocs")->weight == 5);
            CHECK(schema.find("Query", "threats")->default_size == 4);

            memory_kv_store store;
            rate_limiter limiter(store);
            apply_rate_config(cfg, limiter);
            CHECK(limiter.limit(rate_enrichment).points == 3);
            CHECK(limiter.limit(rate_enrichment).duration_ms == 1000);
            CHECK(limiter.limit(rate_standard_query).points == 100);
        }
    }

    SUBCASE("invalid values are skipped")
    {
        std::string path = dir.write("invalid.lua", R"(
config = {
    log_level = "chatty",
    port = 70000,
    store = { kind = "tape" },
    ttl = { threat = -5, ioc = "long" },
    subscription_queue = 0,
}
)");
        gateway_config cfg;
        REQUIRE(load_gateway_config(path, cfg));
        CHECK_FALSE(cfg.level_set);
        CHECK(cfg.port == 7420);
        CHECK(cfg.store == store_memory);
        CHECK(cfg.ttl_overrides.empty());
        CHECK(cfg.subscription_queue == 256);
    }
}

TEST_CASE("shipped example config")
{
    gateway_config cfg;
    REQUIRE(load_gateway_config("examples/config/intelgate.lua", cfg));
    CHECK(cfg.store == store_memory);
    CHECK(cfg.source_script == "examples/scripts/source.lua");
    CHECK(cfg.rate_limits.size() == 4);

    cache_policy policy;
    apply_cache_config(cfg, policy);
    CHECK(policy.uncovered_derived_types().empty());
}
