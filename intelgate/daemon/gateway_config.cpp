#include "gateway_config.h"
#include "../cache/cache_policy.h"

#include <fstream>
#include <sol/sol.hpp>

static void read_store(const sol::table& t, gateway_config& out)
{
    sol::optional<std::string> kind = t["kind"];
    if (kind)
    {
        if (*kind == "memory")
            out.store = store_memory;
        else if (*kind == "resp" || *kind == "redis")
            out.store = store_resp;
        else
            LOG_WARNF("[config] unknown store kind '%s', keeping default", kind->c_str());
    }

    sol::optional<std::string> host = t["host"];
    if (host && !host->empty())
        out.resp.host = *host;

    sol::optional<int> port = t["port"];
    if (port)
    {
        if (*port > 0 && *port <= 65535)
            out.resp.port = static_cast<uint16_t>(*port);
        else
            LOG_WARNF("[config] store.port %d out of range", *port);
    }

    sol::optional<int> timeout = t["timeout_ms"];
    if (timeout && *timeout >= 0)
        out.resp.timeout_ms = static_cast<uint32_t>(*timeout);

    sol::optional<int> backoff = t["reconnect_backoff_ms"];
    if (backoff && *backoff >= 0)
        out.resp.reconnect_backoff_ms = static_cast<uint32_t>(*backoff);

    sol::optional<std::string> password = t["password"];
    if (password)
        out.resp.password = *password;

    sol::optional<bool> tls = t["tls"];
    if (tls)
        out.resp.tls = *tls;

    sol::optional<std::string> ca = t["ca"];
    if (ca)
        out.resp.ca_path = *ca;
    sol::optional<std::string> cert = t["cert"];
    if (cert)
        out.resp.client_cert = *cert;
    sol::optional<std::string> key = t["key"];
    if (key)
        out.resp.client_key = *key;
}

// { name = number, ... } into (name, value) pairs
static void read_number_map(const sol::table& t, const char* what,
                            std::vector<std::pair<std::string, int64_t>>& out)
{
    t.for_each([&](const sol::object& k, const sol::object& v) {
        if (!k.is<std::string>() || !v.is<int64_t>())
        {
            LOG_WARNF("[config] ignoring non-numeric entry in %s", what);
            return;
        }
        int64_t n = v.as<int64_t>();
        if (n < 0)
        {
            LOG_WARNF("[config] ignoring negative %s.%s", what, k.as<std::string>().c_str());
            return;
        }
        out.emplace_back(k.as<std::string>(), n);
    });
}

static void read_rate_limits(const sol::table& t, gateway_config& out)
{
    t.for_each([&](const sol::object& k, const sol::object& v) {
        operation_class oc;
        if (!k.is<std::string>() || !parse_operation_class(k.as<std::string>(), oc))
        {
            LOG_WARN("[config] unknown operation class in rate_limits");
            return;
        }
        if (!v.is<sol::table>())
            return;

        sol::table entry = v.as<sol::table>();
        rate_limit lim;
        sol::optional<int64_t> points = entry["points"];
        sol::optional<int64_t> duration = entry["duration_ms"];
        if (points)
            lim.points = *points;
        if (duration)
            lim.duration_ms = *duration;
        out.rate_limits.emplace_back(oc, lim);
    });
}

static void read_cost(const sol::table& t, gateway_config& out)
{
    sol::optional<int64_t> ceiling = t["ceiling"];
    if (ceiling && *ceiling > 0)
        out.cost.ceiling = *ceiling;

    sol::optional<int> depth = t["max_depth"];
    if (depth && *depth > 0)
        out.cost.max_depth = *depth;

    sol::optional<bool> scaling = t["role_scaling"];
    if (scaling)
        out.cost.role_scaling = *scaling;

    sol::optional<sol::table> weights = t["weights"];
    if (weights)
        read_number_map(*weights, "cost.weights", out.weight_overrides);

    sol::optional<sol::table> lists = t["list_defaults"];
    if (lists)
        read_number_map(*lists, "cost.list_defaults", out.list_size_overrides);
}

static void read_loader(const sol::table& t, gateway_config& out)
{
    auto read_size = [&](const char* key, size_t& dst) {
        sol::optional<int> v = t[key];
        if (!v)
            return;
        if (*v > 0)
            dst = static_cast<size_t>(*v);
        else
            LOG_WARNF("[config] loader.%s must be positive", key);
    };
    read_size("entity_batch", out.loader.entity_batch);
    read_size("relation_batch", out.loader.relation_batch);
    read_size("enrichment_batch", out.loader.enrichment_batch);

    sol::optional<int> timeout = t["fetch_timeout_ms"];
    if (timeout && *timeout >= 0)
        out.loader.fetch_timeout = std::chrono::milliseconds(*timeout);
}

static void read_cache(const sol::table& t, gateway_config& out)
{
    sol::optional<sol::table> derived = t["derived"];
    if (derived)
    {
        for (size_t i = 1; i <= derived->size(); ++i)
        {
            sol::optional<std::string> d = (*derived)[i];
            if (d)
                out.derived_types.push_back(*d);
        }
    }

    sol::optional<sol::table> deps = t["dependents"];
    if (deps)
    {
        deps->for_each([&](const sol::object& k, const sol::object& v) {
            if (!k.is<std::string>() || !v.is<sol::table>())
                return;
            sol::table patterns = v.as<sol::table>();
            for (size_t i = 1; i <= patterns.size(); ++i)
            {
                sol::optional<std::string> p = patterns[i];
                if (p)
                    out.dependents.emplace_back(k.as<std::string>(), *p);
            }
        });
    }
}

bool load_gateway_config(const std::string& path, gateway_config& out)
{
    std::ifstream check(path);
    if (!check.good())
    {
        LOG_ERRORF("[config] cannot open %s", path.c_str());
        return false;
    }
    check.close();

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::os);

    auto result = lua.safe_script_file(path, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_ERRORF("[config] error loading %s: %s", path.c_str(), err.what());
        return false;
    }

    sol::optional<sol::table> config = lua["config"];
    if (!config)
    {
        LOG_WARNF("[config] %s defines no config table, using defaults", path.c_str());
        return true;
    }
    const sol::table& c = *config;

    sol::optional<std::string> ll = c["log_level"];
    if (ll)
    {
        if (logger::parse_level(*ll, out.level))
            out.level_set = true;
        else
            LOG_WARNF("[config] unknown log_level '%s'", ll->c_str());
    }

    sol::optional<int> port = c["port"];
    if (port)
    {
        if (*port > 0 && *port <= 65535)
            out.port = static_cast<uint16_t>(*port);
        else
            LOG_WARNF("[config] port %d out of range", *port);
    }

    sol::optional<sol::table> store = c["store"];
    if (store)
        read_store(*store, out);

    sol::optional<std::string> prefix = c["key_prefix"];
    if (prefix)
        out.key_prefix = *prefix;

    sol::optional<sol::table> ttl = c["ttl"];
    if (ttl)
        read_number_map(*ttl, "ttl", out.ttl_overrides);

    sol::optional<sol::table> limits = c["rate_limits"];
    if (limits)
        read_rate_limits(*limits, out);

    sol::optional<sol::table> cost = c["cost"];
    if (cost)
        read_cost(*cost, out);

    sol::optional<sol::table> loader = c["loader"];
    if (loader)
        read_loader(*loader, out);

    sol::optional<sol::table> cache = c["cache"];
    if (cache)
        read_cache(*cache, out);

    sol::optional<int> queue = c["subscription_queue"];
    if (queue)
    {
        if (*queue > 0)
            out.subscription_queue = static_cast<size_t>(*queue);
        else
            LOG_WARN("[config] subscription_queue must be positive");
    }

    sol::optional<int> sweep = c["sweep_ms"];
    if (sweep && *sweep >= 10)
        out.sweep_ms = static_cast<uint32_t>(*sweep);

    sol::optional<std::string> source = c["source"];
    if (source)
        out.source_script = *source;

    return true;
}

void apply_cache_config(const gateway_config& cfg, cache_policy& policy)
{
    for (const auto& [type, seconds] : cfg.ttl_overrides)
    {
        if (type == "default")
            policy.set_default_ttl(seconds);
        else
            policy.set_ttl(type, seconds);
    }
    for (const auto& d : cfg.derived_types)
        policy.add_derived_type(d);
    for (const auto& [type, pattern] : cfg.dependents)
        policy.add_dependent(type, pattern);
}

void apply_cost_config(const gateway_config& cfg, cost_schema& schema)
{
    for (const auto& [field, weight] : cfg.weight_overrides)
    {
        if (!schema.set_weight(field, weight))
            LOG_WARNF("[config] cost.weights: %s must not be negative", field.c_str());
    }
    for (const auto& [field, size] : cfg.list_size_overrides)
    {
        if (!schema.set_default_size(field, size))
            LOG_WARNF("[config] cost.list_defaults: %s is not a list field", field.c_str());
    }
}

void apply_rate_config(const gateway_config& cfg, rate_limiter& limiter)
{
    for (const auto& [oc, lim] : cfg.rate_limits)
        limiter.set_limit(oc, lim);
}
