#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "../admission/query_cost.h"
#include "../admission/rate_limiter.h"
#include "../loader/request_scope.h"
#include "../shared/logging.h"
#include "../store/resp_kv_store.h"

class cache_policy;

enum store_kind : uint8_t
{
    store_memory = 0,
    store_resp   = 1
};

struct gateway_config
{
    log_level level = log_info;
    bool level_set = false;
    uint16_t port = 7420;

    store_kind store = store_memory;
    resp_store_config resp;
    std::string key_prefix = "threat:";

    std::vector<std::pair<std::string, int64_t>> ttl_overrides;
    // type -> extra dependent pattern
    std::vector<std::pair<std::string, std::string>> dependents;
    std::vector<std::string> derived_types;

    std::vector<std::pair<operation_class, rate_limit>> rate_limits;

    cost_limits cost;
    std::vector<std::pair<std::string, int64_t>> weight_overrides;
    std::vector<std::pair<std::string, int64_t>> list_size_overrides;

    loader_limits loader;
    size_t subscription_queue = 256;
    // Sweep interval for the in-memory store
    uint32_t sweep_ms = 1000;

    std::string source_script;
};

// Evaluates the Lua file at `path` and reads its `config` table into `out`.
// Absent keys keep their defaults; invalid values are logged and skipped.
// Returns false only when the script itself fails to load.
bool load_gateway_config(const std::string& path, gateway_config& out);

void apply_cache_config(const gateway_config& cfg, cache_policy& policy);
void apply_cost_config(const gateway_config& cfg, cost_schema& schema);
void apply_rate_config(const gateway_config& cfg, rate_limiter& limiter);
