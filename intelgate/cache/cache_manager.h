#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "entity_key.h"
#include "cache_policy.h"
#include "../store/kv_store.h"

struct cache_stats
{
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t errors = 0;
    uint64_t sets = 0;
    uint64_t invalidated_keys = 0;
    uint64_t partial_invalidations = 0;  // dependent scans that failed
};

// Shared cache in front of the entity source. A store that cannot be
// reached never fails a request: reads become misses, writes report false,
// and every such event is logged and counted.
class cache_manager
{
public:
    static constexpr int64_t TAG_TTL_SECONDS = 86400;
    // Passed as ttl to use the type's default
    static constexpr int64_t TYPE_TTL = -1;

    cache_manager(kv_store& store, cache_policy policy = {}, std::string key_prefix = "threat:");

    kv_status get(const entity_key& key, std::string& out);
    bool set(const entity_key& key, std::string_view value, int64_t ttl_seconds = TYPE_TTL);
    bool del(const entity_key& key);

    // out[i] belongs to ids[i]
    bool mget(std::string_view type, const std::vector<std::string>& ids,
              std::vector<std::optional<std::string>>& out, std::string_view suffix = {});
    // One pipeline for the whole batch
    bool mset(std::string_view type, const std::vector<std::pair<std::string, std::string>>& items,
              int64_t ttl_seconds = TYPE_TTL, std::string_view suffix = {});

    // Relationship lists, stored as an encoded array
    kv_status get_list(const entity_key& key, std::vector<std::string>& out);
    bool set_list(const entity_key& key, const std::vector<std::string>& items,
                  int64_t ttl_seconds = TYPE_TTL);

    // Deletes the direct key and every dependent pattern. A pattern whose
    // scan fails is skipped and counted in partial_invalidations. Returns
    // the number of keys removed, -1 when the delete itself fails.
    int64_t invalidate(std::string_view type, std::string_view id);

    // `key` is relative to the prefix (type:id[:suffix])
    bool tag(std::string_view key, const std::vector<std::string>& tags);
    int64_t invalidate_by_tag(std::string_view tag);

    // Stable id for a search result: hex SHA-256 of the canonical triple
    static std::string search_key(std::string_view query, std::string_view filters, std::string_view sort);

    bool health_check();
    cache_stats stats() const;

    const cache_policy& policy() const { return m_policy; }
    cache_policy& policy() { return m_policy; }
    const std::string& key_prefix() const { return m_prefix; }
    std::string full_key(const entity_key& key) const { return m_prefix + key.str(); }

private:
    std::string prefixed(std::string_view relative) const;
    int64_t ttl_ms(std::string_view type, int64_t ttl_seconds) const;
    void unavailable(const char* op, std::string_view key);

    kv_store& m_store;
    cache_policy m_policy;
    std::string m_prefix;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_errors{0};
    std::atomic<uint64_t> m_sets{0};
    std::atomic<uint64_t> m_invalidated{0};
    std::atomic<uint64_t> m_partial{0};
};
