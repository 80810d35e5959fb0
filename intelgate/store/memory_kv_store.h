#pragma once
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "kv_store.h"
#include "../shared/clock.h"

using string_map = std::unordered_map<std::string, std::string, string_hash, string_equal>;
using set_inner = std::unordered_set<std::string, string_hash, string_equal>;
using set_map = std::unordered_map<std::string, set_inner, string_hash, string_equal>;
using expiry_map = std::unordered_map<std::string, clock_source::time_point, string_hash, string_equal>;

// Single-process store backing the daemon when no shared store is
// configured, and the tests. Strings and sets share one key space.
// Expired keys are dropped lazily on access and eagerly by sweep_expired().
class memory_kv_store : public kv_store
{
public:
    explicit memory_kv_store(const clock_source& clock = steady_clock_source::instance());

    kv_status get(std::string_view key, std::string& out) override;
    bool set(std::string_view key, std::string_view value, int64_t ttl_ms) override;
    bool mget(const std::vector<std::string>& keys,
              std::vector<std::optional<std::string>>& out) override;
    bool del(const std::vector<std::string>& keys, int64_t& removed) override;
    bool keys(std::string_view pattern, std::vector<std::string>& out) override;
    bool incr(std::string_view key, int64_t delta, int64_t& result) override;
    bool expire(std::string_view key, int64_t ttl_ms) override;
    bool pttl(std::string_view key, int64_t& out) override;
    bool sadd(std::string_view key, std::string_view member) override;
    bool smembers(std::string_view key, std::vector<std::string>& out) override;
    bool ping() override { return true; }
    bool exec(const kv_pipeline& pipeline) override;

    // Removes expired keys, returns their names
    std::vector<std::string> sweep_expired();
    size_t size() const;

private:
    // Callers hold m_mutex
    void check_expiry(std::string_view key);
    bool exists(std::string_view key) const;
    bool erase(std::string_view key);
    void set_locked(std::string_view key, std::string_view value, int64_t ttl_ms);
    bool incr_locked(std::string_view key, int64_t delta, int64_t& result);
    bool expire_locked(std::string_view key, int64_t ttl_ms);
    bool sadd_locked(std::string_view key, std::string_view member);

    const clock_source& m_clock;
    mutable std::mutex m_mutex;
    string_map m_data;
    set_map m_sets;
    expiry_map m_expiry;
};
