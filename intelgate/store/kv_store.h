#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../shared/string_hash.h"

enum kv_status : uint8_t
{
    kv_ok          = 0,
    kv_miss        = 1,
    kv_unavailable = 2
};

enum kv_op_type : uint8_t
{
    kv_op_set    = 0,
    kv_op_del    = 1,
    kv_op_sadd   = 2,
    kv_op_expire = 3,
    kv_op_incr   = 4
};

struct kv_op
{
    kv_op_type type;
    std::string key;
    std::string value;  // set: value, sadd: member
    int64_t number{0};  // set/expire: ttl in ms (<= 0 = none), incr: delta
};

// Write commands sent to the store in one round trip
class kv_pipeline
{
public:
    void set(std::string_view key, std::string_view value, int64_t ttl_ms = 0)
    {
        m_ops.push_back({kv_op_set, std::string(key), std::string(value), ttl_ms});
    }

    void del(std::string_view key)
    {
        m_ops.push_back({kv_op_del, std::string(key), {}, 0});
    }

    void sadd(std::string_view key, std::string_view member)
    {
        m_ops.push_back({kv_op_sadd, std::string(key), std::string(member), 0});
    }

    void expire(std::string_view key, int64_t ttl_ms)
    {
        m_ops.push_back({kv_op_expire, std::string(key), {}, ttl_ms});
    }

    void incr(std::string_view key, int64_t delta)
    {
        m_ops.push_back({kv_op_incr, std::string(key), {}, delta});
    }

    const std::vector<kv_op>& ops() const { return m_ops; }
    size_t size() const { return m_ops.size(); }
    bool empty() const { return m_ops.empty(); }
    void clear() { m_ops.clear(); }

private:
    std::vector<kv_op> m_ops;
};

// Shared key/value store holding cache entries, tag sets and rate-limit
// counters. Every bool return means "the store answered"; false is the
// CacheUnavailable condition and callers degrade instead of failing.
class kv_store
{
public:
    virtual ~kv_store() = default;

    virtual kv_status get(std::string_view key, std::string& out) = 0;
    // ttl_ms <= 0 stores without expiry
    virtual bool set(std::string_view key, std::string_view value, int64_t ttl_ms) = 0;
    // out[i] is empty for a missing key
    virtual bool mget(const std::vector<std::string>& keys,
                      std::vector<std::optional<std::string>>& out) = 0;
    virtual bool del(const std::vector<std::string>& keys, int64_t& removed) = 0;
    // Glob pattern (`*`, `?`, `[...]`)
    virtual bool keys(std::string_view pattern, std::vector<std::string>& out) = 0;
    virtual bool incr(std::string_view key, int64_t delta, int64_t& result) = 0;
    virtual bool expire(std::string_view key, int64_t ttl_ms) = 0;
    // Remaining ttl in ms; -1 = no expiry, -2 = no such key
    virtual bool pttl(std::string_view key, int64_t& out) = 0;
    virtual bool sadd(std::string_view key, std::string_view member) = 0;
    virtual bool smembers(std::string_view key, std::vector<std::string>& out) = 0;
    virtual bool ping() = 0;
    virtual bool exec(const kv_pipeline& pipeline) = 0;

    bool mset(const std::vector<std::pair<std::string, std::string>>& items, int64_t ttl_ms)
    {
        if (items.empty())
            return true;
        kv_pipeline p;
        for (const auto& [key, value] : items)
            p.set(key, value, ttl_ms);
        return exec(p);
    }
};
