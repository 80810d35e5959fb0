#include "cache_manager.h"
#include "../shared/digest.h"
#include "../shared/logging.h"
#include "../store/resp_codec.h"

#include <algorithm>

cache_manager::cache_manager(kv_store& store, cache_policy policy, std::string key_prefix)
    : m_store(store), m_policy(std::move(policy)), m_prefix(std::move(key_prefix))
{
}

std::string cache_manager::prefixed(std::string_view relative) const
{
    std::string out;
    out.reserve(m_prefix.size() + relative.size());
    out += m_prefix;
    out.append(relative.data(), relative.size());
    return out;
}

int64_t cache_manager::ttl_ms(std::string_view type, int64_t ttl_seconds) const
{
    if (ttl_seconds < 0)
        ttl_seconds = m_policy.ttl_seconds(type);
    return ttl_seconds * 1000;
}

void cache_manager::unavailable(const char* op, std::string_view key)
{
    m_errors.fetch_add(1, std::memory_order_relaxed);
    LOG_WARNF("cache %s %.*s: store unavailable, falling back", op,
              static_cast<int>(key.size()), key.data());
}

// ─── Single keys ───

kv_status cache_manager::get(const entity_key& key, std::string& out)
{
    std::string full = full_key(key);
    kv_status st = m_store.get(full, out);
    switch (st)
    {
        case kv_ok:
            m_hits.fetch_add(1, std::memory_order_relaxed);
            break;
        case kv_miss:
            m_misses.fetch_add(1, std::memory_order_relaxed);
            break;
        case kv_unavailable:
            unavailable("get", full);
            m_misses.fetch_add(1, std::memory_order_relaxed);
            break;
    }
    return st;
}

bool cache_manager::set(const entity_key& key, std::string_view value, int64_t ttl_seconds)
{
    std::string full = full_key(key);
    if (!m_store.set(full, value, ttl_ms(key.type, ttl_seconds)))
    {
        unavailable("set", full);
        return false;
    }
    m_sets.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool cache_manager::del(const entity_key& key)
{
    std::string full = full_key(key);
    int64_t removed = 0;
    if (!m_store.del({full}, removed))
    {
        unavailable("del", full);
        return false;
    }
    m_invalidated.fetch_add(static_cast<uint64_t>(removed), std::memory_order_relaxed);
    return true;
}

// ─── Batches ───

bool cache_manager::mget(std::string_view type, const std::vector<std::string>& ids,
                         std::vector<std::optional<std::string>>& out, std::string_view suffix)
{
    out.clear();
    if (ids.empty())
        return true;

    std::vector<std::string> keys;
    keys.reserve(ids.size());
    for (const auto& id : ids)
        keys.push_back(full_key(entity_key{std::string(type), id, std::string(suffix)}));

    if (!m_store.mget(keys, out) || out.size() != ids.size())
    {
        unavailable("mget", type);
        out.assign(ids.size(), std::nullopt);
        m_misses.fetch_add(ids.size(), std::memory_order_relaxed);
        return false;
    }

    uint64_t hits = 0;
    for (const auto& v : out)
    {
        if (v)
            ++hits;
    }
    m_hits.fetch_add(hits, std::memory_order_relaxed);
    m_misses.fetch_add(ids.size() - hits, std::memory_order_relaxed);
    return true;
}

bool cache_manager::mset(std::string_view type, const std::vector<std::pair<std::string, std::string>>& items,
                         int64_t ttl_seconds, std::string_view suffix)
{
    if (items.empty())
        return true;

    int64_t ttl = ttl_ms(type, ttl_seconds);
    kv_pipeline p;
    for (const auto& [id, value] : items)
        p.set(full_key(entity_key{std::string(type), id, std::string(suffix)}), value, ttl);

    if (!m_store.exec(p))
    {
        unavailable("mset", type);
        return false;
    }
    m_sets.fetch_add(items.size(), std::memory_order_relaxed);
    return true;
}

// ─── Lists ───

kv_status cache_manager::get_list(const entity_key& key, std::vector<std::string>& out)
{
    std::string raw;
    kv_status st = get(key, raw);
    if (st != kv_ok)
        return st;

    if (!resp::decode_list(raw, out))
    {
        LOG_WARNF("cache: dropping malformed list at %s", full_key(key).c_str());
        del(key);
        return kv_miss;
    }
    return kv_ok;
}

bool cache_manager::set_list(const entity_key& key, const std::vector<std::string>& items, int64_t ttl_seconds)
{
    return set(key, resp::encode_list(items), ttl_seconds);
}

// ─── Invalidation ───

int64_t cache_manager::invalidate(std::string_view type, std::string_view id)
{
    std::vector<std::string> doomed;
    doomed.push_back(full_key(entity_key{std::string(type), std::string(id), {}}));

    // A failed scan skips that pattern only; the direct key still goes
    for (const auto& pattern : m_policy.dependent_patterns(type, id))
    {
        std::vector<std::string> matched;
        std::string full_pattern = cache_policy::escape_glob(m_prefix) + pattern;
        if (!m_store.keys(full_pattern, matched))
        {
            unavailable("invalidate scan", full_pattern);
            m_partial.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        doomed.insert(doomed.end(), matched.begin(), matched.end());
    }

    std::sort(doomed.begin(), doomed.end());
    doomed.erase(std::unique(doomed.begin(), doomed.end()), doomed.end());

    int64_t removed = 0;
    if (!m_store.del(doomed, removed))
    {
        unavailable("invalidate", doomed.front());
        return -1;
    }

    m_invalidated.fetch_add(static_cast<uint64_t>(removed), std::memory_order_relaxed);
    LOG_DEBUGF("cache: invalidated %.*s:%.*s (%lld keys)", static_cast<int>(type.size()), type.data(),
               static_cast<int>(id.size()), id.data(), static_cast<long long>(removed));
    return removed;
}

bool cache_manager::tag(std::string_view key, const std::vector<std::string>& tags)
{
    if (tags.empty())
        return true;

    std::string member = prefixed(key);
    kv_pipeline p;
    for (const auto& t : tags)
    {
        std::string tag_key = prefixed("tag:" + t);
        p.sadd(tag_key, member);
        p.expire(tag_key, TAG_TTL_SECONDS * 1000);
    }

    if (!m_store.exec(p))
    {
        unavailable("tag", member);
        return false;
    }
    return true;
}

int64_t cache_manager::invalidate_by_tag(std::string_view tag)
{
    std::string tag_key = prefixed("tag:" + std::string(tag));
    std::vector<std::string> members;
    if (!m_store.smembers(tag_key, members))
    {
        unavailable("invalidate_by_tag", tag_key);
        return -1;
    }

    // Members that already expired are not counted
    int64_t removed = 0;
    if (!members.empty() && !m_store.del(members, removed))
    {
        unavailable("invalidate_by_tag", tag_key);
        return -1;
    }

    int64_t ignored = 0;
    if (!m_store.del({tag_key}, ignored))
        unavailable("invalidate_by_tag", tag_key);

    m_invalidated.fetch_add(static_cast<uint64_t>(removed), std::memory_order_relaxed);
    return removed;
}

// ─── Misc ───

std::string cache_manager::search_key(std::string_view query, std::string_view filters, std::string_view sort)
{
    // Length-prefixed so that ("ab","c") and ("a","bc") differ
    std::string canonical;
    for (auto part : {query, filters, sort})
    {
        canonical += std::to_string(part.size());
        canonical += ':';
        canonical.append(part.data(), part.size());
    }
    return sha256_hex(canonical);
}

bool cache_manager::health_check()
{
    if (m_store.ping())
        return true;
    m_errors.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("cache: health check failed");
    return false;
}

cache_stats cache_manager::stats() const
{
    cache_stats s;
    s.hits = m_hits.load(std::memory_order_relaxed);
    s.misses = m_misses.load(std::memory_order_relaxed);
    s.errors = m_errors.load(std::memory_order_relaxed);
    s.sets = m_sets.load(std::memory_order_relaxed);
    s.invalidated_keys = m_invalidated.load(std::memory_order_relaxed);
    s.partial_invalidations = m_partial.load(std::memory_order_relaxed);
    return s;
}
