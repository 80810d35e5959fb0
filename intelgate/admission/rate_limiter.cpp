#include "rate_limiter.h"
#include "../shared/logging.h"
#include "../shared/text_util.h"
#include "../store/kv_store.h"

const char* operation_class_name(operation_class oc)
{
    switch (oc)
    {
        case rate_standard_query:    return "standard_query";
        case rate_enrichment:        return "enrichment";
        case rate_bulk_import:       return "bulk_import";
        case rate_subscription_open: return "subscription_open";
    }
    return "?";
}

bool parse_operation_class(std::string_view str, operation_class& out)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("standard_query"):    out = rate_standard_query;    return true;
        case fnv1a("enrichment"):        out = rate_enrichment;        return true;
        case fnv1a("bulk_import"):       out = rate_bulk_import;       return true;
        case fnv1a("subscription_open"): out = rate_subscription_open; return true;
        default:                         return false;
    }
}

rate_limiter::rate_limiter(kv_store& store, const clock_source& clock, std::string key_prefix)
    : m_store(store), m_clock(clock), m_prefix(std::move(key_prefix))
{
    m_limits[rate_standard_query] = {100, 60000};
    m_limits[rate_enrichment] = {20, 60000};
    m_limits[rate_bulk_import] = {5, 3600000};
    m_limits[rate_subscription_open] = {10, 60000};
}

void rate_limiter::set_limit(operation_class oc, rate_limit limit)
{
    if (limit.points < 0 || limit.duration_ms <= 0)
    {
        LOG_WARNF("rate limit for %s ignored: points=%lld duration_ms=%lld", operation_class_name(oc),
                  static_cast<long long>(limit.points), static_cast<long long>(limit.duration_ms));
        return;
    }
    m_limits[oc] = limit;
}

std::string rate_limiter::bucket_key(operation_class oc, std::string_view principal, int64_t now_ms) const
{
    int64_t window = now_ms / m_limits[oc].duration_ms;
    std::string key = m_prefix;
    key += "rl:";
    key += operation_class_name(oc);
    key += ':';
    key.append(principal.data(), principal.size());
    key += ':';
    key += std::to_string(window);
    return key;
}

rate_decision rate_limiter::consume(operation_class oc, std::string_view principal)
{
    const rate_limit& lim = m_limits[oc];
    int64_t now = m_clock.now_ms();
    int64_t window_end = (now / lim.duration_ms + 1) * lim.duration_ms;
    std::string key = bucket_key(oc, principal, now);

    rate_decision d;
    int64_t used = 0;
    if (!m_store.incr(key, 1, used))
    {
        m_fail_open.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNF("rate limiter: store unavailable, admitting %s for %.*s", operation_class_name(oc),
                  static_cast<int>(principal.size()), principal.data());
        d.status = rate_fail_open;
        d.remaining = lim.points;
        return d;
    }

    // First token of the window arms the refill
    if (used == 1 && !m_store.expire(key, window_end - now))
        LOG_WARNF("rate limiter: could not set expiry on %s", key.c_str());

    if (used > lim.points)
    {
        int64_t ignored = 0;
        if (!m_store.incr(key, -1, ignored))
            LOG_WARNF("rate limiter: refund failed on %s", key.c_str());
        m_limited.fetch_add(1, std::memory_order_relaxed);
        d.status = rate_limited;
        d.remaining = 0;
        d.retry_after_ms = window_end - now;
        return d;
    }

    m_allowed.fetch_add(1, std::memory_order_relaxed);
    d.status = rate_allowed;
    d.remaining = lim.points - used;
    return d;
}

rate_limiter_stats rate_limiter::stats() const
{
    rate_limiter_stats s;
    s.allowed = m_allowed.load(std::memory_order_relaxed);
    s.limited = m_limited.load(std::memory_order_relaxed);
    s.fail_open = m_fail_open.load(std::memory_order_relaxed);
    return s;
}
