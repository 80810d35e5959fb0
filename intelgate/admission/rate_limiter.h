#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "../shared/clock.h"

class kv_store;

enum operation_class : uint8_t
{
    rate_standard_query    = 0,
    rate_enrichment        = 1,
    rate_bulk_import       = 2,
    rate_subscription_open = 3
};

constexpr size_t OPERATION_CLASS_COUNT = 4;

const char* operation_class_name(operation_class oc);
bool parse_operation_class(std::string_view str, operation_class& out);

// `points` admissions per `duration_ms` window
struct rate_limit
{
    int64_t points = 100;
    int64_t duration_ms = 60000;
};

enum rate_status : uint8_t
{
    rate_allowed   = 0,
    rate_limited   = 1,
    rate_fail_open = 2   // store unreachable, admitted without counting
};

struct rate_decision
{
    rate_status status = rate_allowed;
    int64_t remaining = 0;
    int64_t retry_after_ms = 0;

    bool admitted() const { return status != rate_limited; }
};

struct rate_limiter_stats
{
    uint64_t allowed = 0;
    uint64_t limited = 0;
    uint64_t fail_open = 0;
};

// Per (class, principal) buckets kept in the shared store so every
// instance draws from the same tokens. A request consumes one token with an
// atomic increment of rl:<class>:<principal>:<window>; an increment past
// the limit is refunded with a decrement, so the count never exceeds
// `points` and the bucket never goes negative. The window key expires with
// the window, which refills the bucket.
class rate_limiter
{
public:
    explicit rate_limiter(kv_store& store, const clock_source& clock = wall_clock_source::instance(),
                          std::string key_prefix = {});

    void set_limit(operation_class oc, rate_limit limit);
    const rate_limit& limit(operation_class oc) const { return m_limits[oc]; }

    rate_decision consume(operation_class oc, std::string_view principal);

    // Key for the window containing `now_ms`
    std::string bucket_key(operation_class oc, std::string_view principal, int64_t now_ms) const;

    rate_limiter_stats stats() const;

private:
    kv_store& m_store;
    const clock_source& m_clock;
    std::string m_prefix;
    rate_limit m_limits[OPERATION_CLASS_COUNT];

    std::atomic<uint64_t> m_allowed{0};
    std::atomic<uint64_t> m_limited{0};
    std::atomic<uint64_t> m_fail_open{0};
};
