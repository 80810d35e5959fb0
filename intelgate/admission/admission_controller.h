#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include "query_cost.h"
#include "query_shape.h"
#include "rate_limiter.h"
#include "../shared/auth_context.h"

enum admission_status : uint8_t
{
    admit_ok          = 0,
    admit_rate_limited = 1,
    admit_too_complex = 2,
    admit_bad_query   = 3
};

struct admission_decision
{
    admission_status status = admit_ok;
    cost_estimate cost;
    int64_t ceiling = 0;
    int64_t retry_after_ms = 0;
    std::string reason;

    bool admitted() const { return status == admit_ok; }
};

struct admission_stats
{
    uint64_t admitted = 0;
    uint64_t rate_limited = 0;
    uint64_t too_complex = 0;
    uint64_t bad_query = 0;
};

// Gate run before any loader or cache work: cost first (pure, no I/O), then
// one rate-limit token. A rejection at either step short-circuits.
class admission_controller
{
public:
    admission_controller(rate_limiter& limiter, cost_schema schema = cost_schema::defaults(),
                         cost_limits limits = {});

    // Requests without a selection (direct entity reads, subscribe)
    admission_decision admit(operation_class oc, const auth_context& auth);

    // Parses and scores `query_text`; the parsed shape is left in `shape`
    admission_decision admit_query(operation_class oc, const auth_context& auth,
                                   std::string_view query_text, query_shape& shape);

    admission_decision admit_shape(operation_class oc, const auth_context& auth, const query_shape& shape);

    // Scores without consuming a token
    admission_decision score(const auth_context& auth, const query_shape& shape) const;

    const cost_schema& schema() const { return m_schema; }
    cost_schema& schema() { return m_schema; }
    const cost_limits& limits() const { return m_limits; }
    void set_limits(cost_limits limits) { m_limits = limits; }
    rate_limiter& limiter() { return m_limiter; }

    admission_stats stats() const;

private:
    admission_decision take_token(operation_class oc, const auth_context& auth, admission_decision d);

    rate_limiter& m_limiter;
    cost_schema m_schema;
    cost_limits m_limits;

    std::atomic<uint64_t> m_admitted{0};
    std::atomic<uint64_t> m_rate_limited{0};
    std::atomic<uint64_t> m_too_complex{0};
    std::atomic<uint64_t> m_bad_query{0};
};
