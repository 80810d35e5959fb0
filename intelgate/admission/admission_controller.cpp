#include "admission_controller.h"
#include "../shared/logging.h"

#include <cstdio>

admission_controller::admission_controller(rate_limiter& limiter, cost_schema schema, cost_limits limits)
    : m_limiter(limiter), m_schema(std::move(schema)), m_limits(limits)
{
}

static std::string_view principal_of(const auth_context& auth)
{
    return auth.principal_id.empty() ? std::string_view("anonymous") : std::string_view(auth.principal_id);
}

admission_decision admission_controller::score(const auth_context& auth, const query_shape& shape) const
{
    admission_decision d;
    d.cost = estimate_cost(shape, m_schema);
    d.ceiling = effective_ceiling(m_limits, auth.role);

    char buf[128];
    if (d.cost.depth > m_limits.max_depth)
    {
        d.status = admit_too_complex;
        std::snprintf(buf, sizeof(buf), "depth %d exceeds maximum %d", d.cost.depth, m_limits.max_depth);
        d.reason = buf;
    }
    else if (d.cost.score > d.ceiling)
    {
        d.status = admit_too_complex;
        std::snprintf(buf, sizeof(buf), "cost %lld exceeds ceiling %lld",
                      static_cast<long long>(d.cost.score), static_cast<long long>(d.ceiling));
        d.reason = buf;
    }
    return d;
}

admission_decision admission_controller::take_token(operation_class oc, const auth_context& auth,
                                                    admission_decision d)
{
    rate_decision r = m_limiter.consume(oc, principal_of(auth));
    if (!r.admitted())
    {
        m_rate_limited.fetch_add(1, std::memory_order_relaxed);
        d.status = admit_rate_limited;
        d.retry_after_ms = r.retry_after_ms;
        d.reason = "rate limit exceeded for ";
        d.reason += operation_class_name(oc);
        return d;
    }

    m_admitted.fetch_add(1, std::memory_order_relaxed);
    d.status = admit_ok;
    return d;
}

admission_decision admission_controller::admit(operation_class oc, const auth_context& auth)
{
    return take_token(oc, auth, admission_decision{});
}

admission_decision admission_controller::admit_shape(operation_class oc, const auth_context& auth,
                                                     const query_shape& shape)
{
    admission_decision d = score(auth, shape);
    if (d.status == admit_too_complex)
    {
        m_too_complex.fetch_add(1, std::memory_order_relaxed);
        LOG_INFOF("admission: rejected query from %.*s: %s", static_cast<int>(principal_of(auth).size()),
                  principal_of(auth).data(), d.reason.c_str());
        return d;
    }
    return take_token(oc, auth, std::move(d));
}

admission_decision admission_controller::admit_query(operation_class oc, const auth_context& auth,
                                                     std::string_view query_text, query_shape& shape)
{
    query_parser parser;
    if (!parser.parse(query_text, shape))
    {
        m_bad_query.fetch_add(1, std::memory_order_relaxed);
        admission_decision d;
        d.status = admit_bad_query;
        d.reason = parser.error();
        return d;
    }
    return admit_shape(oc, auth, shape);
}

admission_stats admission_controller::stats() const
{
    admission_stats s;
    s.admitted = m_admitted.load(std::memory_order_relaxed);
    s.rate_limited = m_rate_limited.load(std::memory_order_relaxed);
    s.too_complex = m_too_complex.load(std::memory_order_relaxed);
    s.bad_query = m_bad_query.load(std::memory_order_relaxed);
    return s;
}
