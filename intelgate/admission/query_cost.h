#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include "query_shape.h"
#include "../shared/auth_context.h"
#include "../shared/string_hash.h"

struct field_cost
{
    int64_t weight = 1;
    bool list = false;
    int64_t default_size = 10;  // list multiplicity without first/limit
    std::string result_type;    // empty for scalars
};

// Static Type.field -> cost table. No schema reflection: unknown fields
// cost scalar_cost, or object_cost when they carry a selection.
class cost_schema
{
public:
    int64_t scalar_cost = 1;
    int64_t object_cost = 2;
    int64_t introspection_cost = 100;

    // Threat-intelligence schema weights
    static cost_schema defaults();

    void set_field(std::string_view type_field, field_cost cost);
    bool set_weight(std::string_view type_field, int64_t weight);
    bool set_default_size(std::string_view type_field, int64_t size);

    const field_cost* find(std::string_view type, std::string_view field) const;
    size_t size() const { return m_fields.size(); }

private:
    std::unordered_map<std::string, field_cost, string_hash, string_equal> m_fields;
};

struct cost_estimate
{
    int64_t score = 0;
    int depth = 0;
    size_t field_count = 0;
    int64_t suggested_timeout_ms = 0;
};

struct cost_limits
{
    int64_t ceiling = 2000;
    int max_depth = 10;
    // Scale the ceiling by role (VIEWER 0.5 .. SUPER_ADMIN 3.0)
    bool role_scaling = false;
};

// Sum over fields of weight x product of ancestor list multiplicities.
// O(shape); never touches a store.
cost_estimate estimate_cost(const query_shape& shape, const cost_schema& schema);

double role_multiplier(user_role role);
int64_t effective_ceiling(const cost_limits& limits, user_role role);

// 30 s base plus 100 ms per cost point, capped at 5 minutes
int64_t suggested_timeout_ms(int64_t score);
