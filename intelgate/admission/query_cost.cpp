#include "query_cost.h"

#include <algorithm>
#include <limits>

static constexpr int64_t SCORE_CAP = std::numeric_limits<int64_t>::max() / 4;

static int64_t sat_mul(int64_t a, int64_t b)
{
    if (a == 0 || b == 0)
        return 0;
    if (a > SCORE_CAP / b)
        return SCORE_CAP;
    return a * b;
}

static int64_t sat_add(int64_t a, int64_t b)
{
    return (a > SCORE_CAP - b) ? SCORE_CAP : a + b;
}

cost_schema cost_schema::defaults()
{
    cost_schema s;

    // Root fields
    s.set_field("Query.threat", {10, false, 1, "Threat"});
    s.set_field("Query.threats", {25, true, 10, "Threat"});
    s.set_field("Query.ioc", {10, false, 1, "IOC"});
    s.set_field("Query.iocs", {25, true, 10, "IOC"});
    s.set_field("Query.actor", {10, false, 1, "ThreatActor"});
    s.set_field("Query.actors", {20, true, 10, "ThreatActor"});
    s.set_field("Query.campaign", {10, false, 1, "ThreatCampaign"});
    s.set_field("Query.campaigns", {20, true, 10, "ThreatCampaign"});
    s.set_field("Query.feeds", {15, true, 10, "ThreatFeed"});
    s.set_field("Query.threatIntelligenceSearch", {200, true, 10, "Threat"});
    s.set_field("Query.threatAnalytics", {200, false, 1, "ThreatAnalytics"});
    s.set_field("Query.correlateThreats", {300, true, 10, "Threat"});

    // Relationships
    s.set_field("Threat.iocs", {20, true, 10, "IOC"});
    s.set_field("Threat.actors", {15, true, 5, "ThreatActor"});
    s.set_field("Threat.campaigns", {15, true, 5, "ThreatCampaign"});
    s.set_field("Threat.correlations", {100, true, 10, "Threat"});
    s.set_field("Threat.attribution", {150, false, 1, "Attribution"});
    s.set_field("IOC.threats", {15, true, 10, "Threat"});
    s.set_field("IOC.enrichment", {100, false, 1, "Enrichment"});
    s.set_field("ThreatActor.threats", {20, true, 10, "Threat"});
    s.set_field("ThreatActor.campaigns", {15, true, 5, "ThreatCampaign"});
    s.set_field("ThreatCampaign.threats", {20, true, 10, "Threat"});
    s.set_field("ThreatCampaign.actors", {15, true, 5, "ThreatActor"});
    s.set_field("ThreatFeed.threats", {25, true, 10, "Threat"});

    // Computed
    s.set_field("ThreatAnalytics.timeline", {100, true, 30, "TimelinePoint"});
    s.set_field("ThreatAnalytics.topActors", {75, true, 10, "ThreatActor"});
    s.set_field("Enrichment.reputation", {50, false, 1, ""});

    // Mutations
    s.set_field("Mutation.createThreat", {50, false, 1, "Threat"});
    s.set_field("Mutation.updateThreat", {50, false, 1, "Threat"});
    s.set_field("Mutation.importIOCs", {500, true, 100, "IOC"});

    return s;
}

void cost_schema::set_field(std::string_view type_field, field_cost cost)
{
    m_fields[std::string(type_field)] = std::move(cost);
}

bool cost_schema::set_weight(std::string_view type_field, int64_t weight)
{
    if (weight < 0)
        return false;
    auto it = m_fields.find(type_field);
    if (it == m_fields.end())
        m_fields.emplace(std::string(type_field), field_cost{weight, false, 1, {}});
    else
        it->second.weight = weight;
    return true;
}

bool cost_schema::set_default_size(std::string_view type_field, int64_t size)
{
    auto it = m_fields.find(type_field);
    if (it == m_fields.end() || !it->second.list || size < 0)
        return false;
    it->second.default_size = size;
    return true;
}

const field_cost* cost_schema::find(std::string_view type, std::string_view field) const
{
    if (type.empty())
        return nullptr;
    std::string key;
    key.reserve(type.size() + field.size() + 1);
    key.append(type.data(), type.size());
    key += '.';
    key.append(field.data(), field.size());
    auto it = m_fields.find(key);
    return it != m_fields.end() ? &it->second : nullptr;
}

static void score_fields(const std::vector<field_node>& fields, std::string_view parent_type,
                         int64_t multiplier, int depth, const cost_schema& schema, cost_estimate& est)
{
    for (const auto& f : fields)
    {
        ++est.field_count;
        est.depth = std::max(est.depth, depth);

        if (f.name == "__typename")
            continue;

        int64_t weight;
        int64_t own_size = 1;
        std::string_view child_type;

        if (f.name.compare(0, 2, "__") == 0)
        {
            weight = schema.introspection_cost;
        }
        else if (const field_cost* def = schema.find(parent_type, f.name))
        {
            weight = def->weight;
            child_type = def->result_type;
            if (def->list)
            {
                int64_t requested;
                if ((f.int_arg("first", requested) || f.int_arg("limit", requested)) && requested >= 0)
                    own_size = requested;
                else
                    own_size = def->default_size;
            }
        }
        else
        {
            weight = f.children.empty() ? schema.scalar_cost : schema.object_cost;
        }

        est.score = sat_add(est.score, sat_mul(weight, multiplier));

        if (!f.children.empty())
            score_fields(f.children, child_type, sat_mul(multiplier, own_size), depth + 1, schema, est);
    }
}

static std::string_view root_type(std::string_view operation)
{
    if (operation == "mutation")
        return "Mutation";
    if (operation == "subscription")
        return "Subscription";
    return "Query";
}

cost_estimate estimate_cost(const query_shape& shape, const cost_schema& schema)
{
    cost_estimate est;
    score_fields(shape.roots, root_type(shape.operation), 1, 1, schema, est);
    est.suggested_timeout_ms = suggested_timeout_ms(est.score);
    return est;
}

double role_multiplier(user_role role)
{
    switch (role)
    {
        case role_viewer:             return 0.5;
        case role_analyst:            return 1.0;
        case role_incident_responder: return 1.5;
        case role_admin:              return 2.0;
        case role_super_admin:        return 3.0;
    }
    return 0.5;
}

int64_t effective_ceiling(const cost_limits& limits, user_role role)
{
    if (!limits.role_scaling)
        return limits.ceiling;
    return static_cast<int64_t>(static_cast<double>(limits.ceiling) * role_multiplier(role));
}

int64_t suggested_timeout_ms(int64_t score)
{
    constexpr int64_t base = 30000;
    constexpr int64_t cap = 300000;
    if (score >= (cap - base) / 100)
        return cap;
    return std::min(cap, base + score * 100);
}
