#include "predicates.h"

#include <algorithm>

event_predicate organization_filter(std::string organization)
{
    return [organization = std::move(organization)](const change_event& ev, const auth_context& auth) {
        if (auth.role == role_super_admin)
            return organization.empty() || organization == ev.organization_id;
        if (!organization.empty() && organization != auth.organization_id)
            return false;
        return !auth.organization_id.empty() && ev.organization_id == auth.organization_id;
    };
}

event_predicate severity_filter(severity_level threshold)
{
    return [threshold](const change_event& ev, const auth_context&) {
        return ev.severity >= threshold;
    };
}

event_predicate asset_filter(std::vector<std::string> assets)
{
    return [assets = std::move(assets)](const change_event& ev, const auth_context&) {
        if (assets.empty())
            return true;
        auto wanted = [&](const std::string& a) {
            return std::find(assets.begin(), assets.end(), a) != assets.end();
        };
        if (ev.entity_type == "asset" && wanted(ev.entity_id))
            return true;
        return std::any_of(ev.affected_assets.begin(), ev.affected_assets.end(), wanted);
    };
}

event_predicate actor_filter(std::string actor_id)
{
    return [actor_id = std::move(actor_id)](const change_event& ev, const auth_context&) {
        return ev.actor_id == actor_id;
    };
}

event_predicate change_kind_filter(std::vector<change_kind> kinds)
{
    return [kinds = std::move(kinds)](const change_event& ev, const auth_context&) {
        return kinds.empty() || std::find(kinds.begin(), kinds.end(), ev.kind) != kinds.end();
    };
}

event_predicate all_of(std::vector<event_predicate> predicates)
{
    predicates.erase(std::remove_if(predicates.begin(), predicates.end(),
                                    [](const event_predicate& p) { return !p; }),
                     predicates.end());
    return [predicates = std::move(predicates)](const change_event& ev, const auth_context& auth) {
        for (const auto& p : predicates)
        {
            if (!p(ev, auth))
                return false;
        }
        return true;
    };
}
