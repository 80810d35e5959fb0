#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "text_util.h"

enum user_role : uint8_t
{
    role_viewer             = 0,
    role_analyst            = 1,
    role_incident_responder = 2,
    role_admin              = 3,
    role_super_admin        = 4
};

// Identity supplied by the authentication collaborator; never issued here
struct auth_context
{
    std::string principal_id;
    std::string organization_id;
    user_role role = role_viewer;
};

inline const char* role_name(user_role role)
{
    switch (role)
    {
        case role_viewer:             return "VIEWER";
        case role_analyst:            return "ANALYST";
        case role_incident_responder: return "INCIDENT_RESPONDER";
        case role_admin:              return "ADMIN";
        case role_super_admin:        return "SUPER_ADMIN";
    }
    return "?";
}

inline bool parse_role(std::string_view str, user_role& out)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("viewer"):             out = role_viewer;             return true;
        case fnv1a("analyst"):            out = role_analyst;            return true;
        case fnv1a("incident_responder"): out = role_incident_responder; return true;
        case fnv1a("admin"):              out = role_admin;              return true;
        case fnv1a("super_admin"):        out = role_super_admin;        return true;
        default:                          return false;
    }
}
