#include "change_event.h"
#include "../shared/text_util.h"

#include <chrono>

const char* change_kind_name(change_kind kind)
{
    switch (kind)
    {
        case change_created: return "CREATED";
        case change_updated: return "UPDATED";
        case change_deleted: return "DELETED";
    }
    return "?";
}

bool parse_change_kind(std::string_view str, change_kind& out)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("created"): out = change_created; return true;
        case fnv1a("updated"): out = change_updated; return true;
        case fnv1a("deleted"): out = change_deleted; return true;
        default:               return false;
    }
}

const char* severity_name(severity_level level)
{
    switch (level)
    {
        case severity_low:      return "LOW";
        case severity_medium:   return "MEDIUM";
        case severity_high:     return "HIGH";
        case severity_critical: return "CRITICAL";
    }
    return "?";
}

bool parse_severity(std::string_view str, severity_level& out)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("low"):      out = severity_low;      return true;
        case fnv1a("medium"):   out = severity_medium;   return true;
        case fnv1a("high"):     out = severity_high;     return true;
        case fnv1a("critical"): out = severity_critical; return true;
        default:                return false;
    }
}

event_ptr make_event(change_event ev)
{
    if (ev.timestamp_ms == 0)
    {
        ev.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
    return std::make_shared<const change_event>(std::move(ev));
}
