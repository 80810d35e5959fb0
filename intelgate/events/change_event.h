#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

enum change_kind : uint8_t
{
    change_created = 0,
    change_updated = 1,
    change_deleted = 2
};

enum severity_level : uint8_t
{
    severity_low      = 0,
    severity_medium   = 1,
    severity_high     = 2,
    severity_critical = 3
};

// Domain change notification. Built once by the mutation path and shared
// read-only with every subscription it matches.
struct change_event
{
    std::string topic;
    std::string entity_type;
    std::string entity_id;
    change_kind kind = change_updated;
    severity_level severity = severity_low;
    std::string organization_id;
    std::vector<std::string> affected_assets;
    std::string actor_id;
    std::string payload;
    int64_t timestamp_ms = 0;  // wall clock, ms since epoch
};

using event_ptr = std::shared_ptr<const change_event>;

const char* change_kind_name(change_kind kind);
bool parse_change_kind(std::string_view str, change_kind& out);

const char* severity_name(severity_level level);
bool parse_severity(std::string_view str, severity_level& out);

// Stamps the current wall-clock time when the event has none
event_ptr make_event(change_event ev);
