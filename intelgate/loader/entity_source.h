#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../events/change_event.h"

// Backing store the loaders read from. Entities are opaque serialized
// documents. Implementations report failure by throwing; the batch loader
// isolates the failing keys.
class entity_source
{
public:
    virtual ~entity_source() = default;

    // out[i] belongs to ids[i]; empty = not found
    virtual std::vector<std::optional<std::string>> find_by_ids(
        std::string_view type, const std::vector<std::string>& ids) = 0;

    // out[i] holds the related documents of parent_ids[i], possibly none
    virtual std::vector<std::vector<std::string>> find_by_parent_ids(
        std::string_view parent_type, std::string_view relation,
        const std::vector<std::string>& parent_ids) = 0;

    // Enrichment documents for (type, id); empty = nothing known
    virtual std::vector<std::optional<std::string>> enrich(
        std::string_view type, const std::vector<std::string>& ids) = 0;

    // Applies a committed change to the backing store. false = rejected.
    virtual bool apply_change(const change_event& ev) = 0;
};
