#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "batch_loader.h"
#include "entity_source.h"

class cache_manager;

struct loader_limits
{
    size_t entity_batch = 100;
    size_t relation_batch = 50;
    size_t enrichment_batch = 20;
    std::chrono::milliseconds fetch_timeout{0};
    bool cache = true;
    const clock_source* clock = &steady_clock_source::instance();
};

// The loaders of one unit of work (one request). Loaders are created on
// first use, consult the shared cache before the entity source, and write
// what the source returned back to it. flush() dispatches rounds across all
// loaders until nothing is queued.
class request_scope
{
public:
    using entity_loader = batch_loader<std::string, std::optional<std::string>>;
    using relation_loader = batch_loader<std::string, std::vector<std::string>>;

    static constexpr size_t MAX_ROUNDS = 64;

    // `cache` may be null: loads go straight to the source
    request_scope(entity_source& source, cache_manager* cache, loader_limits limits = {});

    request_scope(const request_scope&) = delete;
    request_scope& operator=(const request_scope&) = delete;

    entity_loader& entities(std::string_view type);
    relation_loader& relations(std::string_view parent_type, std::string_view relation);
    entity_loader& enrichments(std::string_view type);

    void flush();

    size_t rounds() const { return m_rounds; }
    loader_stats stats() const;

private:
    batch_loader_options options(size_t batch) const;

    entity_source& m_source;
    cache_manager* m_cache;
    loader_limits m_limits;

    std::map<std::string, std::unique_ptr<entity_loader>, std::less<>> m_entities;
    std::map<std::string, std::unique_ptr<relation_loader>, std::less<>> m_relations;
    std::map<std::string, std::unique_ptr<entity_loader>, std::less<>> m_enrichments;
    // Creation order; flush visits loaders in this order
    std::vector<loader_base*> m_all;
    size_t m_rounds = 0;
};
