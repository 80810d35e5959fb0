#include "request_scope.h"
#include "../cache/cache_manager.h"
#include "../store/resp_codec.h"

request_scope::request_scope(entity_source& source, cache_manager* cache, loader_limits limits)
    : m_source(source), m_cache(cache), m_limits(limits)
{
}

batch_loader_options request_scope::options(size_t batch) const
{
    batch_loader_options o;
    o.max_batch_size = batch;
    o.cache = m_limits.cache;
    o.fetch_timeout = m_limits.fetch_timeout;
    o.clock = m_limits.clock;
    return o;
}

request_scope::entity_loader& request_scope::entities(std::string_view type)
{
    auto it = m_entities.find(type);
    if (it != m_entities.end())
        return *it->second;

    std::string t(type);
    auto loader = std::make_unique<entity_loader>(
        "entity:" + t,
        [this, t](const std::vector<std::string>& ids) { return m_source.find_by_ids(t, ids); },
        options(m_limits.entity_batch));

    if (m_cache)
    {
        cache_manager* cache = m_cache;
        loader->set_lookup([cache, t](const std::vector<std::string>& ids,
                                      std::vector<std::optional<std::optional<std::string>>>& found) {
            std::vector<std::optional<std::string>> cached;
            cache->mget(t, ids, cached);
            found.assign(ids.size(), std::nullopt);
            for (size_t i = 0; i < cached.size() && i < ids.size(); ++i)
            {
                if (cached[i])
                    found[i].emplace(std::move(*cached[i]));
            }
        });
        loader->set_result_sink([cache, t](const std::vector<std::string>& ids,
                                           const std::vector<std::optional<std::string>>& values) {
            std::vector<std::pair<std::string, std::string>> items;
            for (size_t i = 0; i < ids.size(); ++i)
            {
                if (values[i])
                    items.emplace_back(ids[i], *values[i]);
            }
            cache->mset(t, items);
        });
    }

    auto& ref = *loader;
    m_all.push_back(loader.get());
    m_entities.emplace(std::move(t), std::move(loader));
    return ref;
}

request_scope::relation_loader& request_scope::relations(std::string_view parent_type, std::string_view relation)
{
    std::string name(parent_type);
    name += '.';
    name.append(relation.data(), relation.size());

    auto it = m_relations.find(name);
    if (it != m_relations.end())
        return *it->second;

    std::string pt(parent_type);
    std::string rel(relation);
    auto loader = std::make_unique<relation_loader>(
        "rel:" + name,
        [this, pt, rel](const std::vector<std::string>& ids) {
            return m_source.find_by_parent_ids(pt, rel, ids);
        },
        options(m_limits.relation_batch));

    // A child change only reaches lists of declared relations
    if (m_cache && m_cache->policy().find_relation(pt, rel))
    {
        cache_manager* cache = m_cache;
        // Relationship lists live under rel:<parent_type>:<parent_id>:<relation>
        auto list_id = [pt](const std::string& id) { return pt + ":" + id; };

        loader->set_lookup([cache, rel, list_id](const std::vector<std::string>& ids,
                                                 std::vector<std::optional<std::vector<std::string>>>& found) {
            std::vector<std::string> list_ids;
            list_ids.reserve(ids.size());
            for (const auto& id : ids)
                list_ids.push_back(list_id(id));

            std::vector<std::optional<std::string>> cached;
            cache->mget("rel", list_ids, cached, rel);
            found.assign(ids.size(), std::nullopt);
            for (size_t i = 0; i < cached.size() && i < ids.size(); ++i)
            {
                std::vector<std::string> items;
                if (cached[i] && resp::decode_list(*cached[i], items))
                    found[i] = std::move(items);
            }
        });
        loader->set_result_sink([cache, rel, list_id](const std::vector<std::string>& ids,
                                                      const std::vector<std::vector<std::string>>& values) {
            std::vector<std::pair<std::string, std::string>> items;
            items.reserve(ids.size());
            for (size_t i = 0; i < ids.size(); ++i)
                items.emplace_back(list_id(ids[i]), resp::encode_list(values[i]));
            cache->mset("rel", items, cache_manager::TYPE_TTL, rel);
        });
    }

    auto& ref = *loader;
    m_all.push_back(loader.get());
    m_relations.emplace(std::move(name), std::move(loader));
    return ref;
}

request_scope::entity_loader& request_scope::enrichments(std::string_view type)
{
    auto it = m_enrichments.find(type);
    if (it != m_enrichments.end())
        return *it->second;

    std::string t(type);
    auto loader = std::make_unique<entity_loader>(
        "enrichment:" + t,
        [this, t](const std::vector<std::string>& ids) { return m_source.enrich(t, ids); },
        options(m_limits.enrichment_batch));

    if (m_cache)
    {
        cache_manager* cache = m_cache;
        // enrichment:<id>:<type>
        loader->set_lookup([cache, t](const std::vector<std::string>& ids,
                                      std::vector<std::optional<std::optional<std::string>>>& found) {
            std::vector<std::optional<std::string>> cached;
            cache->mget("enrichment", ids, cached, t);
            found.assign(ids.size(), std::nullopt);
            for (size_t i = 0; i < cached.size() && i < ids.size(); ++i)
            {
                if (cached[i])
                    found[i].emplace(std::move(*cached[i]));
            }
        });
        loader->set_result_sink([cache, t](const std::vector<std::string>& ids,
                                           const std::vector<std::optional<std::string>>& values) {
            std::vector<std::pair<std::string, std::string>> items;
            for (size_t i = 0; i < ids.size(); ++i)
            {
                if (values[i])
                    items.emplace_back(ids[i], *values[i]);
            }
            cache->mset("enrichment", items, cache_manager::TYPE_TTL, t);
        });
    }

    auto& ref = *loader;
    m_all.push_back(loader.get());
    m_enrichments.emplace(std::move(t), std::move(loader));
    return ref;
}

void request_scope::flush()
{
    size_t rounds = 0;
    while (true)
    {
        bool dispatched = false;
        // Index loop: continuations may create loaders while we iterate
        for (size_t i = 0; i < m_all.size(); ++i)
        {
            if (m_all[i]->has_pending())
            {
                m_all[i]->dispatch();
                dispatched = true;
            }
        }
        if (!dispatched)
            break;

        ++m_rounds;
        if (++rounds >= MAX_ROUNDS)
        {
            LOG_ERRORF("request scope: stopped after %zu rounds with loads still queued", rounds);
            break;
        }
    }
}

loader_stats request_scope::stats() const
{
    loader_stats total;
    for (const auto* l : m_all)
        total += l->stats();
    return total;
}
