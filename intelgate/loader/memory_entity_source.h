#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "entity_source.h"

// Map-backed source for tests and embedding. Counts calls so callers can
// observe batching.
class memory_entity_source : public entity_source
{
public:
    void put(std::string_view type, std::string_view id, std::string doc)
    {
        m_entities[make_key(type, id)] = std::move(doc);
    }

    void remove(std::string_view type, std::string_view id)
    {
        m_entities.erase(make_key(type, id));
    }

    void link(std::string_view parent_type, std::string_view relation,
              std::string_view parent_id, std::string child_doc)
    {
        m_relations[make_key(parent_type, relation, parent_id)].push_back(std::move(child_doc));
    }

    void put_enrichment(std::string_view type, std::string_view id, std::string doc)
    {
        m_enrichments[make_key(type, id)] = std::move(doc);
    }

    std::vector<std::optional<std::string>> find_by_ids(
        std::string_view type, const std::vector<std::string>& ids) override
    {
        ++m_find_calls;
        m_last_batch_size = ids.size();
        std::vector<std::optional<std::string>> out;
        out.reserve(ids.size());
        for (const auto& id : ids)
        {
            auto it = m_entities.find(make_key(type, id));
            if (it != m_entities.end())
                out.emplace_back(it->second);
            else
                out.emplace_back(std::nullopt);
        }
        return out;
    }

    std::vector<std::vector<std::string>> find_by_parent_ids(
        std::string_view parent_type, std::string_view relation,
        const std::vector<std::string>& parent_ids) override
    {
        ++m_relation_calls;
        m_last_batch_size = parent_ids.size();
        std::vector<std::vector<std::string>> out;
        out.reserve(parent_ids.size());
        for (const auto& id : parent_ids)
        {
            auto it = m_relations.find(make_key(parent_type, relation, id));
            if (it != m_relations.end())
                out.push_back(it->second);
            else
                out.emplace_back();
        }
        return out;
    }

    std::vector<std::optional<std::string>> enrich(
        std::string_view type, const std::vector<std::string>& ids) override
    {
        ++m_enrich_calls;
        m_last_batch_size = ids.size();
        std::vector<std::optional<std::string>> out;
        out.reserve(ids.size());
        for (const auto& id : ids)
        {
            auto it = m_enrichments.find(make_key(type, id));
            if (it != m_enrichments.end())
                out.emplace_back(it->second);
            else
                out.emplace_back(std::nullopt);
        }
        return out;
    }

    bool apply_change(const change_event& ev) override
    {
        ++m_change_calls;
        if (ev.kind == change_deleted)
            remove(ev.entity_type, ev.entity_id);
        else if (!ev.payload.empty())
            put(ev.entity_type, ev.entity_id, ev.payload);
        return true;
    }

    uint32_t find_calls() const { return m_find_calls; }
    uint32_t relation_calls() const { return m_relation_calls; }
    uint32_t enrich_calls() const { return m_enrich_calls; }
    uint32_t change_calls() const { return m_change_calls; }
    size_t last_batch_size() const { return m_last_batch_size; }

private:
    static std::string make_key(std::string_view a, std::string_view b)
    {
        std::string k(a);
        k += ':';
        k.append(b.data(), b.size());
        return k;
    }

    static std::string make_key(std::string_view a, std::string_view b, std::string_view c)
    {
        std::string k = make_key(a, b);
        k += ':';
        k.append(c.data(), c.size());
        return k;
    }

    std::unordered_map<std::string, std::string> m_entities;
    std::unordered_map<std::string, std::vector<std::string>> m_relations;
    std::unordered_map<std::string, std::string> m_enrichments;

    uint32_t m_find_calls = 0;
    uint32_t m_relation_calls = 0;
    uint32_t m_enrich_calls = 0;
    uint32_t m_change_calls = 0;
    size_t m_last_batch_size = 0;
};
