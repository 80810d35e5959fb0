#include "cache_policy.h"

#include <algorithm>

cache_policy::cache_policy()
{
    m_ttl = {
        {"threat", 3600},
        {"ioc", 1800},
        {"actor", 7200},
        {"campaign", 7200},
        {"feed", 300},
        {"enrichment", 86400},
        {"analytics", 900},
        {"search", 300},
        {"correlation", 600},
        {"attribution", 3600},
        {"rel", 1800},
    };

    m_derived = {"rel", "enrichment", "analytics", "search", "correlation", "attribution"};

    m_relations = {
        {"threat", "iocs", "ioc"},
        {"threat", "actors", "actor"},
        {"threat", "campaigns", "campaign"},
        {"actor", "threats", "threat"},
        {"actor", "campaigns", "campaign"},
        {"campaign", "threats", "threat"},
        {"campaign", "actors", "actor"},
        {"ioc", "threats", "threat"},
    };

    m_dependents["threat"] = {"analytics:*", "search:*", "correlation:*", "attribution:*"};
    m_dependents["ioc"] = {"enrichment:{id}:*", "correlation:*", "search:*"};
    m_dependents["actor"] = {"attribution:*", "search:*"};
    m_dependents["campaign"] = {"attribution:*", "search:*"};
    m_dependents["feed"] = {"search:*"};
}

int64_t cache_policy::ttl_seconds(std::string_view type) const
{
    auto it = m_ttl.find(std::string(type));
    return it != m_ttl.end() ? it->second : m_default_ttl;
}

void cache_policy::set_ttl(std::string_view type, int64_t seconds)
{
    m_ttl[std::string(type)] = seconds;
}

void cache_policy::add_dependent(std::string_view type, std::string pattern)
{
    auto& patterns = m_dependents[std::string(type)];
    if (std::find(patterns.begin(), patterns.end(), pattern) == patterns.end())
        patterns.push_back(std::move(pattern));
}

void cache_policy::add_derived_type(std::string_view type)
{
    if (std::find(m_derived.begin(), m_derived.end(), type) == m_derived.end())
        m_derived.emplace_back(type);
}

void cache_policy::add_relation(relation_def rel)
{
    if (find_relation(rel.parent_type, rel.relation))
        return;
    m_relations.push_back(std::move(rel));
}

const relation_def* cache_policy::find_relation(std::string_view parent_type, std::string_view relation) const
{
    for (const auto& r : m_relations)
    {
        if (r.parent_type == parent_type && r.relation == relation)
            return &r;
    }
    return nullptr;
}

std::vector<const relation_def*> cache_policy::relations_of(std::string_view parent_type) const
{
    std::vector<const relation_def*> out;
    for (const auto& r : m_relations)
    {
        if (r.parent_type == parent_type)
            out.push_back(&r);
    }
    return out;
}

std::string cache_policy::escape_glob(std::string_view str)
{
    std::string out;
    out.reserve(str.size());
    for (char c : str)
    {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

std::string cache_policy::expand(std::string_view pattern, std::string_view id)
{
    static constexpr std::string_view placeholder = "{id}";
    std::string escaped = escape_glob(id);
    std::string out;
    out.reserve(pattern.size() + escaped.size());

    size_t pos = 0;
    while (true)
    {
        size_t found = pattern.find(placeholder, pos);
        if (found == std::string_view::npos)
        {
            out.append(pattern.data() + pos, pattern.size() - pos);
            break;
        }
        out.append(pattern.data() + pos, found - pos);
        out += escaped;
        pos = found + placeholder.size();
    }
    return out;
}

std::vector<std::string> cache_policy::dependent_patterns(std::string_view type, std::string_view id) const
{
    std::vector<std::string> out;
    auto add = [&](std::string p) {
        if (std::find(out.begin(), out.end(), p) == out.end())
            out.push_back(std::move(p));
    };

    if (auto it = m_dependents.find(std::string(type)); it != m_dependents.end())
    {
        for (const auto& p : it->second)
            add(expand(p, id));
    }

    // The entity's own enrichment, whatever its type
    add("enrichment:" + escape_glob(id) + ":" + escape_glob(type));

    // Lists owned by the entity
    std::string owned = "rel:";
    owned += escape_glob(type);
    owned += ':';
    owned += escape_glob(id);
    owned += ":*";
    add(std::move(owned));

    // Lists of other parents that may contain it
    for (const auto& r : m_relations)
    {
        if (r.child_type == type)
            add("rel:" + escape_glob(r.parent_type) + ":*:" + escape_glob(r.relation));
    }
    return out;
}

std::vector<std::string> cache_policy::uncovered_derived_types() const
{
    auto reaches = [&](const std::string& derived) {
        // Written per entity only for declared relations and for the
        // entity's own enrichment, both of which dependent_patterns() covers
        if (derived == "rel" || derived == "enrichment")
            return true;
        std::string prefix = derived + ":";
        for (const auto& [type, patterns] : m_dependents)
        {
            for (const auto& p : patterns)
            {
                if (p == "*" || p.compare(0, prefix.size(), prefix) == 0)
                    return true;
            }
        }
        return false;
    };

    std::vector<std::string> out;
    for (const auto& d : m_derived)
    {
        if (!reaches(d))
            out.push_back(d);
    }
    return out;
}
