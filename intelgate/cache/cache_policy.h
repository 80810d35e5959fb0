#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// parent_type.relation lists documents of child_type
struct relation_def
{
    std::string parent_type;
    std::string relation;
    std::string child_type;
};

// TTLs, dependency patterns and relation declarations used by the cache
// manager. Patterns are globs relative to the key prefix with `{id}` standing
// for the changed entity's id.
class cache_policy
{
public:
    static constexpr int64_t DEFAULT_TTL = 3600;

    cache_policy();

    int64_t ttl_seconds(std::string_view type) const;
    void set_ttl(std::string_view type, int64_t seconds);
    void set_default_ttl(int64_t seconds) { m_default_ttl = seconds; }

    void add_dependent(std::string_view type, std::string pattern);
    void add_derived_type(std::string_view type);
    void add_relation(relation_def rel);

    const std::vector<relation_def>& relations() const { return m_relations; }
    const relation_def* find_relation(std::string_view parent_type, std::string_view relation) const;
    std::vector<const relation_def*> relations_of(std::string_view parent_type) const;
    const std::vector<std::string>& derived_types() const { return m_derived; }

    // Globs to delete when (type, id) changes, excluding the direct key:
    // declared dependents, the entity's enrichment, lists the entity owns
    // and lists that may hold it
    std::vector<std::string> dependent_patterns(std::string_view type, std::string_view id) const;

    // Derived cache types that no invalidation rule can reach. rel and
    // enrichment keys are always reachable; relation lists are only cached
    // for declared relations.
    std::vector<std::string> uncovered_derived_types() const;

    static std::string expand(std::string_view pattern, std::string_view id);
    static std::string escape_glob(std::string_view str);

private:
    using pattern_map = std::unordered_map<std::string, std::vector<std::string>>;

    std::unordered_map<std::string, int64_t> m_ttl;
    int64_t m_default_ttl = DEFAULT_TTL;
    pattern_map m_dependents;
    std::vector<std::string> m_derived;
    std::vector<relation_def> m_relations;
};
