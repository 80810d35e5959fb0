#pragma once
#include <string>
#include <string_view>

// Composite cache key rendered as type:id[:suffix]. The id may itself hold
// ':' (relationship lists use parent_type:parent_id), so parse() splits on
// the first separator only and never yields a suffix.
struct entity_key
{
    std::string type;
    std::string id;
    std::string suffix;

    std::string str() const
    {
        std::string out;
        out.reserve(type.size() + id.size() + suffix.size() + 2);
        out += type;
        out += ':';
        out += id;
        if (!suffix.empty())
        {
            out += ':';
            out += suffix;
        }
        return out;
    }

    static bool parse(std::string_view str, entity_key& out)
    {
        auto pos = str.find(':');
        if (pos == std::string_view::npos || pos == 0 || pos + 1 >= str.size())
            return false;
        out.type.assign(str.data(), pos);
        out.id.assign(str.data() + pos + 1, str.size() - pos - 1);
        out.suffix.clear();
        return true;
    }

    // rel:<parent_type>:<parent_id>:<relation>
    static entity_key relation(std::string_view parent_type, std::string_view parent_id,
                               std::string_view relation_name)
    {
        entity_key k;
        k.type = "rel";
        k.id.reserve(parent_type.size() + parent_id.size() + 1);
        k.id.append(parent_type.data(), parent_type.size());
        k.id += ':';
        k.id.append(parent_id.data(), parent_id.size());
        k.suffix = std::string(relation_name);
        return k;
    }

    // enrichment:<id>:<entity_type>
    static entity_key enrichment(std::string_view entity_type, std::string_view id)
    {
        return entity_key{"enrichment", std::string(id), std::string(entity_type)};
    }
};
