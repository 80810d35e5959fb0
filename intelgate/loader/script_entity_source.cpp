#include "script_entity_source.h"
#include "../shared/logging.h"

#include <stdexcept>

script_entity_source::script_entity_source()
{
    m_lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table,
                         sol::lib::math, sol::lib::os, sol::lib::io);
    register_bindings();
}

void script_entity_source::register_bindings()
{
    sol::table ns = m_lua.create_named_table("intelgate");
    ns.set_function("log", [](const std::string& msg) {
        LOG_INFOF("[lua] %s", msg.c_str());
    });
    ns.set_function("warn", [](const std::string& msg) {
        LOG_WARNF("[lua] %s", msg.c_str());
    });
}

bool script_entity_source::load_script(std::string_view path)
{
    auto result = m_lua.safe_script_file(std::string(path), sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_ERRORF("[lua] script error: %s", err.what());
        return false;
    }

    m_find_by_ids = m_lua["find_by_ids"];
    m_find_by_parent_ids = m_lua["find_by_parent_ids"];
    m_enrich = m_lua["enrich"];
    m_on_change = m_lua["on_change"];

    if (!m_find_by_ids.valid() || !m_find_by_parent_ids.valid())
    {
        LOG_ERRORF("[lua] %.*s must define find_by_ids and find_by_parent_ids",
                   static_cast<int>(path.size()), path.data());
        return false;
    }
    return true;
}

sol::table script_entity_source::make_id_table(const std::vector<std::string>& ids)
{
    sol::table t = m_lua.create_table(static_cast<int>(ids.size()), 0);
    for (size_t i = 0; i < ids.size(); ++i)
        t[i + 1] = ids[i];
    return t;
}

// Lua failures become exceptions so that the loader degrades only the
// keys of the failing call
static sol::table checked_table(const sol::protected_function_result& result, const char* fn)
{
    if (!result.valid())
    {
        sol::error err = result;
        throw std::runtime_error(std::string(fn) + ": " + err.what());
    }
    auto t = result.get<sol::optional<sol::table>>();
    if (!t)
        throw std::runtime_error(std::string(fn) + ": expected a table");
    return *t;
}

std::vector<std::optional<std::string>> script_entity_source::find_by_ids(
    std::string_view type, const std::vector<std::string>& ids)
{
    auto result = m_find_by_ids(std::string(type), make_id_table(ids));
    sol::table t = checked_table(result, "find_by_ids");

    std::vector<std::optional<std::string>> out;
    out.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i)
    {
        sol::optional<std::string> doc = t[i + 1];
        if (doc)
            out.emplace_back(std::move(*doc));
        else
            out.emplace_back(std::nullopt);
    }
    return out;
}

std::vector<std::vector<std::string>> script_entity_source::find_by_parent_ids(
    std::string_view parent_type, std::string_view relation,
    const std::vector<std::string>& parent_ids)
{
    auto result = m_find_by_parent_ids(std::string(parent_type), std::string(relation),
                                       make_id_table(parent_ids));
    sol::table t = checked_table(result, "find_by_parent_ids");

    std::vector<std::vector<std::string>> out(parent_ids.size());
    for (size_t i = 0; i < parent_ids.size(); ++i)
    {
        sol::optional<sol::table> children = t[parent_ids[i]];
        if (!children)
            continue;
        size_t n = children->size();
        out[i].reserve(n);
        for (size_t j = 1; j <= n; ++j)
        {
            sol::optional<std::string> doc = (*children)[j];
            if (doc)
                out[i].push_back(std::move(*doc));
        }
    }
    return out;
}

std::vector<std::optional<std::string>> script_entity_source::enrich(
    std::string_view type, const std::vector<std::string>& ids)
{
    std::vector<std::optional<std::string>> out(ids.size());
    if (!m_enrich.valid())
        return out;

    auto result = m_enrich(std::string(type), make_id_table(ids));
    sol::table t = checked_table(result, "enrich");
    for (size_t i = 0; i < ids.size(); ++i)
    {
        sol::optional<std::string> doc = t[ids[i]];
        if (doc)
            out[i] = std::move(*doc);
    }
    return out;
}

bool script_entity_source::apply_change(const change_event& ev)
{
    if (!m_on_change.valid())
        return true;

    sol::table e = m_lua.create_table();
    e["topic"] = ev.topic;
    e["type"] = ev.entity_type;
    e["id"] = ev.entity_id;
    e["kind"] = change_kind_name(ev.kind);
    e["severity"] = severity_name(ev.severity);
    e["organization"] = ev.organization_id;
    e["actor"] = ev.actor_id;
    e["payload"] = ev.payload;
    sol::table assets = m_lua.create_table(static_cast<int>(ev.affected_assets.size()), 0);
    for (size_t i = 0; i < ev.affected_assets.size(); ++i)
        assets[i + 1] = ev.affected_assets[i];
    e["assets"] = assets;

    auto result = m_on_change(e);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_ERRORF("[lua] on_change error: %s", err.what());
        return false;
    }

    // A hook that returns nothing accepts the change
    auto accepted = result.get<sol::optional<bool>>();
    return !accepted || *accepted;
}
