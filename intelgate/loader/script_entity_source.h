#pragma once
#include <sol/sol.hpp>
#include <string>
#include <string_view>
#include "entity_source.h"

// Entity source implemented by a Lua script. The script defines
//   find_by_ids(type, ids)                 -> { [i] = doc or nil }
//   find_by_parent_ids(type, relation, ids) -> { [parent_id] = { doc, ... } }
//   enrich(type, ids)                      -> { [id] = doc }      (optional)
//   on_change(event)                       -> bool                (optional)
// Script errors surface as std::runtime_error from the find_* calls.
class script_entity_source : public entity_source
{
public:
    script_entity_source();

    bool load_script(std::string_view path);

    std::vector<std::optional<std::string>> find_by_ids(
        std::string_view type, const std::vector<std::string>& ids) override;
    std::vector<std::vector<std::string>> find_by_parent_ids(
        std::string_view parent_type, std::string_view relation,
        const std::vector<std::string>& parent_ids) override;
    std::vector<std::optional<std::string>> enrich(
        std::string_view type, const std::vector<std::string>& ids) override;
    bool apply_change(const change_event& ev) override;

    bool has_enrich() const { return m_enrich.valid(); }
    bool has_on_change() const { return m_on_change.valid(); }

    sol::state& state() { return m_lua; }

private:
    void register_bindings();
    sol::table make_id_table(const std::vector<std::string>& ids);

    sol::state m_lua;
    sol::protected_function m_find_by_ids;
    sol::protected_function m_find_by_parent_ids;
    sol::protected_function m_enrich;
    sol::protected_function m_on_change;
};
