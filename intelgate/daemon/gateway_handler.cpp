#include "gateway_handler.h"
#include "../cache/cache_manager.h"
#include "../events/predicates.h"
#include "../shared/logging.h"

#include <memory>

// ─── Output helpers ───

static void append_int(std::string& out, int64_t v)
{
    out += std::to_string(v);
}

// Lines must not break the framing
static void append_flat(std::string& out, std::string_view text)
{
    for (char c : text)
        out += (c == '\n' || c == '\r') ? ' ' : c;
}

static void append_json_string(std::string& out, std::string_view s)
{
    out += '"';
    for (char c : s)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
}

static void append_doc(std::string& out, const std::optional<std::string>& doc)
{
    if (doc)
        append_flat(out, *doc);
    else
        out += "null";
}

static void append_doc_array(std::string& out, const std::vector<std::string>& docs)
{
    out += '[';
    for (size_t i = 0; i < docs.size(); ++i)
    {
        if (i > 0)
            out += ',';
        append_flat(out, docs[i]);
    }
    out += ']';
}

static void error_line(std::string& out, std::string_view msg)
{
    out += "-ERR ";
    out.append(msg.data(), msg.size());
    out += '\n';
}

static std::vector<std::string> collect_ids(const parsed_args& pa, size_t from)
{
    std::vector<std::string> ids;
    for (size_t i = from; i < pa.count; ++i)
    {
        for (auto& id : split(pa.args[i], ','))
            ids.push_back(std::move(id));
    }
    return ids;
}

// GraphQL result type -> entity type used by the source and the cache
static std::string_view entity_type_of(std::string_view result_type)
{
    switch (fnv1a(result_type))
    {
        case fnv1a("Threat"):         return "threat";
        case fnv1a("IOC"):            return "ioc";
        case fnv1a("ThreatActor"):    return "actor";
        case fnv1a("ThreatCampaign"): return "campaign";
        case fnv1a("ThreatFeed"):     return "feed";
        default:                      return {};
    }
}

// ─── Sessions ───

gateway_handler::gateway_handler(gateway_services services)
    : m_services(std::move(services))
{
}

void gateway_handler::open(connection_ref conn)
{
    m_sessions.try_emplace(conn);
}

void gateway_handler::close(connection_ref conn)
{
    size_t removed = m_services.router.disconnect(conn);
    m_sessions.erase(conn);
    if (removed > 0)
        LOG_DEBUGF("connection %llu closed, %zu subscriptions removed",
                   static_cast<unsigned long long>(conn), removed);
}

gateway_session* gateway_handler::session(connection_ref conn)
{
    auto it = m_sessions.find(conn);
    if (it == m_sessions.end())
        it = m_sessions.try_emplace(conn).first;
    return &it->second;
}

void gateway_handler::finish_scope(const request_scope& scope)
{
    m_loader_totals += scope.stats();
}

bool gateway_handler::admitted(const admission_decision& d, std::string& out)
{
    switch (d.status)
    {
        case admit_ok:
            return true;
        case admit_rate_limited:
            out += "-RATELIMITED retry_after_ms=";
            append_int(out, d.retry_after_ms);
            out += '\n';
            return false;
        case admit_too_complex:
            out += "-TOOCOMPLEX score=";
            append_int(out, d.cost.score);
            out += " ceiling=";
            append_int(out, d.ceiling);
            out += " depth=";
            append_int(out, d.cost.depth);
            out += '\n';
            return false;
        case admit_bad_query:
            error_line(out, d.reason);
            return false;
    }
    return false;
}

// ─── Dispatch ───

void gateway_handler::handle_line(connection_ref conn, std::string_view line, std::string& out)
{
    line = trim(line);
    if (line.empty())
        return;

    parsed_args pa;
    pa.parse(line);
    if (pa.count == 0)
        return;

    gateway_session& s = *session(conn);

    switch (pa.hashes[0])
    {
        case fnv1a("ping"):       out += "+PONG\n"; break;
        case fnv1a("auth"):       cmd_auth(s, pa, out); break;
        case fnv1a("get"):        cmd_get(s, pa, out); break;
        case fnv1a("rel"):        cmd_rel(s, pa, out); break;
        case fnv1a("enrich"):     cmd_enrich(s, pa, out); break;
        case fnv1a("query"):      cmd_query(s, pa, out); break;
        case fnv1a("cost"):       cmd_cost(s, pa, out); break;
        case fnv1a("mutate"):     cmd_mutate(s, pa, out); break;
        case fnv1a("sub"):        cmd_sub(conn, s, pa, out); break;
        case fnv1a("unsub"):      cmd_unsub(s, pa, out); break;
        case fnv1a("invalidate"): cmd_invalidate(pa, out); break;
        case fnv1a("tag"):        cmd_tag(pa, out); break;
        case fnv1a("untag"):      cmd_untag(pa, out); break;
        case fnv1a("stats"):      cmd_stats(out); break;
        default:
            error_line(out, "unknown command");
            break;
    }
}

// AUTH <principal> <org> <role>
void gateway_handler::cmd_auth(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 4)
        return error_line(out, "usage: AUTH <principal> <org> <role>");

    user_role role;
    if (!parse_role(pa.args[3], role))
        return error_line(out, "unknown role");

    s.auth.principal_id = std::string(pa.args[1]);
    s.auth.organization_id = std::string(pa.args[2]);
    s.auth.role = role;
    s.authenticated = true;
    out += "+OK\n";
}

// GET <type> <id>...
void gateway_handler::cmd_get(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return error_line(out, "usage: GET <type> <id>...");
    if (!admitted(m_services.admission.admit(rate_standard_query, s.auth), out))
        return;

    auto ids = collect_ids(pa, 2);
    request_scope scope(m_services.source, m_services.cache, m_services.limits);
    auto futures = scope.entities(pa.args[1]).load_many(ids);
    scope.flush();
    finish_scope(scope);

    out += '*';
    append_int(out, static_cast<int64_t>(ids.size()));
    out += '\n';
    for (size_t i = 0; i < ids.size(); ++i)
    {
        out += '$';
        out += ids[i];
        out += ' ';
        append_doc(out, futures[i].get());
        out += '\n';
    }
}

// REL <type> <relation> <id>...
void gateway_handler::cmd_rel(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 4)
        return error_line(out, "usage: REL <type> <relation> <id>...");
    if (!admitted(m_services.admission.admit(rate_standard_query, s.auth), out))
        return;

    auto ids = collect_ids(pa, 3);
    request_scope scope(m_services.source, m_services.cache, m_services.limits);
    auto futures = scope.relations(pa.args[1], pa.args[2]).load_many(ids);
    scope.flush();
    finish_scope(scope);

    out += '*';
    append_int(out, static_cast<int64_t>(ids.size()));
    out += '\n';
    for (size_t i = 0; i < ids.size(); ++i)
    {
        out += '$';
        out += ids[i];
        out += ' ';
        append_doc_array(out, futures[i].get());
        out += '\n';
    }
}

// ENRICH <type> <id>...
void gateway_handler::cmd_enrich(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return error_line(out, "usage: ENRICH <type> <id>...");
    if (!admitted(m_services.admission.admit(rate_enrichment, s.auth), out))
        return;

    auto ids = collect_ids(pa, 2);
    request_scope scope(m_services.source, m_services.cache, m_services.limits);
    auto futures = scope.enrichments(pa.args[1]).load_many(ids);
    scope.flush();
    finish_scope(scope);

    out += '*';
    append_int(out, static_cast<int64_t>(ids.size()));
    out += '\n';
    for (size_t i = 0; i < ids.size(); ++i)
    {
        out += '$';
        out += ids[i];
        out += ' ';
        append_doc(out, futures[i].get());
        out += '\n';
    }
}

namespace {

// One resolved entity of a QUERY: its document plus the serialized
// relation/enrichment children, in selection order
struct resolved_entity
{
    std::string id;
    std::optional<std::string> doc;
    std::vector<std::pair<std::string, std::string>> parts;
};

struct resolved_root
{
    std::string label;
    bool list = false;
    bool resolvable = false;
    std::vector<std::shared_ptr<resolved_entity>> entities;
};

void append_entity(std::string& out, const resolved_entity& e)
{
    out += "{\"id\":";
    append_json_string(out, e.id);
    out += ",\"data\":";
    append_doc(out, e.doc);
    for (const auto& [name, json] : e.parts)
    {
        out += ',';
        append_json_string(out, name);
        out += ':';
        out += json;
    }
    out += '}';
}

} // namespace

// QUERY <selection>
// Root entity fields are read through the loaders; declared relations and
// `enrichment` one level below them are loaded in the next round.
void gateway_handler::cmd_query(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 2)
        return error_line(out, "usage: QUERY <selection>");

    query_shape shape;
    if (!admitted(m_services.admission.admit_query(rate_standard_query, s.auth, pa.rest_from(1), shape), out))
        return;

    const cost_schema& schema = m_services.admission.schema();
    const cache_policy* policy = m_services.cache ? &m_services.cache->policy() : nullptr;
    cache_policy fallback_policy;
    if (!policy)
        policy = &fallback_policy;

    request_scope scope(m_services.source, m_services.cache, m_services.limits);
    std::vector<resolved_root> roots;
    roots.reserve(shape.roots.size());

    for (const auto& field : shape.roots)
    {
        resolved_root root;
        root.label = field.alias.empty() ? field.name : field.alias;

        const field_cost* def = schema.find("Query", field.name);
        std::string type(def ? entity_type_of(def->result_type) : std::string_view{});
        std::vector<std::string> ids;
        if (const std::string* id = field.arg("id"))
            ids.push_back(*id);
        else if (const std::string* list = field.arg("ids"))
            ids = split(*list, ',');

        root.list = def && def->list;
        root.resolvable = !type.empty() && !ids.empty();
        if (!root.resolvable)
        {
            roots.push_back(std::move(root));
            continue;
        }

        for (const auto& id : ids)
        {
            auto entity = std::make_shared<resolved_entity>();
            entity->id = id;
            root.entities.push_back(entity);

            const std::vector<field_node>* children = &field.children;
            scope.entities(type).load(id).then(
                [&scope, policy, entity, type, children](const std::optional<std::string>& doc) {
                    entity->doc = doc;
                    if (!doc)
                        return;

                    for (const auto& child : *children)
                    {
                        std::string label = child.alias.empty() ? child.name : child.alias;
                        if (policy->find_relation(type, child.name))
                        {
                            size_t slot = entity->parts.size();
                            entity->parts.emplace_back(label, "[]");
                            scope.relations(type, child.name).load(entity->id).then(
                                [entity, slot](const std::vector<std::string>& docs) {
                                    std::string json;
                                    append_doc_array(json, docs);
                                    entity->parts[slot].second = std::move(json);
                                });
                        }
                        else if (child.name == "enrichment")
                        {
                            size_t slot = entity->parts.size();
                            entity->parts.emplace_back(label, "null");
                            scope.enrichments(type).load(entity->id).then(
                                [entity, slot](const std::optional<std::string>& e) {
                                    std::string json;
                                    append_doc(json, e);
                                    entity->parts[slot].second = std::move(json);
                                });
                        }
                    }
                });
        }
        roots.push_back(std::move(root));
    }

    scope.flush();
    finish_scope(scope);

    out += '*';
    append_int(out, static_cast<int64_t>(roots.size()));
    out += '\n';
    for (const auto& root : roots)
    {
        out += '$';
        out += root.label;
        out += ' ';
        if (!root.resolvable)
        {
            out += "null";
        }
        else if (root.list || root.entities.size() > 1)
        {
            out += '[';
            for (size_t i = 0; i < root.entities.size(); ++i)
            {
                if (i > 0)
                    out += ',';
                append_entity(out, *root.entities[i]);
            }
            out += ']';
        }
        else
        {
            append_entity(out, *root.entities.front());
        }
        out += '\n';
    }
}

// COST <selection>
void gateway_handler::cmd_cost(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 2)
        return error_line(out, "usage: COST <selection>");

    query_parser parser;
    query_shape shape;
    if (!parser.parse(pa.rest_from(1), shape))
        return error_line(out, parser.error());

    admission_decision d = m_services.admission.score(s.auth, shape);
    out += d.admitted() ? "+cost=" : "-TOOCOMPLEX score=";
    append_int(out, d.cost.score);
    out += " depth=";
    append_int(out, d.cost.depth);
    out += " fields=";
    append_int(out, static_cast<int64_t>(d.cost.field_count));
    out += " ceiling=";
    append_int(out, d.ceiling);
    out += " timeout_ms=";
    append_int(out, d.cost.suggested_timeout_ms);
    out += '\n';
}

// MUTATE <type> <id[,id...]> <kind> <severity> [org=O] [assets=a,b] [actor=A] [topic=T] [payload]
void gateway_handler::cmd_mutate(gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 5)
        return error_line(out, "usage: MUTATE <type> <id> <kind> <severity> [payload]");

    change_event proto;
    proto.entity_type = std::string(pa.args[1]);
    if (!parse_change_kind(pa.args[3], proto.kind))
        return error_line(out, "unknown change kind");
    if (!parse_severity(pa.args[4], proto.severity))
        return error_line(out, "unknown severity");
    proto.organization_id = s.auth.organization_id;
    proto.actor_id = s.auth.principal_id;

    size_t idx = 5;
    for (; idx < pa.count; ++idx)
    {
        auto a = pa.args[idx];
        auto eq = a.find('=');
        if (eq == std::string_view::npos)
            break;
        auto key = a.substr(0, eq);
        auto value = a.substr(eq + 1);
        if (key == "org")
            proto.organization_id = std::string(value);
        else if (key == "assets")
            proto.affected_assets = split(value, ',');
        else if (key == "actor")
            proto.actor_id = std::string(value);
        else if (key == "topic")
            proto.topic = std::string(value);
        else
            break;
    }
    proto.payload = std::string(pa.rest_from(idx));

    auto ids = split(pa.args[2], ',');
    if (ids.empty())
        return error_line(out, "missing id");

    operation_class oc = ids.size() > 1 ? rate_bulk_import : rate_standard_query;
    if (!admitted(m_services.admission.admit(oc, s.auth), out))
        return;

    size_t committed = 0;
    int64_t invalidated = 0;
    size_t delivered = 0;
    for (const auto& id : ids)
    {
        change_event ev = proto;
        ev.entity_id = id;
        if (!m_services.source.apply_change(ev))
        {
            LOG_WARNF("mutate %s:%s rejected by source", ev.entity_type.c_str(), id.c_str());
            continue;
        }
        commit_result r = m_services.bus.commit_change(std::move(ev));
        ++committed;
        if (r.invalidated > 0)
            invalidated += r.invalidated;
        delivered += r.delivered;
    }

    if (committed == 0)
        return error_line(out, "rejected by source");

    out += "+OK committed=";
    append_int(out, static_cast<int64_t>(committed));
    out += " invalidated=";
    append_int(out, invalidated);
    out += " delivered=";
    append_int(out, static_cast<int64_t>(delivered));
    out += '\n';
}

// SUB <topic> [severity=S] [org=O] [assets=a,b] [actor=A] [kinds=created,updated]
void gateway_handler::cmd_sub(connection_ref conn, gateway_session& s, const parsed_args& pa, std::string& out)
{
    if (pa.count < 2)
        return error_line(out, "usage: SUB <topic> [severity=S] [org=O] [assets=a,b] [actor=A]");

    std::vector<event_predicate> preds;
    preds.push_back(organization_filter(std::string(pa.option("org", 2))));

    auto sev = pa.option("severity", 2);
    if (!sev.empty())
    {
        severity_level level;
        if (!parse_severity(sev, level))
            return error_line(out, "unknown severity");
        preds.push_back(severity_filter(level));
    }

    auto assets = pa.option("assets", 2);
    if (!assets.empty())
        preds.push_back(asset_filter(split(assets, ',')));

    auto actor = pa.option("actor", 2);
    if (!actor.empty())
        preds.push_back(actor_filter(std::string(actor)));

    auto kinds = pa.option("kinds", 2);
    if (!kinds.empty())
    {
        std::vector<change_kind> parsed;
        for (const auto& k : split(kinds, ','))
        {
            change_kind ck;
            if (!parse_change_kind(k, ck))
                return error_line(out, "unknown change kind");
            parsed.push_back(ck);
        }
        preds.push_back(change_kind_filter(std::move(parsed)));
    }

    if (!admitted(m_services.admission.admit(rate_subscription_open, s.auth), out))
        return;

    auto sub = m_services.router.subscribe(std::string(pa.args[1]), all_of(std::move(preds)), conn, s.auth,
                                           m_services.subscription_queue);
    sub->set_on_ready([this, conn](subscription&) {
        if (m_on_ready)
            m_on_ready(conn);
    });
    s.subscriptions.emplace(sub->id(), sub);

    out += "+SUB ";
    append_int(out, static_cast<int64_t>(sub->id()));
    out += '\n';
}

// UNSUB <id>
void gateway_handler::cmd_unsub(gateway_session& s, const parsed_args& pa, std::string& out)
{
    int64_t id = 0;
    if (pa.count < 2 || !parse_int64(pa.args[1], id) || id <= 0)
        return error_line(out, "usage: UNSUB <id>");

    auto it = s.subscriptions.find(static_cast<uint64_t>(id));
    if (it == s.subscriptions.end())
        return error_line(out, "no such subscription");

    m_services.router.unsubscribe(it->second);
    s.subscriptions.erase(it);
    out += "+OK\n";
}

// INVALIDATE <type> <id>
void gateway_handler::cmd_invalidate(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return error_line(out, "usage: INVALIDATE <type> <id>");
    if (!m_services.cache)
        return error_line(out, "no cache configured");

    int64_t removed = m_services.cache->invalidate(pa.args[1], pa.args[2]);
    if (removed < 0)
        return error_line(out, "cache unavailable");
    out += "+OK ";
    append_int(out, removed);
    out += '\n';
}

// TAG <key> <tag>...
void gateway_handler::cmd_tag(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return error_line(out, "usage: TAG <key> <tag>...");
    if (!m_services.cache)
        return error_line(out, "no cache configured");

    std::vector<std::string> tags;
    for (size_t i = 2; i < pa.count; ++i)
        tags.emplace_back(pa.args[i]);
    if (!m_services.cache->tag(pa.args[1], tags))
        return error_line(out, "cache unavailable");
    out += "+OK\n";
}

// UNTAG <tag>
void gateway_handler::cmd_untag(const parsed_args& pa, std::string& out)
{
    if (pa.count < 2)
        return error_line(out, "usage: UNTAG <tag>");
    if (!m_services.cache)
        return error_line(out, "no cache configured");

    int64_t removed = m_services.cache->invalidate_by_tag(pa.args[1]);
    if (removed < 0)
        return error_line(out, "cache unavailable");
    out += "+OK ";
    append_int(out, removed);
    out += '\n';
}

void gateway_handler::cmd_stats(std::string& out)
{
    std::vector<std::pair<const char*, uint64_t>> rows;

    rows.emplace_back("loader.batches", m_loader_totals.batches);
    rows.emplace_back("loader.keys_fetched", m_loader_totals.keys_fetched);
    rows.emplace_back("loader.cache_hits", m_loader_totals.cache_hits);
    rows.emplace_back("loader.shared_hits", m_loader_totals.shared_hits);
    rows.emplace_back("loader.failures", m_loader_totals.failures);
    rows.emplace_back("loader.timeouts", m_loader_totals.timeouts);

    if (m_services.cache)
    {
        cache_stats cs = m_services.cache->stats();
        rows.emplace_back("cache.hits", cs.hits);
        rows.emplace_back("cache.misses", cs.misses);
        rows.emplace_back("cache.errors", cs.errors);
        rows.emplace_back("cache.sets", cs.sets);
        rows.emplace_back("cache.invalidated", cs.invalidated_keys);
    }

    router_stats rs = m_services.router.stats();
    rows.emplace_back("router.published", rs.published);
    rows.emplace_back("router.delivered", rs.delivered);
    rows.emplace_back("router.filtered", rs.filtered);
    rows.emplace_back("router.dropped", rs.dropped);
    rows.emplace_back("router.subscriptions", rs.subscriptions);
    rows.emplace_back("router.connections", rs.connections);

    admission_stats as = m_services.admission.stats();
    rows.emplace_back("admission.admitted", as.admitted);
    rows.emplace_back("admission.rate_limited", as.rate_limited);
    rows.emplace_back("admission.too_complex", as.too_complex);
    rows.emplace_back("admission.bad_query", as.bad_query);

    rate_limiter_stats ls = m_services.admission.limiter().stats();
    rows.emplace_back("ratelimit.fail_open", ls.fail_open);

    out += '*';
    append_int(out, static_cast<int64_t>(rows.size()));
    out += '\n';
    for (const auto& [name, value] : rows)
    {
        out += '$';
        out += name;
        out += ' ';
        out += std::to_string(value);
        out += '\n';
    }
}

// ─── Events ───

size_t gateway_handler::drain_events(connection_ref conn, std::string& out, size_t max)
{
    auto it = m_sessions.find(conn);
    if (it == m_sessions.end())
        return 0;

    size_t total = 0;
    std::vector<event_ptr> batch;
    for (auto& [id, sub] : it->second.subscriptions)
    {
        if (total >= max)
            break;
        batch.clear();
        sub->drain(batch, max - total);
        for (const auto& ev : batch)
        {
            out += "EVENT ";
            append_int(out, static_cast<int64_t>(id));
            out += ' ';
            out += ev->topic;
            out += ' ';
            out += change_kind_name(ev->kind);
            out += ' ';
            out += ev->entity_type;
            out += ':';
            out += ev->entity_id;
            out += ' ';
            out += severity_name(ev->severity);
            out += " dropped=";
            append_int(out, static_cast<int64_t>(sub->dropped()));
            if (!ev->payload.empty())
            {
                out += ' ';
                append_flat(out, ev->payload);
            }
            out += '\n';
        }
        total += batch.size();
    }
    return total;
}
