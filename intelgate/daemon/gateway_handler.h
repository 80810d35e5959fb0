#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include "../admission/admission_controller.h"
#include "../events/event_bus.h"
#include "../events/subscription_router.h"
#include "../loader/request_scope.h"
#include "../shared/arg_parser.h"

class cache_manager;

struct gateway_services
{
    entity_source& source;
    cache_manager* cache;
    subscription_router& router;
    event_bus& bus;
    admission_controller& admission;
    loader_limits limits;
    size_t subscription_queue = subscription::DEFAULT_CAPACITY;
};

// Per-connection protocol state. The session owns its subscriptions; the
// router only sees weak references.
struct gateway_session
{
    auth_context auth;
    bool authenticated = false;
    std::unordered_map<uint64_t, subscription_ptr> subscriptions;
};

// Line protocol over the layer, independent of the transport. One line is
// one unit of work: its loads are flushed once before the reply is built.
class gateway_handler
{
public:
    static constexpr size_t MAX_EVENTS_PER_DRAIN = 256;

    explicit gateway_handler(gateway_services services);

    void open(connection_ref conn);
    void close(connection_ref conn);

    // Handles one line, appending reply lines to `out`
    void handle_line(connection_ref conn, std::string_view line, std::string& out);

    // Appends EVENT lines for queued events of `conn`; returns how many
    size_t drain_events(connection_ref conn, std::string& out, size_t max = MAX_EVENTS_PER_DRAIN);

    // Invoked when a subscription of the connection gains queued events
    void set_ready_callback(std::function<void(connection_ref)> cb) { m_on_ready = std::move(cb); }

    size_t session_count() const { return m_sessions.size(); }
    loader_stats loader_totals() const { return m_loader_totals; }

private:
    gateway_session* session(connection_ref conn);

    void cmd_auth(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_get(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_rel(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_enrich(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_query(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_cost(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_mutate(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_sub(connection_ref conn, gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_unsub(gateway_session& s, const parsed_args& pa, std::string& out);
    void cmd_invalidate(const parsed_args& pa, std::string& out);
    void cmd_tag(const parsed_args& pa, std::string& out);
    void cmd_untag(const parsed_args& pa, std::string& out);
    void cmd_stats(std::string& out);

    // Writes the rejection line and returns false when not admitted
    bool admitted(const admission_decision& d, std::string& out);
    void finish_scope(const request_scope& scope);

    gateway_services m_services;
    std::unordered_map<connection_ref, gateway_session> m_sessions;
    std::function<void(connection_ref)> m_on_ready;
    loader_stats m_loader_totals;
};
