// intelgate/gateway.h: Embeddable gateway (requires libintelgate_core.a)
#pragma once
#include <csignal>
#include <memory>
#include <string>
#include <string_view>
#include <unistd.h>
#include "core.h"
#include "intelgate/daemon/gateway_handler.h"
#include "intelgate/daemon/gateway_server.h"

namespace intelgate {

namespace detail {

inline int g_signal_fd = -1;

inline void on_signal(int)
{
    if (g_signal_fd >= 0)
    {
        char c = 1;
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
        ::write(g_signal_fd, &c, 1);
#pragma GCC diagnostic pop
    }
}

inline void install_signal_handlers(event_loop* loop)
{
    g_signal_fd = loop->get_signal_write_fd();
    signal(SIGPIPE, SIG_IGN);
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace detail

// ─── High-level gateway wrapper ─────────────────────────────────────────────
// Usage:
//   memory_entity_source src;
//   intelgate::gateway gw(src);
//   gw.ttl("threat", 600).cost_ceiling(1500).subscription_queue(512);
//   gw.commit(make_event(...));          // domain side
//   std::string reply = gw.handle("GET threat t1");
//   gw.start(7420);                      // blocks until SIGINT/SIGTERM
class gateway {
public:
    // In-process memory store
    explicit gateway(entity_source& source, std::string key_prefix = "threat:")
        : m_owned_store(std::make_unique<memory_kv_store>()),
          m_store(*m_owned_store),
          m_source(source),
          m_cache(m_store, cache_policy{}, key_prefix),
          m_bus(m_router, &m_cache),
          m_limiter(m_store, wall_clock_source::instance(), std::move(key_prefix)),
          m_admission(m_limiter) {}

    // Caller-owned store, e.g. a resp_kv_store shared by several instances
    gateway(entity_source& source, kv_store& store, std::string key_prefix = "threat:")
        : m_store(store),
          m_source(source),
          m_cache(m_store, cache_policy{}, key_prefix),
          m_bus(m_router, &m_cache),
          m_limiter(m_store, wall_clock_source::instance(), std::move(key_prefix)),
          m_admission(m_limiter) {}

    gateway(const gateway&) = delete;
    gateway& operator=(const gateway&) = delete;

    // ── Chainable config (before the first handle()/start()) ────────────
    gateway& ttl(std::string_view type, int64_t seconds)   { m_cache.policy().set_ttl(type, seconds); return *this; }
    gateway& dependent(std::string_view type, std::string_view pattern) {
        m_cache.policy().add_dependent(type, std::string(pattern)); return *this;
    }
    gateway& rate_limit(operation_class oc, int64_t points, int64_t duration_ms) {
        m_limiter.set_limit(oc, {points, duration_ms}); return *this;
    }
    gateway& cost_ceiling(int64_t ceiling) { auto l = m_admission.limits(); l.ceiling = ceiling; m_admission.set_limits(l); return *this; }
    gateway& max_depth(int64_t depth)      { auto l = m_admission.limits(); l.max_depth = depth; m_admission.set_limits(l); return *this; }
    gateway& role_scaling(bool on)         { auto l = m_admission.limits(); l.role_scaling = on; m_admission.set_limits(l); return *this; }
    gateway& batch_size(size_t n)          { m_limits.entity_batch = n; return *this; }
    gateway& subscription_queue(size_t n)  { m_queue = n; m_router.set_default_capacity(n); return *this; }

    // ── Domain side ─────────────────────────────────────────────────────
    commit_result commit(change_event ev) { return m_bus.commit_change(std::move(ev)); }

    subscription_ptr subscribe(std::string topic, event_predicate pred, auth_context auth) {
        return m_router.subscribe(std::move(topic), std::move(pred), 0, std::move(auth), m_queue);
    }

    // Loaders for one unit of work
    std::unique_ptr<request_scope> scope() {
        return std::make_unique<request_scope>(m_source, &m_cache, m_limits);
    }

    // ── Protocol side ───────────────────────────────────────────────────
    std::string handle(std::string_view line, connection_ref conn = 1) {
        std::string out;
        handler().handle_line(conn, line, out);
        return out;
    }

    std::string drain(connection_ref conn = 1) {
        std::string out;
        handler().drain_events(conn, out);
        return out;
    }

    // ── Lifecycle ───────────────────────────────────────────────────────
    bool start(uint16_t port) {
        if (!m_loop.init()) return false;
        gateway_server server(m_loop, handler(), port);
        if (!server.start()) return false;
        detail::install_signal_handlers(&m_loop);
        m_loop.run();
        server.stop();
        return true;
    }
    void stop() { m_loop.request_stop(); }

    // ── Escape hatches ──────────────────────────────────────────────────
    cache_manager&        cache()     { return m_cache; }
    subscription_router&  router()    { return m_router; }
    event_bus&            bus()       { return m_bus; }
    admission_controller& admission() { return m_admission; }
    event_loop&           loop()      { return m_loop; }

private:
    gateway_handler& handler() {
        if (!m_handler)
            m_handler = std::make_unique<gateway_handler>(gateway_services{
                m_source, &m_cache, m_router, m_bus, m_admission, m_limits, m_queue});
        return *m_handler;
    }

    std::unique_ptr<kv_store> m_owned_store;
    kv_store&                 m_store;
    entity_source&            m_source;
    cache_manager             m_cache;
    subscription_router       m_router;
    event_bus                 m_bus;
    rate_limiter              m_limiter;
    admission_controller      m_admission;
    loader_limits             m_limits;
    size_t                    m_queue = subscription::DEFAULT_CAPACITY;
    std::unique_ptr<gateway_handler> m_handler;
    event_loop                m_loop;
};

} // namespace intelgate
