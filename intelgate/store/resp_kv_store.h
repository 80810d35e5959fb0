#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "kv_store.h"
#include "resp_codec.h"
#include "../shared/clock.h"
#include "../shared/socket_util.h"

class tls_context;
class tls_stream;

struct resp_store_config
{
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    uint32_t timeout_ms = 500;
    // Pause before reconnecting after a failed attempt
    uint32_t reconnect_backoff_ms = 1000;
    std::string password;

    bool tls = false;
    std::string ca_path;
    std::string client_cert;
    std::string client_key;
};

// RESP2 client for a shared Redis-compatible store. One connection guarded
// by a mutex; pipelines are written in a single send and their replies read
// back in order. A failed call on a reused connection is retried once on a
// fresh one, after which the store is reported unavailable.
class resp_kv_store : public kv_store
{
public:
    explicit resp_kv_store(resp_store_config config,
                           const clock_source& clock = steady_clock_source::instance());
    ~resp_kv_store() override;

    resp_kv_store(const resp_kv_store&) = delete;
    resp_kv_store& operator=(const resp_kv_store&) = delete;

    kv_status get(std::string_view key, std::string& out) override;
    bool set(std::string_view key, std::string_view value, int64_t ttl_ms) override;
    bool mget(const std::vector<std::string>& keys,
              std::vector<std::optional<std::string>>& out) override;
    bool del(const std::vector<std::string>& keys, int64_t& removed) override;
    bool keys(std::string_view pattern, std::vector<std::string>& out) override;
    bool incr(std::string_view key, int64_t delta, int64_t& result) override;
    bool expire(std::string_view key, int64_t ttl_ms) override;
    bool pttl(std::string_view key, int64_t& out) override;
    bool sadd(std::string_view key, std::string_view member) override;
    bool smembers(std::string_view key, std::vector<std::string>& out) override;
    bool ping() override;
    bool exec(const kv_pipeline& pipeline) override;

    bool is_connected() const;

private:
    // Sends `request` (n_replies commands) and reads the replies in order
    bool roundtrip(const std::string& request, size_t n_replies, std::vector<resp::reply>& replies);
    bool roundtrip_once(const std::string& request, size_t n_replies, std::vector<resp::reply>& replies);
    bool call(const std::vector<std::string_view>& args, resp::reply& out);

    bool connect_locked();
    void disconnect_locked();
    bool write_locked(const std::string& data);
    bool read_reply_locked(resp::reply& out);

    resp_store_config m_config;
    const clock_source& m_clock;

    mutable std::mutex m_mutex;
    scoped_fd m_fd;
    std::unique_ptr<tls_context> m_tls_ctx;
    std::unique_ptr<tls_stream> m_tls;
    std::string m_rbuf;
    int64_t m_retry_at_ms = 0;
};
