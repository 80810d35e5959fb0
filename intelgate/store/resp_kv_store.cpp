#include "resp_kv_store.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

#include <cerrno>
#include <charconv>
#include <sys/socket.h>

static std::string_view to_chars_view(char* buf, size_t cap, int64_t value)
{
    auto [end, ec] = std::to_chars(buf, buf + cap, value);
    return std::string_view(buf, static_cast<size_t>(end - buf));
}

resp_kv_store::resp_kv_store(resp_store_config config, const clock_source& clock)
    : m_config(std::move(config)), m_clock(clock)
{
    if (m_config.tls)
    {
        m_tls_ctx = std::make_unique<tls_context>();
        if (!m_tls_ctx->init_client(m_config.ca_path, m_config.client_cert, m_config.client_key))
        {
            LOG_ERROR("resp store: TLS context init failed, store will be unavailable");
            m_tls_ctx.reset();
        }
    }
}

resp_kv_store::~resp_kv_store()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    disconnect_locked();
}

bool resp_kv_store::is_connected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_fd);
}

// ─── Connection ───

bool resp_kv_store::connect_locked()
{
    if (m_fd)
        return true;

    int64_t now = m_clock.now_ms();
    if (now < m_retry_at_ms)
        return false;

    if (m_config.tls && !m_tls_ctx)
        return false;

    m_fd = tcp_connect(m_config.host, m_config.port, m_config.timeout_ms);
    if (!m_fd)
    {
        LOG_WARNF("resp store: connect to %s:%u failed", m_config.host.c_str(),
                  static_cast<unsigned>(m_config.port));
        m_retry_at_ms = now + m_config.reconnect_backoff_ms;
        return false;
    }

    if (m_tls_ctx)
    {
        m_tls = std::make_unique<tls_stream>();
        if (!m_tls->connect(*m_tls_ctx, m_fd.get(), m_config.host))
        {
            disconnect_locked();
            m_retry_at_ms = now + m_config.reconnect_backoff_ms;
            return false;
        }
    }

    if (!m_config.password.empty())
    {
        std::string req = resp::encode_command({"AUTH", m_config.password});
        resp::reply r;
        if (!write_locked(req) || !read_reply_locked(r) || r.is_error())
        {
            LOG_ERROR("resp store: AUTH rejected");
            disconnect_locked();
            m_retry_at_ms = now + m_config.reconnect_backoff_ms;
            return false;
        }
    }

    LOG_INFOF("resp store: connected to %s:%u%s", m_config.host.c_str(),
              static_cast<unsigned>(m_config.port), m_tls ? " (tls)" : "");
    return true;
}

void resp_kv_store::disconnect_locked()
{
    if (m_tls)
    {
        m_tls->close();
        m_tls.reset();
    }
    m_fd.reset();
    m_rbuf.clear();
}

bool resp_kv_store::write_locked(const std::string& data)
{
    if (m_tls)
        return m_tls->write_all(data.data(), data.size());
    return send_all(m_fd.get(), data.data(), data.size());
}

bool resp_kv_store::read_reply_locked(resp::reply& out)
{
    char buf[16384];
    while (true)
    {
        if (!m_rbuf.empty())
        {
            size_t consumed = 0;
            auto r = resp::parse_reply(m_rbuf, out, consumed);
            if (r == resp::parse_result::ok)
            {
                m_rbuf.erase(0, consumed);
                return true;
            }
            if (r == resp::parse_result::error)
            {
                LOG_ERROR("resp store: malformed reply");
                return false;
            }
        }

        ssize_t n;
        if (m_tls)
            n = m_tls->read(buf, static_cast<int>(sizeof(buf)));
        else
        {
            do
                n = ::recv(m_fd.get(), buf, sizeof(buf), 0);
            while (n < 0 && errno == EINTR);
        }

        if (n <= 0)
            return false;
        m_rbuf.append(buf, static_cast<size_t>(n));
    }
}

bool resp_kv_store::roundtrip_once(const std::string& request, size_t n_replies,
                                   std::vector<resp::reply>& replies)
{
    if (!write_locked(request))
        return false;

    replies.clear();
    replies.resize(n_replies);
    for (auto& r : replies)
    {
        if (!read_reply_locked(r))
            return false;
    }
    return true;
}

bool resp_kv_store::roundtrip(const std::string& request, size_t n_replies,
                              std::vector<resp::reply>& replies)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    bool reused = static_cast<bool>(m_fd);
    if (!connect_locked())
        return false;

    if (roundtrip_once(request, n_replies, replies))
        return true;

    disconnect_locked();
    // A reused connection may have been closed by the server while idle
    if (reused && connect_locked() && roundtrip_once(request, n_replies, replies))
        return true;

    disconnect_locked();
    m_retry_at_ms = m_clock.now_ms() + m_config.reconnect_backoff_ms;
    LOG_WARN("resp store: request failed, store marked unavailable");
    return false;
}

bool resp_kv_store::call(const std::vector<std::string_view>& args, resp::reply& out)
{
    std::vector<resp::reply> replies;
    if (!roundtrip(resp::encode_command(args), 1, replies))
        return false;
    out = std::move(replies[0]);
    if (out.is_error())
    {
        LOG_WARNF("resp store: %.*s: %s", static_cast<int>(args[0].size()), args[0].data(), out.str.c_str());
        return false;
    }
    return true;
}

// ─── Commands ───

kv_status resp_kv_store::get(std::string_view key, std::string& out)
{
    resp::reply r;
    if (!call({"GET", key}, r))
        return kv_unavailable;
    if (r.type != resp::reply_type::bulk)
        return kv_miss;
    out = std::move(r.str);
    return kv_ok;
}

bool resp_kv_store::set(std::string_view key, std::string_view value, int64_t ttl_ms)
{
    resp::reply r;
    if (ttl_ms > 0)
    {
        char tmp[24];
        return call({"SET", key, value, "PX", to_chars_view(tmp, sizeof(tmp), ttl_ms)}, r);
    }
    return call({"SET", key, value}, r);
}

bool resp_kv_store::mget(const std::vector<std::string>& keys,
                         std::vector<std::optional<std::string>>& out)
{
    out.clear();
    if (keys.empty())
        return true;

    std::vector<std::string_view> args;
    args.reserve(keys.size() + 1);
    args.emplace_back("MGET");
    for (const auto& k : keys)
        args.emplace_back(k);

    resp::reply r;
    if (!call(args, r) || r.type != resp::reply_type::array || r.elements.size() != keys.size())
        return false;

    out.reserve(keys.size());
    for (auto& el : r.elements)
    {
        if (el.type == resp::reply_type::bulk)
            out.emplace_back(std::move(el.str));
        else
            out.emplace_back(std::nullopt);
    }
    return true;
}

bool resp_kv_store::del(const std::vector<std::string>& keys, int64_t& removed)
{
    removed = 0;
    if (keys.empty())
        return true;

    std::vector<std::string_view> args;
    args.reserve(keys.size() + 1);
    args.emplace_back("DEL");
    for (const auto& k : keys)
        args.emplace_back(k);

    resp::reply r;
    if (!call(args, r))
        return false;
    removed = r.integer;
    return true;
}

// SCAN instead of KEYS so a large keyspace never blocks the server
bool resp_kv_store::keys(std::string_view pattern, std::vector<std::string>& out)
{
    out.clear();
    std::string cursor = "0";
    do
    {
        resp::reply r;
        if (!call({"SCAN", cursor, "MATCH", pattern, "COUNT", "500"}, r))
            return false;
        if (r.type != resp::reply_type::array || r.elements.size() != 2 ||
            r.elements[1].type != resp::reply_type::array)
        {
            LOG_ERROR("resp store: unexpected SCAN reply");
            return false;
        }
        cursor = std::move(r.elements[0].str);
        for (auto& el : r.elements[1].elements)
            out.push_back(std::move(el.str));
    } while (cursor != "0");
    return true;
}

bool resp_kv_store::incr(std::string_view key, int64_t delta, int64_t& result)
{
    char tmp[24];
    resp::reply r;
    if (!call({"INCRBY", key, to_chars_view(tmp, sizeof(tmp), delta)}, r) ||
        r.type != resp::reply_type::integer)
        return false;
    result = r.integer;
    return true;
}

bool resp_kv_store::expire(std::string_view key, int64_t ttl_ms)
{
    char tmp[24];
    resp::reply r;
    return call({"PEXPIRE", key, to_chars_view(tmp, sizeof(tmp), ttl_ms)}, r);
}

bool resp_kv_store::pttl(std::string_view key, int64_t& out)
{
    resp::reply r;
    if (!call({"PTTL", key}, r) || r.type != resp::reply_type::integer)
        return false;
    out = r.integer;
    return true;
}

bool resp_kv_store::sadd(std::string_view key, std::string_view member)
{
    resp::reply r;
    return call({"SADD", key, member}, r);
}

bool resp_kv_store::smembers(std::string_view key, std::vector<std::string>& out)
{
    out.clear();
    resp::reply r;
    if (!call({"SMEMBERS", key}, r) || r.type != resp::reply_type::array)
        return false;
    out.reserve(r.elements.size());
    for (auto& el : r.elements)
        out.push_back(std::move(el.str));
    return true;
}

bool resp_kv_store::ping()
{
    resp::reply r;
    return call({"PING"}, r) && r.str == "PONG";
}

bool resp_kv_store::exec(const kv_pipeline& pipeline)
{
    if (pipeline.empty())
        return true;

    std::string request;
    char tmp[24];
    for (const auto& op : pipeline.ops())
    {
        switch (op.type)
        {
            case kv_op_set:
                if (op.number > 0)
                    resp::encode_command_into(request, {"SET", op.key, op.value, "PX",
                                                        to_chars_view(tmp, sizeof(tmp), op.number)});
                else
                    resp::encode_command_into(request, {"SET", op.key, op.value});
                break;
            case kv_op_del:
                resp::encode_command_into(request, {"DEL", op.key});
                break;
            case kv_op_sadd:
                resp::encode_command_into(request, {"SADD", op.key, op.value});
                break;
            case kv_op_expire:
                resp::encode_command_into(request, {"PEXPIRE", op.key,
                                                    to_chars_view(tmp, sizeof(tmp), op.number)});
                break;
            case kv_op_incr:
                resp::encode_command_into(request, {"INCRBY", op.key,
                                                    to_chars_view(tmp, sizeof(tmp), op.number)});
                break;
        }
    }

    std::vector<resp::reply> replies;
    if (!roundtrip(request, pipeline.size(), replies))
        return false;

    bool ok = true;
    for (const auto& r : replies)
    {
        if (r.is_error())
        {
            LOG_WARNF("resp store: pipeline command failed: %s", r.str.c_str());
            ok = false;
        }
    }
    return ok;
}
