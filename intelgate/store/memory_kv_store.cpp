#include "memory_kv_store.h"

#include <charconv>
#include <fnmatch.h>

memory_kv_store::memory_kv_store(const clock_source& clock)
    : m_clock(clock)
{
    m_data.reserve(1024);
}

// ─── Expiry ───

void memory_kv_store::check_expiry(std::string_view key)
{
    if (__builtin_expect(m_expiry.empty(), 1))
        return;

    auto it = m_expiry.find(key);
    if (__builtin_expect(it == m_expiry.end(), 1))
        return;

    if (m_clock.now() < it->second)
        return;

    m_expiry.erase(it);
    if (auto sit = m_data.find(key); sit != m_data.end())
        m_data.erase(sit);
    else if (auto set_it = m_sets.find(key); set_it != m_sets.end())
        m_sets.erase(set_it);
}

std::vector<std::string> memory_kv_store::sweep_expired()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> expired;
    if (__builtin_expect(m_expiry.empty(), 1))
        return expired;

    auto now = m_clock.now();
    for (const auto& [key, tp] : m_expiry)
    {
        if (now >= tp)
            expired.push_back(key);
    }
    for (const auto& key : expired)
        erase(key);
    return expired;
}

bool memory_kv_store::expire_locked(std::string_view key, int64_t ttl_ms)
{
    check_expiry(key);
    if (!exists(key))
        return false;

    if (ttl_ms <= 0)
    {
        erase(key);
        return true;
    }

    auto tp = m_clock.now() + std::chrono::milliseconds(ttl_ms);
    auto it = m_expiry.find(key);
    if (it != m_expiry.end())
        it->second = tp;
    else
        m_expiry.emplace(std::string(key), tp);
    return true;
}

bool memory_kv_store::expire(std::string_view key, int64_t ttl_ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    expire_locked(key, ttl_ms);
    return true;
}

bool memory_kv_store::pttl(std::string_view key, int64_t& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_expiry(key);
    if (!exists(key))
    {
        out = -2;
        return true;
    }

    auto it = m_expiry.find(key);
    if (it == m_expiry.end())
    {
        out = -1;
        return true;
    }

    out = std::chrono::duration_cast<std::chrono::milliseconds>(it->second - m_clock.now()).count();
    if (out < 0)
        out = 0;
    return true;
}

// ─── Strings ───

kv_status memory_kv_store::get(std::string_view key, std::string& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_expiry(key);

    auto it = m_data.find(key);
    if (it == m_data.end())
        return kv_miss;
    out = it->second;
    return kv_ok;
}

void memory_kv_store::set_locked(std::string_view key, std::string_view value, int64_t ttl_ms)
{
    // A string write replaces any set under the same key
    if (auto set_it = m_sets.find(key); set_it != m_sets.end())
        m_sets.erase(set_it);

    auto it = m_data.find(key);
    if (it != m_data.end())
        it->second.assign(value.data(), value.size());
    else
        m_data.emplace(std::string(key), std::string(value));

    if (ttl_ms > 0)
    {
        auto tp = m_clock.now() + std::chrono::milliseconds(ttl_ms);
        auto eit = m_expiry.find(key);
        if (eit != m_expiry.end())
            eit->second = tp;
        else
            m_expiry.emplace(std::string(key), tp);
    }
    else if (auto eit = m_expiry.find(key); eit != m_expiry.end())
    {
        m_expiry.erase(eit);
    }
}

bool memory_kv_store::set(std::string_view key, std::string_view value, int64_t ttl_ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    set_locked(key, value, ttl_ms);
    return true;
}

bool memory_kv_store::mget(const std::vector<std::string>& keys,
                           std::vector<std::optional<std::string>>& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();
    out.reserve(keys.size());
    for (const auto& key : keys)
    {
        check_expiry(key);
        auto it = m_data.find(key);
        if (it != m_data.end())
            out.emplace_back(it->second);
        else
            out.emplace_back(std::nullopt);
    }
    return true;
}

bool memory_kv_store::incr_locked(std::string_view key, int64_t delta, int64_t& result)
{
    check_expiry(key);
    if (m_sets.find(key) != m_sets.end())
        return false;

    int64_t val = 0;
    auto it = m_data.find(key);
    if (it != m_data.end())
    {
        auto [ptr, ec] = std::from_chars(it->second.data(), it->second.data() + it->second.size(), val);
        if (ec != std::errc{} || ptr != it->second.data() + it->second.size())
            return false;  // not an integer
    }

    val += delta;
    result = val;

    char buf[24];
    auto [end, ec2] = std::to_chars(buf, buf + sizeof(buf), val);
    std::string_view sv(buf, static_cast<size_t>(end - buf));

    // incr keeps an existing expiry
    if (it != m_data.end())
        it->second.assign(sv.data(), sv.size());
    else
        m_data.emplace(std::string(key), std::string(sv));
    return true;
}

bool memory_kv_store::incr(std::string_view key, int64_t delta, int64_t& result)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return incr_locked(key, delta, result);
}

// ─── Sets ───

bool memory_kv_store::sadd_locked(std::string_view key, std::string_view member)
{
    check_expiry(key);
    if (m_data.find(key) != m_data.end())
        return false;

    auto it = m_sets.find(key);
    if (it == m_sets.end())
        it = m_sets.emplace(std::string(key), set_inner{}).first;
    it->second.emplace(member);
    return true;
}

bool memory_kv_store::sadd(std::string_view key, std::string_view member)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return sadd_locked(key, member);
}

bool memory_kv_store::smembers(std::string_view key, std::vector<std::string>& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_expiry(key);
    out.clear();

    auto it = m_sets.find(key);
    if (it == m_sets.end())
        return true;
    out.reserve(it->second.size());
    for (const auto& member : it->second)
        out.push_back(member);
    return true;
}

// ─── Keys / General ───

bool memory_kv_store::exists(std::string_view key) const
{
    return m_data.find(key) != m_data.end() || m_sets.find(key) != m_sets.end();
}

bool memory_kv_store::erase(std::string_view key)
{
    bool removed = false;
    if (auto it = m_data.find(key); it != m_data.end())
    {
        m_data.erase(it);
        removed = true;
    }
    else if (auto set_it = m_sets.find(key); set_it != m_sets.end())
    {
        m_sets.erase(set_it);
        removed = true;
    }
    if (auto eit = m_expiry.find(key); eit != m_expiry.end())
        m_expiry.erase(eit);
    return removed;
}

bool memory_kv_store::del(const std::vector<std::string>& keys, int64_t& removed)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    removed = 0;
    for (const auto& key : keys)
    {
        check_expiry(key);
        if (erase(key))
            ++removed;
    }
    return true;
}

bool memory_kv_store::keys(std::string_view pattern, std::vector<std::string>& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();

    bool match_all = (pattern == "*");
    // fnmatch requires null-terminated strings
    std::string pat_str(pattern);
    auto now = m_clock.now();
    auto live = [&](const std::string& key) -> bool {
        if (m_expiry.empty())
            return true;
        auto eit = m_expiry.find(key);
        return eit == m_expiry.end() || now < eit->second;
    };
    auto match = [&](const std::string& key) -> bool {
        if (!live(key)) return false;
        if (match_all) return true;
        return fnmatch(pat_str.c_str(), key.c_str(), 0) == 0;
    };

    for (const auto& [key, _] : m_data)
        if (match(key)) out.push_back(key);
    for (const auto& [key, _] : m_sets)
        if (match(key)) out.push_back(key);
    return true;
}

bool memory_kv_store::exec(const kv_pipeline& pipeline)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    bool ok = true;
    for (const auto& op : pipeline.ops())
    {
        switch (op.type)
        {
            case kv_op_set:
                set_locked(op.key, op.value, op.number);
                break;
            case kv_op_del:
                check_expiry(op.key);
                erase(op.key);
                break;
            case kv_op_sadd:
                ok = sadd_locked(op.key, op.value) && ok;
                break;
            case kv_op_expire:
                expire_locked(op.key, op.number);
                break;
            case kv_op_incr:
            {
                int64_t ignored = 0;
                ok = incr_locked(op.key, op.number, ignored) && ok;
                break;
            }
        }
    }
    return ok;
}

size_t memory_kv_store::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.size() + m_sets.size();
}
