#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../shared/clock.h"
#include "../shared/logging.h"

// Shared slot between a loader and the futures it handed out
template<typename V>
struct load_state
{
    bool ready = false;
    bool timed_out = false;
    V value{};
    std::vector<std::function<void(const V&)>> continuations;

    void resolve(V v, bool late)
    {
        value = std::move(v);
        timed_out = late;
        ready = true;
    }

    void run_continuations()
    {
        if (continuations.empty())
            return;
        auto pending = std::move(continuations);
        continuations.clear();
        for (auto& cb : pending)
            cb(value);
    }
};

template<typename V>
class load_future
{
public:
    load_future() = default;
    explicit load_future(std::shared_ptr<load_state<V>> state) : m_state(std::move(state)) {}

    bool valid() const { return m_state != nullptr; }
    bool ready() const { return m_state && m_state->ready; }
    // Resolved to the fallback because the fetch finished after its deadline
    bool timed_out() const { return m_state && m_state->timed_out; }

    // Only meaningful once ready()
    const V& get() const { return m_state->value; }

    // Runs `cb` when the value resolves (immediately if it already has).
    // Loads issued from `cb` are dispatched in the next round of the flush.
    void then(std::function<void(const V&)> cb) const
    {
        if (!m_state)
            return;
        if (m_state->ready)
            cb(m_state->value);
        else
            m_state->continuations.push_back(std::move(cb));
    }

private:
    std::shared_ptr<load_state<V>> m_state;
};

struct loader_stats
{
    uint64_t batches = 0;       // fetch calls issued
    uint64_t keys_fetched = 0;
    uint64_t cache_hits = 0;    // served from the scope memo
    uint64_t shared_hits = 0;   // served by the lookup hook
    uint64_t failures = 0;      // keys degraded after a failed fetch
    uint64_t timeouts = 0;      // keys degraded after a late fetch

    loader_stats& operator+=(const loader_stats& o)
    {
        batches += o.batches;
        keys_fetched += o.keys_fetched;
        cache_hits += o.cache_hits;
        shared_hits += o.shared_hits;
        failures += o.failures;
        timeouts += o.timeouts;
        return *this;
    }
};

struct batch_loader_options
{
    size_t max_batch_size = 100;
    bool cache = true;
    // 0 = no deadline
    std::chrono::milliseconds fetch_timeout{0};
    const clock_source* clock = &steady_clock_source::instance();
};

// Type-erased view used by request_scope to drive every loader of a request
class loader_base
{
public:
    virtual ~loader_base() = default;
    virtual const std::string& name() const = 0;
    virtual bool has_pending() const = 0;
    // Dispatches every load queued so far as one round
    virtual void dispatch() = 0;
    virtual loader_stats stats() const = 0;
};

// Per-request deduplicating batch fetcher. Loads queued before dispatch()
// are coalesced into chunks of at most max_batch_size keys, each sent as one
// call to the fetch function. The fetch function returns values in key
// order; a default-constructed V is the fallback for missing, failed and
// late keys (empty optional for entities, empty vector for relations).
template<typename K, typename V>
class batch_loader : public loader_base
{
public:
    using fetch_fn = std::function<std::vector<V>(const std::vector<K>&)>;
    // Receives every value that came back from a fetch, late ones included
    using sink_fn = std::function<void(const std::vector<K>&, const std::vector<V>&)>;
    // Consulted before fetching; out[i] set = served without a fetch
    using lookup_fn = std::function<void(const std::vector<K>&, std::vector<std::optional<V>>&)>;

    batch_loader(std::string name, fetch_fn fetch, batch_loader_options options = {})
        : m_name(std::move(name)), m_fetch(std::move(fetch)), m_options(options)
    {
        if (m_options.max_batch_size == 0)
            m_options.max_batch_size = 1;
        if (!m_options.clock)
            m_options.clock = &steady_clock_source::instance();
    }

    void set_result_sink(sink_fn sink) { m_sink = std::move(sink); }
    void set_lookup(lookup_fn lookup) { m_lookup = std::move(lookup); }

    load_future<V> load(const K& key)
    {
        if (m_options.cache)
        {
            auto it = m_memo.find(key);
            if (it != m_memo.end())
            {
                ++m_stats.cache_hits;
                return load_future<V>(it->second);
            }
        }

        auto qit = m_queued.find(key);
        if (qit != m_queued.end())
            return load_future<V>(qit->second);

        auto state = std::make_shared<load_state<V>>();
        m_queued.emplace(key, state);
        m_queue.push_back(key);
        if (m_options.cache)
            m_memo.emplace(key, state);
        return load_future<V>(state);
    }

    std::vector<load_future<V>> load_many(const std::vector<K>& keys)
    {
        std::vector<load_future<V>> out;
        out.reserve(keys.size());
        for (const auto& key : keys)
            out.push_back(load(key));
        return out;
    }

    // Inserts a value without fetching. An existing entry wins; clear() first to replace.
    bool prime(const K& key, V value)
    {
        if (!m_options.cache || m_memo.find(key) != m_memo.end())
            return false;
        auto state = std::make_shared<load_state<V>>();
        state->resolve(std::move(value), false);
        m_memo.emplace(key, std::move(state));
        return true;
    }

    void clear(const K& key) { m_memo.erase(key); }
    void clear_all() { m_memo.clear(); }

    // Runs rounds until no load is queued
    void flush()
    {
        while (has_pending())
            dispatch();
    }

    const std::string& name() const override { return m_name; }
    bool has_pending() const override { return !m_queue.empty(); }
    loader_stats stats() const override { return m_stats; }
    const batch_loader_options& options() const { return m_options; }

    void dispatch() override
    {
        if (m_queue.empty())
            return;

        std::vector<K> keys = std::move(m_queue);
        m_queue.clear();
        auto states = std::move(m_queued);
        m_queued.clear();

        std::vector<K> misses;
        if (m_lookup)
        {
            std::vector<std::optional<V>> found;
            m_lookup(keys, found);
            for (size_t i = 0; i < keys.size(); ++i)
            {
                if (i < found.size() && found[i])
                {
                    states[keys[i]]->resolve(std::move(*found[i]), false);
                    ++m_stats.shared_hits;
                }
                else
                {
                    misses.push_back(keys[i]);
                }
            }
        }
        else
        {
            misses = keys;
        }

        for (size_t off = 0; off < misses.size(); off += m_options.max_batch_size)
        {
            size_t end = std::min(misses.size(), off + m_options.max_batch_size);
            std::vector<K> chunk(misses.begin() + static_cast<std::ptrdiff_t>(off),
                                 misses.begin() + static_cast<std::ptrdiff_t>(end));
            fetch_chunk(chunk, states, true);
        }

        // Continuations run after the whole round so the loads they issue
        // are collected into the next one
        for (const auto& key : keys)
            states[key]->run_continuations();
    }

private:
    using state_map = std::unordered_map<K, std::shared_ptr<load_state<V>>>;

    static std::string describe(const K& key)
    {
        if constexpr (std::is_convertible_v<const K&, std::string_view>)
            return std::string(std::string_view(key));
        else if constexpr (std::is_arithmetic_v<K>)
            return std::to_string(key);
        else
            return "<key>";
    }

    bool invoke(const std::vector<K>& chunk, std::vector<V>& values)
    {
        try
        {
            values = m_fetch(chunk);
            return true;
        }
        catch (const std::exception& e)
        {
            if (chunk.size() == 1)
                LOG_WARNF("%s: fetch failed for %s: %s", m_name.c_str(), describe(chunk[0]).c_str(), e.what());
            else
                LOG_WARNF("%s: batch of %zu failed: %s", m_name.c_str(), chunk.size(), e.what());
            return false;
        }
    }

    void degrade(const K& key, state_map& states, bool late)
    {
        states[key]->resolve(V{}, late);
        if (late)
            ++m_stats.timeouts;
        else
            ++m_stats.failures;
        // Not memoized: a later load in the scope tries again
        if (m_options.cache)
            m_memo.erase(key);
    }

    void fetch_chunk(const std::vector<K>& chunk, state_map& states, bool isolate)
    {
        const clock_source& clock = *m_options.clock;
        auto started = clock.now();

        std::vector<V> values;
        ++m_stats.batches;
        m_stats.keys_fetched += chunk.size();
        if (!invoke(chunk, values))
        {
            if (isolate && chunk.size() > 1)
            {
                // Retry keys one by one so only the failing ones degrade
                for (const auto& key : chunk)
                    fetch_chunk(std::vector<K>{key}, states, false);
                return;
            }
            for (const auto& key : chunk)
            {
                LOG_WARNF("%s: %s resolved to fallback", m_name.c_str(), describe(key).c_str());
                degrade(key, states, false);
            }
            return;
        }

        if (values.size() != chunk.size())
        {
            LOG_ERRORF("%s: fetch returned %zu values for %zu keys", m_name.c_str(),
                       values.size(), chunk.size());
        }
        size_t usable = std::min(values.size(), chunk.size());

        if (m_sink && usable > 0)
        {
            if (usable == chunk.size() && values.size() == chunk.size())
            {
                m_sink(chunk, values);
            }
            else
            {
                std::vector<K> sink_keys(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(usable));
                std::vector<V> sink_values(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(usable));
                m_sink(sink_keys, sink_values);
            }
        }

        bool late = m_options.fetch_timeout.count() > 0 &&
                    clock.now() - started > m_options.fetch_timeout;
        if (late)
        {
            LOG_WARNF("%s: fetch of %zu keys exceeded %lld ms, resolving to fallback",
                      m_name.c_str(), chunk.size(), static_cast<long long>(m_options.fetch_timeout.count()));
            for (const auto& key : chunk)
                degrade(key, states, true);
            return;
        }

        for (size_t i = 0; i < chunk.size(); ++i)
        {
            if (i < usable)
            {
                states[chunk[i]]->resolve(std::move(values[i]), false);
            }
            else
            {
                LOG_WARNF("%s: no value for %s", m_name.c_str(), describe(chunk[i]).c_str());
                states[chunk[i]]->resolve(V{}, false);
            }
        }
    }

    std::string m_name;
    fetch_fn m_fetch;
    batch_loader_options m_options;
    sink_fn m_sink;
    lookup_fn m_lookup;

    std::vector<K> m_queue;
    state_map m_queued;
    state_map m_memo;
    loader_stats m_stats;
};
