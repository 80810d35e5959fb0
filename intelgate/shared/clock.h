#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

// Time source injected into components that expire or refill state.
// Production code uses steady_clock; tests advance a manual_clock.
class clock_source
{
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~clock_source() = default;
    virtual time_point now() const = 0;

    int64_t now_ms() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }
};

class steady_clock_source : public clock_source
{
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    static steady_clock_source& instance()
    {
        static steady_clock_source clk;
        return clk;
    }
};

// Wall time expressed as a clock_source. Used where instances on different
// hosts must agree on time boundaries (shared rate-limit windows).
class wall_clock_source : public clock_source
{
public:
    time_point now() const override
    {
        return time_point(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::system_clock::now().time_since_epoch()));
    }

    static wall_clock_source& instance()
    {
        static wall_clock_source clk;
        return clk;
    }
};

class manual_clock : public clock_source
{
public:
    manual_clock() : m_ticks(std::chrono::steady_clock::now().time_since_epoch().count()) {}

    time_point now() const override
    {
        return time_point(std::chrono::steady_clock::duration(m_ticks.load(std::memory_order_acquire)));
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d)
    {
        auto delta = std::chrono::duration_cast<std::chrono::steady_clock::duration>(d).count();
        m_ticks.fetch_add(delta, std::memory_order_acq_rel);
    }

private:
    std::atomic<std::chrono::steady_clock::duration::rep> m_ticks;
};
