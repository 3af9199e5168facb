#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

using time_point = std::chrono::system_clock::time_point;

/**
 * Wall-clock source shared by every component that enforces a TTL.
 * Tests substitute ManualClock to simulate the passage of time.
 */
class Clock
{
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual time_point now() const = 0;
};

class SystemClock final : public Clock
{
public:
    [[nodiscard]] time_point now() const override { return std::chrono::system_clock::now(); }
};

class ManualClock final : public Clock
{
public:
    explicit ManualClock(time_point start = std::chrono::system_clock::now())
        : ticks(start.time_since_epoch().count())
    {
    }

    [[nodiscard]] time_point now() const override
    {
        return time_point(time_point::duration(ticks.load(std::memory_order_acquire)));
    }

    template<class Rep, class Period>
    void advance(std::chrono::duration<Rep, Period> d)
    {
        ticks.fetch_add(std::chrono::duration_cast<time_point::duration>(d).count(),
                        std::memory_order_acq_rel);
    }

private:
    std::atomic<time_point::rep> ticks;
};

[[nodiscard]] inline int64_t to_unix_ms(time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline time_point from_unix_ms(int64_t ms)
{
    return time_point(std::chrono::duration_cast<time_point::duration>(std::chrono::milliseconds(ms)));
}
