#pragma once

#include <chrono>
#include <mutex>
#include <vector>

namespace dsync::governor {

/**
 * @brief Time source used by the governor and the response cache
 *
 * Both components only need "now" and "block for a while"; routing them
 * through this interface lets tests run hours of virtual time instantly.
 */
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    virtual void sleep_for(duration d) = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;
};

/**
 * @brief Virtual clock: sleep_for() advances time instead of blocking
 */
class ManualClock : public Clock {
public:
    ManualClock();

    time_point now() const override;
    void sleep_for(duration d) override;

    void advance(duration d);

    /// Every duration passed to sleep_for(), in call order
    std::vector<duration> sleeps() const;
    duration total_slept() const;

private:
    mutable std::mutex mutex_;
    time_point now_;
    std::vector<duration> sleeps_;
};

} // namespace dsync::governor
