#include "dsync/governor/clock.hpp"

#include <numeric>
#include <thread>

namespace dsync::governor {

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(duration d) {
    if (d > duration::zero()) {
        std::this_thread::sleep_for(d);
    }
}

ManualClock::ManualClock() : now_(std::chrono::steady_clock::time_point{} + std::chrono::hours(24)) {}

Clock::time_point ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::sleep_for(duration d) {
    std::lock_guard lock(mutex_);
    sleeps_.push_back(d);
    if (d > duration::zero()) {
        now_ += d;
    }
}

void ManualClock::advance(duration d) {
    std::lock_guard lock(mutex_);
    now_ += d;
}

std::vector<Clock::duration> ManualClock::sleeps() const {
    std::lock_guard lock(mutex_);
    return sleeps_;
}

Clock::duration ManualClock::total_slept() const {
    std::lock_guard lock(mutex_);
    return std::accumulate(sleeps_.begin(), sleeps_.end(), duration::zero());
}

} // namespace dsync::governor
