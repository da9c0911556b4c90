#include "dsync/governor/rate_governor.hpp"

#include <algorithm>
#include <cmath>

namespace dsync::governor {

RateGovernor::RateGovernor(Clock& clock, GovernorConfig config, std::uint32_t seed)
    : clock_(clock), config_(config), random_(seed) {
    config_.rate_limit = std::max<std::size_t>(config_.rate_limit, 1);
}

void RateGovernor::configure(std::size_t rate_limit, std::chrono::seconds time_window) {
    std::lock_guard lock(window_mutex_);
    config_.rate_limit = std::max<std::size_t>(rate_limit, 1);
    config_.time_window = time_window;
    spdlog::info("RateGovernor configured: {} requests per {}s.", config_.rate_limit, config_.time_window.count());
}

void RateGovernor::set_max_retries(std::size_t max_retries) {
    std::lock_guard lock(window_mutex_);
    config_.max_retries = max_retries;
}

GovernorConfig RateGovernor::config() const {
    std::lock_guard lock(window_mutex_);
    return config_;
}

void RateGovernor::admit() {
    // The sleep happens under the lock: waiting callers queue up behind the
    // one that is already waiting for the oldest slot to expire.
    std::lock_guard lock(window_mutex_);
    auto now = clock_.now();
    prune(now);

    while (window_.size() >= config_.rate_limit) {
        const auto wait = config_.time_window - (now - window_.front());
        if (wait > Clock::duration::zero()) {
            spdlog::debug("Rate limit reached. Sleeping {:.2f}s to comply.",
                          std::chrono::duration<double>(wait).count());
            clock_.sleep_for(std::chrono::duration_cast<Clock::duration>(wait));
        }
        now = clock_.now();
        prune(now);
    }

    window_.push_back(now);
    admitted_.fetch_add(1);
}

std::chrono::duration<double> RateGovernor::backoff_delay(std::size_t attempt) {
    const auto cfg = config();
    const double exponential = cfg.base_delay.count() * std::pow(2.0, static_cast<double>(attempt));
    const double delay = std::min(exponential, cfg.max_backoff.count());

    double jitter = 0.0;
    {
        std::lock_guard lock(random_mutex_);
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        jitter = distribution(random_);
    }
    return std::chrono::duration<double>(delay + jitter);
}

std::size_t RateGovernor::in_flight_window() const {
    std::lock_guard lock(window_mutex_);
    const auto now = clock_.now();
    return static_cast<std::size_t>(std::count_if(window_.begin(), window_.end(),
        [&](const Clock::time_point& t) { return now - t < config_.time_window; }));
}

void RateGovernor::prune(Clock::time_point now) {
    while (!window_.empty() && now - window_.front() >= config_.time_window) {
        window_.pop_front();
    }
}

} // namespace dsync::governor
