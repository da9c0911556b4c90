#pragma once

/**
 * @file rate_governor.hpp
 * @brief Process-wide request throttle with truncated exponential backoff
 *
 * WHY THIS FILE EXISTS:
 * The remote store enforces a per-user request budget (e.g. 12000 requests
 * per 60 seconds) and answers bursts with 403/429/5xx. Every remote call in
 * the process goes through one RateGovernor instance so the budget holds no
 * matter how many components (or threads) issue requests.
 *
 * HOW IT WORKS:
 * - admit() keeps a sliding window of request timestamps. When the window
 *   already holds rate_limit entries, the caller sleeps until the oldest one
 *   leaves the window. Requests are delayed, never dropped.
 * - execute_with_retry() admits, runs the operation, and on a Retriable error
 *   sleeps min(base * 2^attempt, max_backoff) + jitter in [0, 1) seconds
 *   before trying again, at most max_retries times.
 *
 * EXAMPLE:
 * governor::SystemClock clock;
 * governor::RateGovernor governor(clock, {12000, std::chrono::seconds(60)});
 * auto page = governor.execute_with_retry("list_children", [&] {
 *     return service.list_children(folder_id, std::nullopt);
 * });
 */

#include "dsync/governor/clock.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <random>
#include <string>

namespace dsync::governor {

struct GovernorConfig {
    std::size_t rate_limit = 1000;                    ///< Requests admitted per time_window
    std::chrono::seconds time_window{60};
    std::size_t max_retries = 10;
    std::chrono::duration<double> base_delay{1.0};
    std::chrono::duration<double> max_backoff{64.0};
};

class RateGovernor {
public:
    explicit RateGovernor(Clock& clock,
                          GovernorConfig config = {},
                          std::uint32_t seed = std::random_device{}());

    RateGovernor(const RateGovernor&) = delete;
    RateGovernor& operator=(const RateGovernor&) = delete;

    /// Overrides the request budget (operator supplied limits at startup)
    void configure(std::size_t rate_limit, std::chrono::seconds time_window);

    void set_max_retries(std::size_t max_retries);

    [[nodiscard]] GovernorConfig config() const;

    /**
     * @brief Block until one more request fits the budget, then record it
     */
    void admit();

    /**
     * @brief Run a remote operation under the budget, retrying transient failures
     *
     * `operation` must return a Result whose error type exposes
     * is_retriable() and describe(). Permanent errors are returned at once;
     * a retriable error is returned after max_retries + 1 attempts.
     */
    template<typename Operation>
    auto execute_with_retry(const std::string& operation_name, Operation&& operation) -> decltype(operation()) {
        std::size_t attempt = 0;
        while (true) {
            admit();
            auto result = operation();
            if (result.is_ok() || !result.error().is_retriable()) {
                return result;
            }

            const auto max_retries = config().max_retries;
            if (attempt >= max_retries) {
                spdlog::error("Max retries ({}) reached. Giving up on {}: {}",
                              max_retries, operation_name, result.error().describe());
                return result;
            }

            const auto delay = backoff_delay(attempt);
            ++attempt;
            retries_.fetch_add(1);
            spdlog::warn("Request {} failed ({}). Retry {}/{} in {:.1f}s",
                         operation_name, result.error().describe(), attempt, max_retries, delay.count());
            clock_.sleep_for(std::chrono::duration_cast<Clock::duration>(delay));
        }
    }

    /// min(base_delay * 2^attempt, max_backoff) + uniform jitter in [0, 1) seconds
    [[nodiscard]] std::chrono::duration<double> backoff_delay(std::size_t attempt);

    /// Number of admitted requests currently inside the trailing window
    [[nodiscard]] std::size_t in_flight_window() const;

    [[nodiscard]] std::uint64_t total_admitted() const noexcept { return admitted_.load(); }
    [[nodiscard]] std::uint64_t total_retries() const noexcept { return retries_.load(); }

private:
    void prune(Clock::time_point now);

    Clock& clock_;

    mutable std::mutex window_mutex_;
    GovernorConfig config_;
    std::deque<Clock::time_point> window_;

    std::mutex random_mutex_;
    std::mt19937 random_;

    std::atomic<std::uint64_t> admitted_{0};
    std::atomic<std::uint64_t> retries_{0};
};

} // namespace dsync::governor
