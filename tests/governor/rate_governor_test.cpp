#include "dsync/governor/clock.hpp"
#include "dsync/governor/rate_governor.hpp"
#include "dsync/remote/service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using dsync::governor::Clock;
using dsync::governor::GovernorConfig;
using dsync::governor::ManualClock;
using dsync::governor::RateGovernor;
using dsync::remote::RemoteError;
using dsync::remote::RemoteResult;

using namespace std::chrono_literals;

TEST(RateGovernorTest, NeverAdmitsMoreThanTheLimitPerWindow) {
    ManualClock clock;
    GovernorConfig config;
    config.rate_limit = 5;
    config.time_window = 10s;
    RateGovernor governor(clock, config, 1);

    std::vector<Clock::time_point> admitted;
    for (int i = 0; i < 23; ++i) {
        governor.admit();
        admitted.push_back(clock.now());
        clock.advance(700ms);
    }

    for (std::size_t i = 0; i < admitted.size(); ++i) {
        std::size_t in_window = 0;
        for (std::size_t j = i; j < admitted.size(); ++j) {
            if (admitted[j] - admitted[i] < config.time_window) {
                ++in_window;
            }
        }
        EXPECT_LE(in_window, config.rate_limit) << "window starting at request " << i;
    }
    EXPECT_EQ(governor.total_admitted(), 23u);
    EXPECT_FALSE(clock.sleeps().empty());
}

TEST(RateGovernorTest, DoesNotSleepBelowTheLimit) {
    ManualClock clock;
    RateGovernor governor(clock, GovernorConfig{}, 1);

    for (int i = 0; i < 100; ++i) {
        governor.admit();
    }
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(governor.in_flight_window(), 100u);

    clock.advance(60s);
    EXPECT_EQ(governor.in_flight_window(), 0u);
}

TEST(RateGovernorTest, ConfigureOverridesTheBudget) {
    ManualClock clock;
    RateGovernor governor(clock);
    governor.configure(12000, 60s);

    EXPECT_EQ(governor.config().rate_limit, 12000u);
    EXPECT_EQ(governor.config().time_window, 60s);
}

TEST(RateGovernorTest, BackoffIsExponentialTruncatedAndJittered) {
    ManualClock clock;
    GovernorConfig config;
    config.base_delay = std::chrono::duration<double>(1.0);
    config.max_backoff = std::chrono::duration<double>(64.0);
    RateGovernor governor(clock, config, 7);

    for (std::size_t attempt = 0; attempt < 12; ++attempt) {
        const double expected = std::min(static_cast<double>(1u << attempt), 64.0);
        const double delay = governor.backoff_delay(attempt).count();
        EXPECT_GE(delay, expected) << attempt;
        EXPECT_LT(delay, expected + 1.0) << attempt;
    }
}

TEST(RateGovernorTest, RetriableFailureIsAttemptedMaxRetriesPlusOneTimes) {
    ManualClock clock;
    GovernorConfig config;
    config.max_retries = 4;
    RateGovernor governor(clock, config, 3);

    int attempts = 0;
    auto result = governor.execute_with_retry("always_busy", [&]() -> RemoteResult<int> {
        ++attempts;
        return dsync::Err(RemoteError::retriable(503, "backendError", "busy"));
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is_retriable());
    EXPECT_EQ(attempts, 5);
    EXPECT_EQ(governor.total_retries(), 4u);
    EXPECT_EQ(clock.sleeps().size(), 4u);
    // 1 + 2 + 4 + 8 seconds plus at most 1s of jitter each
    EXPECT_GE(clock.total_slept(), 15s);
    EXPECT_LT(clock.total_slept(), 19s);
}

TEST(RateGovernorTest, PermanentFailureIsNotRetried) {
    ManualClock clock;
    RateGovernor governor(clock, GovernorConfig{}, 3);

    int attempts = 0;
    auto result = governor.execute_with_retry("missing", [&]() -> RemoteResult<int> {
        ++attempts;
        return dsync::Err(RemoteError::not_found("file-1"));
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(attempts, 1);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST(RateGovernorTest, RecoversAfterTransientFailures) {
    ManualClock clock;
    RateGovernor governor(clock, GovernorConfig{}, 3);

    int attempts = 0;
    auto result = governor.execute_with_retry("flaky", [&]() -> RemoteResult<int> {
        if (++attempts < 3) {
            return dsync::Err(RemoteError::retriable(429, "rateLimitExceeded", "slow down"));
        }
        return dsync::Ok(42);
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(governor.total_admitted(), 3u);
}

TEST(RateGovernorTest, ZeroRetriesSurfacesTheFirstError) {
    ManualClock clock;
    RateGovernor governor(clock, GovernorConfig{}, 3);
    governor.set_max_retries(0);

    int attempts = 0;
    auto result = governor.execute_with_retry("once", [&]() -> RemoteResult<int> {
        ++attempts;
        return dsync::Err(RemoteError::retriable(500, "backendError", "oops"));
    });

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(attempts, 1);
}
