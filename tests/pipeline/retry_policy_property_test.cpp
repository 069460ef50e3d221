// =============================================================================
// refdb - Retry Policy Property Tests
// =============================================================================
// Property-based tests for the attempt budget and backoff schedule.
//
// Property: for any policy and any number of leading failures, the attempt
// callback runs min(failures + 1, maxAttempts) times and the sleeper sees
// exactly 2^1*base, 2^2*base, ... for every failed attempt but the last.
// =============================================================================

#include "refdb/pipeline/retry_policy.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <chrono>
#include <vector>

namespace refdb::pipeline::test {

using std::chrono::seconds;

// =============================================================================
// Unit Tests
// =============================================================================

TEST(RetryPolicyTest, DefaultScheduleIs100Then200Seconds) {
    RetryPolicy policy;
    EXPECT_EQ(policy.maxAttempts(), 3U);
    EXPECT_EQ(policy.backoff(1), seconds{100});
    EXPECT_EQ(policy.backoff(2), seconds{200});
}

TEST(RetryPolicyTest, ExhaustionSleepsBetweenAttemptsOnly) {
    RetryPolicy policy;
    std::vector<seconds> delays;
    int calls = 0;

    auto result = policy.run(
        "GCF_1.1",
        [&](std::uint32_t) {
            ++calls;
            return makeVoidError(ErrorCode::kIOError, "HTTP 503");
        },
        [&](seconds delay) { delays.push_back(delay); });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message(), "HTTP 503");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays, (std::vector<seconds>{seconds{100}, seconds{200}}));
}

TEST(RetryPolicyTest, ZeroAttemptsClampsToOne) {
    RetryPolicy policy(0, seconds{1});
    EXPECT_EQ(policy.maxAttempts(), 1U);
}

TEST(RetryPolicyTest, SleeperExceptionPropagates) {
    RetryPolicy policy(3, seconds{1});
    EXPECT_THROW(
        (void)policy.run(
            "GCF_1.1",
            [](std::uint32_t) { return makeVoidError(ErrorCode::kIOError, "timeout"); },
            [](seconds) { throw CancelledError("interrupted"); }),
        CancelledError);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(RetryPolicyProperty, ScheduleMatchesFailures, ()) {
    const auto maxAttempts = *rc::gen::inRange<std::uint32_t>(1, 8);
    const auto base = seconds{*rc::gen::inRange<int>(0, 120)};
    const auto failures = *rc::gen::inRange<std::uint32_t>(0, 10);

    RetryPolicy policy(maxAttempts, base);
    std::vector<seconds> delays;
    std::uint32_t calls = 0;

    auto result = policy.run(
        "accession",
        [&](std::uint32_t attempt) {
            RC_ASSERT(attempt == calls + 1);
            ++calls;
            return calls > failures ? makeVoidSuccess()
                                    : makeVoidError(ErrorCode::kIOError, "failed");
        },
        [&](seconds delay) { delays.push_back(delay); });

    const std::uint32_t expectedCalls = std::min(failures + 1, maxAttempts);
    RC_ASSERT(calls == expectedCalls);
    RC_ASSERT(result.has_value() == (failures < maxAttempts));
    if (result.has_value()) {
        RC_ASSERT(*result == expectedCalls);
    }

    const std::uint32_t expectedSleeps = std::min(failures, maxAttempts - 1);
    RC_ASSERT(delays.size() == expectedSleeps);
    for (std::uint32_t i = 0; i < delays.size(); ++i) {
        RC_ASSERT(delays[i] == base * (std::int64_t{1} << (i + 1)));
    }
}

}  // namespace refdb::pipeline::test
