// =============================================================================
// refdb - Retry Policy
// =============================================================================
// Bounded retry with exponential backoff for per-accession work.
//
// Schedule: after failed attempt n (1-based) the caller sleeps
// 2^n * base seconds, unless n was the last attempt. With the defaults
// (3 attempts, base 50 s) a fully failing item sleeps 100 s, then 200 s,
// then gives up.
//
// The sleep is injected so tests can observe the schedule without waiting.
// =============================================================================

#ifndef REFDB_PIPELINE_RETRY_POLICY_H
#define REFDB_PIPELINE_RETRY_POLICY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include "refdb/common/error.h"
#include "refdb/common/logger.h"

namespace refdb::pipeline {

/// @brief Blocking delay used between attempts.
using Sleeper = std::function<void(std::chrono::seconds)>;

/// @brief Default number of download attempts.
inline constexpr std::uint32_t kDefaultMaxAttempts = 3;

/// @brief Default backoff base.
inline constexpr std::chrono::seconds kDefaultBackoffBase{50};

/// @brief Attempt budget and backoff schedule.
class RetryPolicy {
public:
    constexpr RetryPolicy() noexcept = default;

    constexpr RetryPolicy(std::uint32_t maxAttempts, std::chrono::seconds backoffBase) noexcept
        : maxAttempts_(maxAttempts == 0 ? 1 : maxAttempts), backoffBase_(backoffBase) {}

    /// @brief Total number of attempts, at least 1.
    [[nodiscard]] constexpr std::uint32_t maxAttempts() const noexcept { return maxAttempts_; }

    /// @brief Backoff base (delay unit).
    [[nodiscard]] constexpr std::chrono::seconds backoffBase() const noexcept {
        return backoffBase_;
    }

    /// @brief Delay after failed attempt `attempt` (1-based): 2^attempt * base.
    [[nodiscard]] constexpr std::chrono::seconds backoff(std::uint32_t attempt) const noexcept {
        return backoffBase_ * (std::chrono::seconds::rep{1} << attempt);
    }

    /// @brief Run `attempt` until it succeeds or the budget is spent.
    /// @param label Item name used in log lines.
    /// @param attempt Callable taking the 1-based attempt number and returning VoidResult.
    /// @param sleep Delay function invoked between attempts.
    /// @return Number of attempts used on success, or the last attempt's error.
    /// @note Exceptions thrown by `attempt` or `sleep` (e.g. CancelledError) propagate.
    template <typename Attempt>
    [[nodiscard]] Result<std::uint32_t> run(std::string_view label, Attempt&& attempt,
                                            const Sleeper& sleep) const {
        Error lastError{ErrorCode::kIOError, "no attempt made"};
        for (std::uint32_t n = 1; n <= maxAttempts_; ++n) {
            VoidResult result = attempt(n);
            if (result.has_value()) {
                return n;
            }
            lastError = result.error();
            if (n < maxAttempts_) {
                const auto delay = backoff(n);
                REFDB_LOG_WARNING("Attempt {} for {} failed ({}), retrying in {} seconds...", n,
                                  label, lastError.message(), delay.count());
                sleep(delay);
            } else {
                REFDB_LOG_ERROR("Attempt {} for {} failed ({}), giving up", n, label,
                                lastError.message());
            }
        }
        return std::unexpected(lastError);
    }

    [[nodiscard]] constexpr bool operator==(const RetryPolicy& other) const noexcept = default;

private:
    std::uint32_t maxAttempts_ = kDefaultMaxAttempts;
    std::chrono::seconds backoffBase_ = kDefaultBackoffBase;
};

}  // namespace refdb::pipeline

#endif  // REFDB_PIPELINE_RETRY_POLICY_H
