// =============================================================================
// refdb - Cancellation Support
// =============================================================================
// Process-wide cancellation flag raised by SIGINT/SIGTERM.
//
// Stages poll isCancelled() between accessions and during backoff sleeps;
// the flag is only ever set from the signal handler or from tests.
// =============================================================================

#ifndef REFDB_COMMON_CANCELLATION_H
#define REFDB_COMMON_CANCELLATION_H

#include <chrono>

namespace refdb {

/// @brief Install SIGINT/SIGTERM handlers that request cancellation.
void installSignalHandlers();

/// @brief Request cancellation of the running pipeline.
/// @note Async-signal-safe.
void requestCancellation() noexcept;

/// @brief Check whether cancellation was requested.
[[nodiscard]] bool isCancelled() noexcept;

/// @brief Clear a previous cancellation request.
void resetCancellation() noexcept;

/// @brief Throw CancelledError if cancellation was requested.
void throwIfCancelled();

/// @brief Sleep for the given duration, waking early on cancellation.
/// @throws CancelledError if cancellation is requested while sleeping.
void interruptibleSleep(std::chrono::seconds duration);

}  // namespace refdb

#endif  // REFDB_COMMON_CANCELLATION_H
