// =============================================================================
// refdb - Cancellation Support Implementation
// =============================================================================

#include "refdb/common/cancellation.h"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <thread>

#include "refdb/common/error.h"

namespace refdb {

namespace {

std::atomic<bool> gCancelled{false};

static_assert(std::atomic<bool>::is_always_lock_free,
              "cancellation flag must be lock-free to be set from a signal handler");

/// @brief Polling interval while sleeping.
constexpr auto kSleepSlice = std::chrono::milliseconds(250);

void onTerminationSignal(int /*signum*/) {
    gCancelled.store(true, std::memory_order_relaxed);
}

}  // namespace

void installSignalHandlers() {
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
}

void requestCancellation() noexcept {
    gCancelled.store(true, std::memory_order_relaxed);
}

bool isCancelled() noexcept {
    return gCancelled.load(std::memory_order_relaxed);
}

void resetCancellation() noexcept {
    gCancelled.store(false, std::memory_order_relaxed);
}

void throwIfCancelled() {
    if (isCancelled()) {
        throw CancelledError("Run interrupted by signal");
    }
}

void interruptibleSleep(std::chrono::seconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        throwIfCancelled();
        const auto remaining = deadline - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(remaining, kSleepSlice));
    }
    throwIfCancelled();
}

}  // namespace refdb
