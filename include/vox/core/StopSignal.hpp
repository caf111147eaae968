/**
 * StopSignal.hpp - Process-wide "system is stopping" flag
 *
 * Owned by LifecycleCoordinator and observed by reference everywhere else.
 * Timed waits return early as soon as a stop is requested, so backoff sleeps
 * and frame timers never delay shutdown by more than one wake-up.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace vox::core {

class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    /// Idempotent. Wakes every waiter.
    void request();

    bool requested() const { return requested_.load(); }

    /// Sleeps up to `timeout`. Returns true if a stop was requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Blocks until a stop is requested.
    void wait() const;

private:
    std::atomic<bool> requested_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace vox::core
