/**
 * LifecycleCoordinator.hpp - Ordered startup and shutdown of the running system
 *
 * Owns the StopSignal and the TaskGroup. Startup connects the avatar, then
 * spawns the pipeline loop, one ConnectionSupervisor per adapter and the
 * animation loop. Shutdown runs, in order and each step best-effort:
 *   1. stop every interactive adapter
 *   2. disconnect the avatar
 *   3. stop the QueueManager
 *   4. cancel and join every background task
 * The second and later shutdown() calls return immediately.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/ConnectionSupervisor.hpp"
#include "vox/core/QueueManager.hpp"
#include "vox/core/ResponsePipeline.hpp"
#include "vox/core/StopSignal.hpp"
#include "vox/core/TaskGroup.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace vox::core {

class LifecycleCoordinator {
public:
    LifecycleCoordinator(QueueManager& queue,
                         ResponsePipeline& pipeline,
                         AvatarController* avatar,
                         const Config& config);
    ~LifecycleCoordinator();

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    /// Adapters must be registered before start().
    void addAdapter(InteractiveAdapter& adapter);

    void start();
    void shutdown();

    /// Raises the StopSignal without running the shutdown sequence.
    void requestStop() { stop_.request(); }
    void waitForStop() const { stop_.wait(); }

    bool started() const { return started_.load(); }
    bool stopping() const { return shutdown_started_.load(); }
    bool avatarConnected() const { return avatar_connected_.load(); }

    const StopSignal& stopSignal() const { return stop_; }
    std::vector<ConnectionState> connectionStates() const;

private:
    void animationLoop(const StopSignal& stop);

    QueueManager& queue_;
    ResponsePipeline& pipeline_;
    AvatarController* avatar_;
    std::chrono::milliseconds backoff_;
    std::chrono::milliseconds frame_interval_;

    StopSignal stop_;
    TaskGroup tasks_;

    mutable std::mutex adapters_mutex_;
    std::vector<InteractiveAdapter*> adapters_;
    std::vector<std::unique_ptr<ConnectionSupervisor>> supervisors_;

    std::atomic<bool> started_{false};
    std::atomic<bool> shutdown_started_{false};
    std::atomic<bool> avatar_connected_{false};
};

} // namespace vox::core
