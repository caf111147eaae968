/**
 * LifecycleCoordinator.cpp - Startup/shutdown sequencing
 */

#include "vox/core/LifecycleCoordinator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace vox::core {

LifecycleCoordinator::LifecycleCoordinator(QueueManager& queue,
                                           ResponsePipeline& pipeline,
                                           AvatarController* avatar,
                                           const Config& config)
    : queue_(queue)
    , pipeline_(pipeline)
    , avatar_(avatar)
    , backoff_(config.supervisor.backoff_ms)
    , frame_interval_(std::max(1, 1000 / std::max(1, config.avatar.fps)))
    , tasks_(stop_)
{
}

LifecycleCoordinator::~LifecycleCoordinator() {
    shutdown();
}

void LifecycleCoordinator::addAdapter(InteractiveAdapter& adapter) {
    std::lock_guard<std::mutex> lock(adapters_mutex_);
    if (started_) {
        std::cerr << "[Lifecycle] Adapter '" << adapter.name()
                  << "' registered after start; it will not be supervised" << std::endl;
        return;
    }
    adapters_.push_back(&adapter);
}

void LifecycleCoordinator::start() {
    if (shutdown_started_) {
        std::cerr << "[Lifecycle] start() after shutdown ignored" << std::endl;
        return;
    }
    if (started_.exchange(true)) {
        return;
    }

    std::cout << "[Lifecycle] Starting..." << std::endl;

    // Avatar first; the rest of the system runs fine without it
    if (avatar_) {
        bool connected = false;
        try {
            connected = avatar_->connect();
        } catch (const std::exception& e) {
            std::cerr << "[Lifecycle] Avatar connect error: " << e.what() << std::endl;
        }
        avatar_connected_ = connected;
        if (connected) {
            std::cout << "[Lifecycle] Avatar connected" << std::endl;
        } else {
            std::cerr << "[Lifecycle] Avatar unavailable, continuing without it" << std::endl;
        }
    }

    tasks_.spawn("pipeline", [this](const StopSignal& stop) {
        pipeline_.run(stop);
    });

    {
        std::lock_guard<std::mutex> lock(adapters_mutex_);
        for (InteractiveAdapter* adapter : adapters_) {
            supervisors_.push_back(std::make_unique<ConnectionSupervisor>(*adapter, backoff_));
            ConnectionSupervisor* supervisor = supervisors_.back().get();
            tasks_.spawn("supervisor:" + adapter->name(), [supervisor](const StopSignal& stop) {
                supervisor->run(stop);
            });
        }
    }

    if (avatar_connected_) {
        tasks_.spawn("animation", [this](const StopSignal& stop) {
            animationLoop(stop);
        });
    }

    std::cout << "[Lifecycle] Started " << tasks_.size() << " tasks" << std::endl;
}

void LifecycleCoordinator::shutdown() {
    if (shutdown_started_.exchange(true)) {
        return;
    }

    std::cout << "[Lifecycle] Shutting down..." << std::endl;
    stop_.request();

    // 1. Interactive adapters: no new external events
    std::vector<InteractiveAdapter*> adapters;
    {
        std::lock_guard<std::mutex> lock(adapters_mutex_);
        adapters = adapters_;
    }
    for (InteractiveAdapter* adapter : adapters) {
        try {
            adapter->stop();
            std::cout << "[Lifecycle] Stopped adapter '" << adapter->name() << "'" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Lifecycle] Stopping adapter '" << adapter->name()
                      << "' failed (ignored): " << e.what() << std::endl;
        }
    }

    // 2. Avatar
    if (avatar_ && avatar_connected_.exchange(false)) {
        try {
            avatar_->disconnect();
            std::cout << "[Lifecycle] Avatar disconnected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Lifecycle] Avatar disconnect failed (ignored): " << e.what() << std::endl;
        }
    }

    // 3. Queue
    try {
        queue_.stop();
    } catch (const std::exception& e) {
        std::cerr << "[Lifecycle] Stopping queue failed (ignored): " << e.what() << std::endl;
    }

    // 4. Background tasks; the pipeline finishes the item it is playing first
    std::vector<TaskOutcome> outcomes = tasks_.cancelAndJoin();
    size_t failed = std::count_if(outcomes.begin(), outcomes.end(),
                                  [](const TaskOutcome& o) { return o.failed; });

    size_t discarded = queue_.size();
    if (discarded > 0) {
        std::cout << "[Lifecycle] Discarded " << discarded << " pending items" << std::endl;
    }

    std::cout << "[Lifecycle] Shutdown complete (" << outcomes.size() << " tasks joined, "
              << failed << " with errors)" << std::endl;
}

std::vector<ConnectionState> LifecycleCoordinator::connectionStates() const {
    std::lock_guard<std::mutex> lock(adapters_mutex_);
    std::vector<ConnectionState> states;
    states.reserve(supervisors_.size());
    for (const auto& supervisor : supervisors_) {
        states.push_back(supervisor->state());
    }
    return states;
}

void LifecycleCoordinator::animationLoop(const StopSignal& stop) {
    std::cout << "[Lifecycle] Animation loop started (" << frame_interval_.count() << "ms/frame)" << std::endl;

    while (!stop.waitFor(frame_interval_)) {
        if (!avatar_connected_) break;
        try {
            avatar_->tick();
        } catch (const std::exception& e) {
            std::cerr << "[Lifecycle] Animation tick failed: " << e.what() << std::endl;
        }
    }

    std::cout << "[Lifecycle] Animation loop stopped" << std::endl;
}

} // namespace vox::core
