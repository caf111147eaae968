/**
 * TaskGroup.hpp - Owns the background threads of the running system
 *
 * Spawn, cancellation and join are one unit: every task body receives the
 * group's StopSignal, cancelAndJoin() requests it and then joins each task
 * in spawn order. An exception escaping a task body is caught at the task
 * boundary and reported in that task's outcome instead of terminating.
 */

#pragma once

#include "vox/core/StopSignal.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vox::core {

struct TaskOutcome {
    std::string name;
    bool failed = false;
    std::string error;
};

class TaskGroup {
public:
    using TaskFn = std::function<void(const StopSignal&)>;

    explicit TaskGroup(StopSignal& stop);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(const std::string& name, TaskFn fn);

    /// Requests stop, joins every task and returns their outcomes.
    std::vector<TaskOutcome> cancelAndJoin();

    size_t size() const;

private:
    struct Task {
        std::unique_ptr<TaskOutcome> outcome;
        std::thread thread;
    };

    StopSignal& stop_;
    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
};

} // namespace vox::core
