/**
 * TaskGroup.cpp - Structured ownership of background threads
 */

#include "vox/core/TaskGroup.hpp"

#include <exception>
#include <iostream>

namespace vox::core {

TaskGroup::TaskGroup(StopSignal& stop) : stop_(stop) {}

TaskGroup::~TaskGroup() {
    cancelAndJoin();
}

void TaskGroup::spawn(const std::string& name, TaskFn fn) {
    Task task;
    task.outcome = std::make_unique<TaskOutcome>();
    task.outcome->name = name;

    TaskOutcome* outcome = task.outcome.get();
    const StopSignal* stop = &stop_;

    task.thread = std::thread([outcome, stop, fn = std::move(fn)]() {
        try {
            fn(*stop);
        } catch (const std::exception& e) {
            outcome->failed = true;
            outcome->error = e.what();
            std::cerr << "[TaskGroup] Task '" << outcome->name << "' failed: " << e.what() << std::endl;
        }
    });

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
    std::cout << "[TaskGroup] Spawned '" << name << "'" << std::endl;
}

std::vector<TaskOutcome> TaskGroup::cancelAndJoin() {
    stop_.request();

    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }

    std::vector<TaskOutcome> outcomes;
    outcomes.reserve(tasks.size());

    for (auto& task : tasks) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
        if (task.outcome->failed) {
            std::cout << "[TaskGroup] '" << task.outcome->name
                      << "' stopped with error (ignored): " << task.outcome->error << std::endl;
        } else {
            std::cout << "[TaskGroup] '" << task.outcome->name << "' stopped" << std::endl;
        }
        outcomes.push_back(*task.outcome);
    }

    return outcomes;
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace vox::core
