/**
 * Orchestrator.hpp - Builds the whole system from a Config and runs it
 *
 * Owns every component. A collaborator that fails to come up (no audio
 * device, unreachable avatar) is logged and left out; items that need it
 * are aborted one by one instead of stopping the process.
 */

#pragma once

#include "vox/Config.hpp"

#include <memory>
#include <string>

namespace vox {

class Orchestrator {
public:
    explicit Orchestrator(const Config& config);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void start();

    /// Runs the ordered shutdown; safe to call more than once.
    void stop();

    bool stopRequested() const;

    /// One-line summary of queue and pipeline counters.
    std::string statusLine() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vox
