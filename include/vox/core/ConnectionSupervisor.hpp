/**
 * ConnectionSupervisor.hpp - Keeps one interactive adapter connected
 *
 * Calls adapter.connectAndRun() until the adapter returns a caller-initiated
 * stop or the StopSignal is raised. The state stays `connecting` until the
 * adapter reports its link is up. A dropped link or a thrown exception is
 * logged and retried after a fixed backoff; the backoff sleep wakes early on
 * stop, so the supervisor exits within one interval of being told to.
 */

#pragma once

#include "vox/core/Collaborators.hpp"
#include "vox/core/StopSignal.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace vox::core {

enum class LinkState {
    Disconnected,
    Connecting,
    Connected,
    Retrying
};

const char* toString(LinkState state);

struct ConnectionState {
    std::string adapter;
    LinkState state = LinkState::Disconnected;
    std::string last_error;
    int retry_count = 0;
};

class ConnectionSupervisor {
public:
    ConnectionSupervisor(InteractiveAdapter& adapter, std::chrono::milliseconds backoff);

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /// Supervision loop; runs on a TaskGroup thread.
    void run(const StopSignal& stop);

    ConnectionState state() const;

private:
    void setState(LinkState state);
    void recordFailure(const std::string& error);

    InteractiveAdapter& adapter_;
    std::chrono::milliseconds backoff_;
    std::string tag_;

    mutable std::mutex mutex_;
    ConnectionState state_;
};

} // namespace vox::core
