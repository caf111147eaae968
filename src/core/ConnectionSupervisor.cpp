/**
 * ConnectionSupervisor.cpp - Retry-with-backoff around a flaky link
 */

#include "vox/core/ConnectionSupervisor.hpp"

#include <exception>
#include <iostream>

namespace vox::core {

const char* toString(LinkState state) {
    switch (state) {
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Connecting: return "connecting";
        case LinkState::Connected: return "connected";
        case LinkState::Retrying: return "retrying";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(InteractiveAdapter& adapter, std::chrono::milliseconds backoff)
    : adapter_(adapter)
    , backoff_(backoff)
    , tag_("[Supervisor:" + adapter.name() + "]")
{
    state_.adapter = adapter.name();
}

void ConnectionSupervisor::run(const StopSignal& stop) {
    std::cout << tag_ << " Started (backoff=" << backoff_.count() << "ms)" << std::endl;

    while (!stop.requested()) {
        setState(LinkState::Connecting);

        LinkResult result;
        bool failed = false;
        try {
            result = adapter_.connectAndRun([this]() { setState(LinkState::Connected); });
            failed = !result.stopped;
        } catch (const std::exception& e) {
            failed = true;
            result = LinkResult::dropped(e.what());
        }

        if (!failed) {
            std::cout << tag_ << " Adapter stopped" << std::endl;
            break;
        }

        recordFailure(result.error);
        if (stop.requested()) {
            break;
        }

        std::cerr << tag_ << " Connection lost: " << result.error
                  << " (retry in " << backoff_.count() << "ms)" << std::endl;

        if (stop.waitFor(backoff_)) {
            std::cout << tag_ << " Stop requested during backoff" << std::endl;
            break;
        }
    }

    setState(LinkState::Disconnected);
    std::cout << tag_ << " Exited" << std::endl;
}

ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ConnectionSupervisor::setState(LinkState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.state = state;
}

void ConnectionSupervisor::recordFailure(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.state = LinkState::Retrying;
    state_.last_error = error;
    ++state_.retry_count;
}

} // namespace vox::core
