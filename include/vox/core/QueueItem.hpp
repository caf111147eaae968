/**
 * QueueItem.hpp - Unit of work flowing from adapters to the response pipeline
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace vox::core {

using Clock = std::chrono::steady_clock;

enum class Source {
    Voice,
    Text,
    LiveChat
};

enum class Priority {
    Admin = 0,
    Normal = 1
};

const char* toString(Source source);
const char* toString(Priority priority);

struct QueueItem {
    std::string content;  // already transcribed for voice
    Source source = Source::Text;
    std::string user_id;
    std::string user_name = "Unknown";

    // Assigned by QueueManager::enqueue
    Priority priority = Priority::Normal;
    Clock::time_point enqueued_at{};
    uint64_t sequence = 0;

    // Source-specific extras, passed through untouched
    nlohmann::json metadata = nlohmann::json::object();
};

} // namespace vox::core
