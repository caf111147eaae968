/**
 * LiveChatPoller.hpp - Pulls live-chat messages and queues the questions
 *
 * Polls GET <path>?since=<cursor> on the chat relay, which answers
 *   {"items":[{"id","author_id","author","message"}], "cursor":"..."}
 * Only messages that look like questions are queued. Any HTTP or payload
 * error ends connectAndRun() with an exception so the supervisor backs off
 * and reconnects.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"
#include "vox/core/QueueManager.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace vox::adapters {

struct ChatMessage {
    std::string id;
    std::string author_id;
    std::string author;
    std::string message;
};

struct ChatBatch {
    std::vector<ChatMessage> items;
    std::string cursor;
};

class ChatProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Throws ChatProtocolError on malformed payloads.
ChatBatch parseChatBatch(const std::string& body);

/// True if `text` contains '?', a full-width question mark or any of
/// `markers` (ASCII case-insensitive).
bool looksLikeQuestion(const std::string& text, const std::vector<std::string>& markers);

class LiveChatPoller : public core::InteractiveAdapter {
public:
    LiveChatPoller(core::QueueManager& queue, const LiveChatConfig& config);
    ~LiveChatPoller() override;

    std::string name() const override { return "live_chat"; }
    core::LinkResult connectAndRun(const core::LinkUpCallback& onConnected) override;
    void stop() override;

    /// Applies one polled batch. Returns how many items were queued.
    size_t ingest(const ChatBatch& batch);

    uint64_t forwarded() const { return forwarded_.load(); }
    uint64_t ignored() const { return ignored_.load(); }

private:
    bool waitPollInterval();

    core::QueueManager& queue_;
    LiveChatConfig config_;
    std::string cursor_;

    std::atomic<bool> stopped_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> ignored_{0};
};

} // namespace vox::adapters
