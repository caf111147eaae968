/**
 * CommandServer.hpp - Local HTTP endpoint for text messages and admin commands
 *
 * Routes:
 *   POST /messages   {"user_id","user_name","content"} -> enqueue or run "!command"
 *   GET  /feedback?user_id=...  pending feedback for that user (cleared on read)
 *   GET  /status     queue and pipeline snapshot
 *
 * Runs under a ConnectionSupervisor: connectAndRun() serves until stop().
 */

#pragma once

#include "vox/AdminCommands.hpp"
#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"
#include "vox/core/QueueManager.hpp"
#include "vox/core/ResponsePipeline.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace httplib { class Server; }

namespace vox::adapters {

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

class CommandServer : public core::InteractiveAdapter, public core::FeedbackSink {
public:
    static constexpr size_t kMaxFeedbackPerUser = 20;
    // Users who never poll /feedback; the least recently written mailbox goes first
    static constexpr size_t kMaxFeedbackUsers = 256;

    CommandServer(core::QueueManager& queue,
                  AdminCommands& commands,
                  const CommandServerConfig& config,
                  const core::ResponsePipeline* pipeline = nullptr);
    ~CommandServer() override;

    std::string name() const override { return "command_server"; }
    core::LinkResult connectAndRun(const core::LinkUpCallback& onConnected) override;
    void stop() override;

    void sendFeedback(const core::QueueItem& item, const std::string& message) override;

    /// Must be called before connectAndRun().
    void setPipeline(const core::ResponsePipeline* pipeline) { pipeline_ = pipeline; }

    // Route bodies, callable without a socket
    HttpReply handleMessage(const std::string& body);
    HttpReply handleFeedback(const std::string& user_id);
    HttpReply handleStatus() const;

    std::vector<std::string> takeFeedback(const std::string& user_id);
    size_t feedbackUsers() const;

private:
    void installRoutes(httplib::Server& server);

    core::QueueManager& queue_;
    AdminCommands& commands_;
    CommandServerConfig config_;
    const core::ResponsePipeline* pipeline_;

    std::atomic<bool> stopped_{false};
    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    bool serving_ = false;

    struct Mailbox {
        std::deque<std::string> messages;
        uint64_t last_write = 0;
    };

    mutable std::mutex feedback_mutex_;
    std::map<std::string, Mailbox> feedback_;
    uint64_t feedback_writes_ = 0;
};

} // namespace vox::adapters
