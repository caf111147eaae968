/**
 * CommandServer.cpp - cpp-httplib server for the text adapter
 */

#include "vox/adapters/CommandServer.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

#include <httplib.h>

using json = nlohmann::json;

namespace vox::adapters {

namespace {

int statusFor(core::EnqueueResult result) {
    switch (result) {
        case core::EnqueueResult::Accepted:
        case core::EnqueueResult::AcceptedWithEviction:
            return 202;
        case core::EnqueueResult::RejectedFull:
            return 429;
        case core::EnqueueResult::RejectedSourceDisabled:
            return 403;
        case core::EnqueueResult::RejectedClosed:
        case core::EnqueueResult::RejectedPaused:
            return 503;
    }
    return 500;
}

HttpReply rejected(int status, const std::string& reason) {
    return {status, {{"status", "rejected"}, {"reason", reason}}};
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

CommandServer::CommandServer(core::QueueManager& queue,
                             AdminCommands& commands,
                             const CommandServerConfig& config,
                             const core::ResponsePipeline* pipeline)
    : queue_(queue)
    , commands_(commands)
    , config_(config)
    , pipeline_(pipeline)
{
}

CommandServer::~CommandServer() {
    stop();
}

core::LinkResult CommandServer::connectAndRun(const core::LinkUpCallback& onConnected) {
    httplib::Server* server = nullptr;
    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (stopped_) {
            return core::LinkResult::stoppedByCaller();
        }

        server_ = std::make_unique<httplib::Server>();
        installRoutes(*server_);

        if (!server_->bind_to_port(config_.host, config_.port)) {
            server_.reset();
            return core::LinkResult::dropped("cannot bind " + config_.host + ":" + std::to_string(config_.port));
        }
        serving_ = true;
        server = server_.get();
    }

    std::cout << "[CommandServer] Listening on http://" << config_.host << ":" << config_.port << std::endl;
    onConnected();
    bool clean = server->listen_after_bind();

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        serving_ = false;
        server_.reset();
    }

    if (stopped_) {
        std::cout << "[CommandServer] Stopped" << std::endl;
        return core::LinkResult::stoppedByCaller();
    }
    return core::LinkResult::dropped(clean ? "server loop exited" : "server socket failed");
}

void CommandServer::stop() {
    stopped_ = true;

    std::lock_guard<std::mutex> lock(server_mutex_);
    if (!server_ || !serving_) {
        return;
    }

    // Server::stop() is a no-op until listen has actually started
    for (int i = 0; i < 200 && !server_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    server_->stop();
}

void CommandServer::installRoutes(httplib::Server& server) {
    server.Post("/messages", [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handleMessage(req.body);
        res.status = reply.status;
        res.set_content(reply.body.dump(), "application/json");
    });

    server.Get("/feedback", [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handleFeedback(req.get_param_value("user_id"));
        res.status = reply.status;
        res.set_content(reply.body.dump(), "application/json");
    });

    server.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        HttpReply reply = handleStatus();
        res.status = reply.status;
        res.set_content(reply.body.dump(), "application/json");
    });
}

HttpReply CommandServer::handleMessage(const std::string& body) {
    std::string user_id;
    std::string user_name;
    std::string content;

    try {
        json payload = json::parse(body);
        if (!payload.is_object()) {
            return rejected(400, "body must be a JSON object");
        }
        user_id = payload.value("user_id", "");
        user_name = payload.value("user_name", user_id);
        content = payload.value("content", "");
    } catch (const json::exception& e) {
        return rejected(400, std::string("invalid JSON: ") + e.what());
    }

    if (user_id.empty()) {
        return rejected(400, "user_id is required");
    }
    if (isBlank(content)) {
        return rejected(400, "content is empty");
    }

    if (AdminCommands::isCommand(content)) {
        CommandResult result = commands_.execute(user_id, content);
        int status = result.ok ? 200 : (queue_.isAdmin(user_id) ? 400 : 403);
        return {status, {{"status", "command"}, {"ok", result.ok}, {"message", result.message}}};
    }

    core::QueueItem item;
    item.content = content;
    item.source = core::Source::Text;
    item.user_id = user_id;
    item.user_name = user_name.empty() ? user_id : user_name;
    item.metadata = {{"channel", "http"}};

    core::EnqueueResult result = queue_.enqueue(item);
    if (!core::isAccepted(result)) {
        return rejected(statusFor(result), core::toString(result));
    }

    return {statusFor(result), {
        {"status", "accepted"},
        {"priority", queue_.isAdmin(user_id) ? "admin" : "normal"},
        {"evicted", result == core::EnqueueResult::AcceptedWithEviction},
        {"pending", queue_.size()}
    }};
}

HttpReply CommandServer::handleFeedback(const std::string& user_id) {
    if (user_id.empty()) {
        return {400, {{"error", "user_id is required"}}};
    }
    return {200, {{"user_id", user_id}, {"messages", takeFeedback(user_id)}}};
}

HttpReply CommandServer::handleStatus() const {
    core::QueueStats q = queue_.stats();
    json status = {
        {"queue", {
            {"size", q.size},
            {"admin", q.admin_size},
            {"normal", q.normal_size},
            {"capacity", q.capacity},
            {"accepted", q.accepted},
            {"rejected", q.rejected},
            {"evicted", q.evicted},
            {"dequeued", q.dequeued},
            {"paused", q.paused},
            {"stopped", q.stopped}
        }}
    };

    if (pipeline_) {
        core::PipelineStats p = pipeline_->stats();
        status["pipeline"] = {
            {"busy", pipeline_->busy()},
            {"processed", p.processed},
            {"suppressed", p.suppressed},
            {"aborted", p.aborted},
            {"stale_skipped", p.stale_skipped},
            {"last_duration_ms", p.last_duration.count()}
        };
        if (auto current = pipeline_->current()) {
            status["pipeline"]["current"] = {
                {"user_name", current->user_name},
                {"source", core::toString(current->source)},
                {"stage", core::toString(current->stage)}
            };
        }
    }

    return {200, status};
}

void CommandServer::sendFeedback(const core::QueueItem& item, const std::string& message) {
    std::lock_guard<std::mutex> lock(feedback_mutex_);

    if (feedback_.size() >= kMaxFeedbackUsers && feedback_.find(item.user_id) == feedback_.end()) {
        auto oldest = std::min_element(feedback_.begin(), feedback_.end(),
                                       [](const auto& a, const auto& b) {
                                           return a.second.last_write < b.second.last_write;
                                       });
        std::cout << "[CommandServer] Dropped unread feedback for " << oldest->first << std::endl;
        feedback_.erase(oldest);
    }

    Mailbox& mailbox = feedback_[item.user_id];
    mailbox.messages.push_back(message);
    mailbox.last_write = ++feedback_writes_;
    while (mailbox.messages.size() > kMaxFeedbackPerUser) {
        mailbox.messages.pop_front();
    }
}

std::vector<std::string> CommandServer::takeFeedback(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(feedback_mutex_);
    auto it = feedback_.find(user_id);
    if (it == feedback_.end()) {
        return {};
    }
    std::vector<std::string> messages(it->second.messages.begin(), it->second.messages.end());
    feedback_.erase(it);
    return messages;
}

size_t CommandServer::feedbackUsers() const {
    std::lock_guard<std::mutex> lock(feedback_mutex_);
    return feedback_.size();
}

} // namespace vox::adapters
