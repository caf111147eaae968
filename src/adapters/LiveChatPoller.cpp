/**
 * LiveChatPoller.cpp - HTTP polling client for the live-chat relay
 */

#include "vox/adapters/LiveChatPoller.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vox::adapters {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string asString(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return "";
}

} // anonymous namespace

ChatBatch parseChatBatch(const std::string& body) {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ChatProtocolError(std::string("invalid chat JSON: ") + e.what());
    }

    if (!payload.is_object() || !payload.contains("items") || !payload["items"].is_array()) {
        throw ChatProtocolError("chat payload has no \"items\" array");
    }

    ChatBatch batch;
    if (payload.contains("cursor")) {
        batch.cursor = asString(payload["cursor"]);
    }

    for (const auto& entry : payload["items"]) {
        if (!entry.is_object()) continue;

        ChatMessage msg;
        msg.id = entry.contains("id") ? asString(entry["id"]) : "";
        msg.author_id = entry.contains("author_id") ? asString(entry["author_id"]) : "";
        msg.author = entry.contains("author") ? asString(entry["author"]) : "";
        msg.message = entry.contains("message") ? asString(entry["message"]) : "";

        if (msg.message.empty()) continue;
        if (msg.author.empty()) msg.author = msg.author_id.empty() ? "viewer" : msg.author_id;
        if (msg.author_id.empty()) msg.author_id = msg.author;

        batch.items.push_back(std::move(msg));
    }
    return batch;
}

bool looksLikeQuestion(const std::string& text, const std::vector<std::string>& markers) {
    if (text.find('?') != std::string::npos) return true;
    if (text.find("\xEF\xBC\x9F") != std::string::npos) return true;  // U+FF1F

    std::string haystack = lower(text);
    for (const auto& marker : markers) {
        if (!marker.empty() && haystack.find(lower(marker)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

LiveChatPoller::LiveChatPoller(core::QueueManager& queue, const LiveChatConfig& config)
    : queue_(queue)
    , config_(config)
{
}

LiveChatPoller::~LiveChatPoller() {
    stop();
}

core::LinkResult LiveChatPoller::connectAndRun(const core::LinkUpCallback& onConnected) {
    if (stopped_) {
        return core::LinkResult::stoppedByCaller();
    }

    httplib::Client client(config_.url);
    client.set_connection_timeout(config_.timeout_ms / 1000, (config_.timeout_ms % 1000) * 1000);
    client.set_read_timeout(config_.timeout_ms / 1000, (config_.timeout_ms % 1000) * 1000);

    std::cout << "[LiveChat] Polling " << config_.url << config_.path
              << " every " << config_.poll_ms << "ms" << std::endl;

    bool up = false;
    while (!stopped_) {
        httplib::Params params;
        if (!cursor_.empty()) {
            params.emplace("since", cursor_);
        }

        auto res = client.Get(config_.path, params, httplib::Headers{});
        if (!res) {
            throw std::runtime_error("chat relay unreachable: " + httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            throw std::runtime_error("chat relay returned HTTP " + std::to_string(res->status));
        }

        ChatBatch batch = parseChatBatch(res->body);
        if (!up) {
            up = true;
            onConnected();
        }
        ingest(batch);

        if (!waitPollInterval()) {
            break;
        }
    }

    std::cout << "[LiveChat] Stopped (forwarded=" << forwarded_ << ", ignored=" << ignored_ << ")" << std::endl;
    return core::LinkResult::stoppedByCaller();
}

size_t LiveChatPoller::ingest(const ChatBatch& batch) {
    size_t queued = 0;

    for (const auto& msg : batch.items) {
        if (!looksLikeQuestion(msg.message, config_.question_markers)) {
            ++ignored_;
            continue;
        }

        core::QueueItem item;
        item.content = msg.message;
        item.source = core::Source::LiveChat;
        item.user_id = msg.author_id;
        item.user_name = msg.author;
        item.metadata = {{"message_id", msg.id}};

        core::EnqueueResult result = queue_.enqueue(std::move(item));
        if (core::isAccepted(result)) {
            ++queued;
            ++forwarded_;
        } else {
            ++ignored_;
            std::cout << "[LiveChat] Dropped question from " << msg.author
                      << ": " << core::toString(result) << std::endl;
        }
    }

    if (!batch.cursor.empty()) {
        cursor_ = batch.cursor;
    }
    return queued;
}

void LiveChatPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stopped_ = true;
    }
    wait_cv_.notify_all();
}

bool LiveChatPoller::waitPollInterval() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, std::chrono::milliseconds(config_.poll_ms),
                              [this]() { return stopped_.load(); });
}

} // namespace vox::adapters
