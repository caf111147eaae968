/**
 * AdminCommands.cpp
 */

#include "vox/AdminCommands.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace vox {

namespace {

constexpr size_t kQueueListLimit = 10;

const char* HELP_TEXT =
    "Commands: !status, !queue [clear], !clear, !pause, !resume, "
    "!chat_on, !chat_off, !voice_on, !voice_off";

std::vector<std::string> tokenize(const std::string& content) {
    std::vector<std::string> words;
    std::istringstream in(content);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

AdminCommands::AdminCommands(core::QueueManager& queue, const core::ResponsePipeline* pipeline)
    : queue_(queue)
    , pipeline_(pipeline)
{
}

void AdminCommands::setConnectionProvider(ConnectionProvider provider) {
    connections_ = std::move(provider);
}

bool AdminCommands::isCommand(const std::string& content) {
    return content.size() > 1 && content[0] == '!';
}

CommandResult AdminCommands::execute(const std::string& user_id, const std::string& content) {
    if (!queue_.isAdmin(user_id)) {
        std::cout << "[AdminCommands] Refused command from non-admin " << user_id << std::endl;
        return {false, "Only admins can use commands"};
    }

    std::vector<std::string> args = tokenize(content);
    if (args.empty() || !isCommand(args[0])) {
        return {false, "Not a command"};
    }

    std::string command = lower(args[0].substr(1));
    std::cout << "[AdminCommands] " << user_id << " -> !" << command << std::endl;

    if (command == "help") {
        return {true, HELP_TEXT};
    }
    if (command == "status") {
        return {true, status()};
    }
    if (command == "queue") {
        if (args.size() > 1 && lower(args[1]) == "clear") {
            return {true, "Cleared " + std::to_string(queue_.clear()) + " pending items"};
        }
        return {true, listQueue()};
    }
    if (command == "clear") {
        return {true, "Cleared " + std::to_string(queue_.clear()) + " pending items"};
    }
    if (command == "pause") {
        queue_.setPaused(true);
        return {true, "Queue paused"};
    }
    if (command == "resume") {
        queue_.setPaused(false);
        return {true, "Queue resumed"};
    }
    if (command == "chat_on" || command == "chat_off") {
        bool on = command == "chat_on";
        queue_.setSourceEnabled(core::Source::LiveChat, on);
        return {true, std::string("Live chat ") + (on ? "enabled" : "disabled")};
    }
    if (command == "voice_on" || command == "voice_off") {
        bool on = command == "voice_on";
        queue_.setSourceEnabled(core::Source::Voice, on);
        return {true, std::string("Voice input ") + (on ? "enabled" : "disabled")};
    }

    return {false, "Unknown command: !" + command + " (try !help)"};
}

std::string AdminCommands::status() const {
    core::QueueStats q = queue_.stats();
    std::ostringstream out;

    out << "Queue: " << q.size << "/" << q.capacity << " pending ("
        << q.admin_size << " admin, " << q.normal_size << " normal)"
        << (q.paused ? ", paused" : "") << (q.stopped ? ", stopped" : "") << "\n";
    out << "Sources: voice=" << (queue_.sourceEnabled(core::Source::Voice) ? "on" : "off")
        << " text=" << (queue_.sourceEnabled(core::Source::Text) ? "on" : "off")
        << " live_chat=" << (queue_.sourceEnabled(core::Source::LiveChat) ? "on" : "off") << "\n";
    out << "Totals: accepted=" << q.accepted << " rejected=" << q.rejected
        << " evicted=" << q.evicted;

    if (pipeline_) {
        core::PipelineStats p = pipeline_->stats();
        out << "\nPipeline: processed=" << p.processed << " suppressed=" << p.suppressed
            << " aborted=" << p.aborted << " stale=" << p.stale_skipped
            << " last=" << p.last_duration.count() << "ms";
        if (auto current = pipeline_->current()) {
            out << "\nNow: " << core::toString(current->stage) << " for "
                << current->user_name << " [" << core::toString(current->source) << "]";
        }
    }

    if (connections_) {
        for (const auto& c : connections_()) {
            out << "\nLink " << c.adapter << ": " << core::toString(c.state);
            if (c.retry_count > 0) {
                out << " (retries=" << c.retry_count << ", last error: " << c.last_error << ")";
            }
        }
    }

    return out.str();
}

std::string AdminCommands::listQueue() const {
    std::vector<core::QueueItem> items = queue_.snapshot();
    if (items.empty()) {
        return "Queue is empty";
    }

    std::ostringstream out;
    out << items.size() << " pending:";
    size_t shown = std::min(items.size(), kQueueListLimit);
    for (size_t i = 0; i < shown; ++i) {
        const auto& item = items[i];
        std::string text = item.content.size() > 40 ? item.content.substr(0, 40) + "..." : item.content;
        out << "\n" << (i + 1) << ". [" << core::toString(item.source) << "/"
            << core::toString(item.priority) << "] " << item.user_name << ": " << text;
    }
    if (items.size() > shown) {
        out << "\n... and " << (items.size() - shown) << " more";
    }
    return out.str();
}

} // namespace vox
