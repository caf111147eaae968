/**
 * AdminCommands.hpp - "!command" handling for admin users
 *
 * Commands:
 *   !status              queue, pipeline and connection summary
 *   !queue [clear]       list pending items, or drop them all
 *   !clear               same as "!queue clear"
 *   !pause / !resume     stop or restart taking new items
 *   !chat_on / !chat_off   accept or ignore live-chat items
 *   !voice_on / !voice_off accept or ignore microphone items
 *   !help
 */

#pragma once

#include "vox/core/ConnectionSupervisor.hpp"
#include "vox/core/QueueManager.hpp"
#include "vox/core/ResponsePipeline.hpp"

#include <functional>
#include <string>
#include <vector>

namespace vox {

struct CommandResult {
    bool ok = false;
    std::string message;
};

class AdminCommands {
public:
    using ConnectionProvider = std::function<std::vector<core::ConnectionState>()>;

    AdminCommands(core::QueueManager& queue, const core::ResponsePipeline* pipeline = nullptr);

    void setPipeline(const core::ResponsePipeline* pipeline) { pipeline_ = pipeline; }
    void setConnectionProvider(ConnectionProvider provider);

    static bool isCommand(const std::string& content);

    /// Non-admins get a permission error without the command being looked at.
    CommandResult execute(const std::string& user_id, const std::string& content);

private:
    std::string status() const;
    std::string listQueue() const;

    core::QueueManager& queue_;
    const core::ResponsePipeline* pipeline_;
    ConnectionProvider connections_;
};

} // namespace vox
