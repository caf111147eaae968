/**
 * AvatarBridge.hpp - HTTP client for the avatar-control service
 *
 *   GET  /health      reachability probe used by connect()
 *   POST /talking     {"talking": bool}
 *   POST /idle        {"frame": n, "talking": b}   idle-motion heartbeat, one per tick()
 *   POST /disconnect
 *
 * Calls come from the pipeline thread (setTalking), the animation loop
 * (tick) and shutdown (disconnect); one mutex serializes them.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace vox::avatar {

class AvatarBridge : public core::AvatarController {
public:
    explicit AvatarBridge(const AvatarConfig& config);
    ~AvatarBridge() override;

    AvatarBridge(const AvatarBridge&) = delete;
    AvatarBridge& operator=(const AvatarBridge&) = delete;

    bool connect() override;
    void disconnect() override;
    bool setTalking(bool talking) override;
    void tick() override;

    bool isConnected() const { return connected_.load(); }
    bool isTalking() const { return talking_.load(); }
    std::string lastError() const;

private:
    bool post(const std::string& path, const std::string& body);

    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> talking_{false};
    uint64_t frame_ = 0;
};

} // namespace vox::avatar
