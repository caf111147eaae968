/**
 * AvatarBridge.cpp
 */

#include "vox/avatar/AvatarBridge.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vox::avatar {

struct AvatarBridge::Impl {
    std::mutex mutex;  // guards client and lastError
    std::unique_ptr<httplib::Client> client;
    std::string url;
    std::string lastError;

    explicit Impl(const AvatarConfig& config) : url(config.url) {
        client = std::make_unique<httplib::Client>(config.url);
        client->set_connection_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
        client->set_read_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
        client->set_write_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
        client->set_keep_alive(true);
    }
};

AvatarBridge::AvatarBridge(const AvatarConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

AvatarBridge::~AvatarBridge() = default;

bool AvatarBridge::connect() {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto res = impl_->client->Get("/health");
    if (!res || res->status != 200) {
        impl_->lastError = res ? "health check returned HTTP " + std::to_string(res->status)
                               : "unreachable (" + httplib::to_string(res.error()) + ")";
        std::cerr << "[Avatar] Connect to " << impl_->url << " failed: " << impl_->lastError << std::endl;
        return false;
    }

    connected_ = true;
    frame_ = 0;
    std::cout << "[Avatar] Connected to " << impl_->url << std::endl;
    return true;
}

void AvatarBridge::disconnect() {
    if (!connected_.exchange(false)) {
        return;
    }

    post("/disconnect", "{}");
    talking_ = false;
    std::cout << "[Avatar] Disconnected" << std::endl;
}

bool AvatarBridge::setTalking(bool talking) {
    if (!connected_) {
        return false;
    }

    json body = {{"talking", talking}};
    if (!post("/talking", body.dump())) {
        return false;
    }
    talking_ = talking;
    return true;
}

void AvatarBridge::tick() {
    if (!connected_) {
        return;
    }

    json body = {{"frame", frame_++}, {"talking", talking_.load()}};
    post("/idle", body.dump());
}

std::string AvatarBridge::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->lastError;
}

bool AvatarBridge::post(const std::string& path, const std::string& body) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto res = impl_->client->Post(path, body, "application/json");
    if (!res) {
        impl_->lastError = path + ": " + httplib::to_string(res.error());
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        impl_->lastError = path + ": HTTP " + std::to_string(res->status);
        return false;
    }
    return true;
}

} // namespace vox::avatar
