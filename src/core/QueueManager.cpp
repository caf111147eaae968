/**
 * QueueManager.cpp - Priority queue with admin bypass and bounded capacity
 */

#include "vox/core/QueueManager.hpp"

#include <iostream>

namespace vox::core {

namespace {

std::string preview(const std::string& text, size_t max_len = 40) {
    if (text.size() <= max_len) return text;
    return text.substr(0, max_len) + "...";
}

} // anonymous namespace

const char* toString(EnqueueResult result) {
    switch (result) {
        case EnqueueResult::Accepted: return "accepted";
        case EnqueueResult::AcceptedWithEviction: return "accepted (evicted oldest item)";
        case EnqueueResult::RejectedFull: return "queue full";
        case EnqueueResult::RejectedClosed: return "queue closed";
        case EnqueueResult::RejectedSourceDisabled: return "source disabled";
        case EnqueueResult::RejectedPaused: return "queue paused";
    }
    return "unknown";
}

QueueManager::QueueManager(const QueueConfig& config)
    : max_size_(config.max_size > 0 ? static_cast<size_t>(config.max_size) : 1)
    , admin_ids_(config.admin_ids.begin(), config.admin_ids.end())
{
    std::cout << "[QueueManager] Initialized (max_size=" << max_size_
              << ", admins=" << admin_ids_.size() << ")" << std::endl;
}

EnqueueResult QueueManager::enqueue(QueueItem item) {
    EnqueueResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stopped_) {
            result = EnqueueResult::RejectedClosed;
        } else if (paused_) {
            result = EnqueueResult::RejectedPaused;
        } else if (!sourceFlag(item.source)) {
            result = EnqueueResult::RejectedSourceDisabled;
        } else {
            item.priority = admin_ids_.count(item.user_id) ? Priority::Admin : Priority::Normal;

            result = EnqueueResult::Accepted;
            if (sizeLocked() >= max_size_) {
                // Admin items may push out the oldest normal item; nothing
                // else can make room.
                if (item.priority == Priority::Admin && !normal_items_.empty()) {
                    std::cout << "[QueueManager] Full, evicting oldest: ["
                              << toString(normal_items_.front().source) << "] "
                              << normal_items_.front().user_name << std::endl;
                    normal_items_.pop_front();
                    ++evicted_;
                    result = EnqueueResult::AcceptedWithEviction;
                } else {
                    result = EnqueueResult::RejectedFull;
                }
            }

            if (isAccepted(result)) {
                item.enqueued_at = Clock::now();
                item.sequence = next_sequence_++;
                std::cout << "[QueueManager] + [" << toString(item.source) << "] "
                          << item.user_name << " (" << toString(item.priority) << "): "
                          << preview(item.content) << " | size=" << sizeLocked() + 1 << std::endl;
                if (item.priority == Priority::Admin) {
                    admin_items_.push_back(std::move(item));
                } else {
                    normal_items_.push_back(std::move(item));
                }
            }
        }

        if (isAccepted(result)) {
            ++accepted_;
        } else {
            ++rejected_;
        }
    }

    if (isAccepted(result)) {
        cv_.notify_one();
    } else {
        std::cout << "[QueueManager] Rejected: " << toString(result) << std::endl;
    }
    return result;
}

std::optional<QueueItem> QueueManager::dequeueBlocking() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {
        return stopped_ || (!paused_ && sizeLocked() > 0);
    });

    // Once stopped, pause no longer holds items back: whatever is left drains.
    if (sizeLocked() == 0 || (paused_ && !stopped_)) {
        return std::nullopt;
    }

    std::deque<QueueItem>& source = admin_items_.empty() ? normal_items_ : admin_items_;
    QueueItem item = std::move(source.front());
    source.pop_front();
    ++dequeued_;
    return item;
}

void QueueManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    cv_.notify_all();
    std::cout << "[QueueManager] Stopped (pending=" << size() << ")" << std::endl;
}

bool QueueManager::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

void QueueManager::setSourceEnabled(Source source, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sourceFlag(source) = enabled;
    }
    std::cout << "[QueueManager] Source " << toString(source)
              << (enabled ? " enabled" : " disabled") << std::endl;
}

bool QueueManager::sourceEnabled(Source source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sourceFlag(source);
}

void QueueManager::setPaused(bool paused) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = paused;
    }
    cv_.notify_all();
    std::cout << "[QueueManager] " << (paused ? "Paused" : "Resumed") << std::endl;
}

bool QueueManager::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

size_t QueueManager::clear() {
    size_t dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = sizeLocked();
        admin_items_.clear();
        normal_items_.clear();
    }
    std::cout << "[QueueManager] Cleared " << dropped << " items" << std::endl;
    return dropped;
}

size_t QueueManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sizeLocked();
}

bool QueueManager::isAdmin(const std::string& user_id) const {
    return admin_ids_.count(user_id) > 0;
}

QueueStats QueueManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStats stats;
    stats.size = sizeLocked();
    stats.admin_size = admin_items_.size();
    stats.normal_size = normal_items_.size();
    stats.capacity = max_size_;
    stats.accepted = accepted_;
    stats.rejected = rejected_;
    stats.evicted = evicted_;
    stats.dequeued = dequeued_;
    stats.paused = paused_;
    stats.stopped = stopped_;
    return stats;
}

std::vector<QueueItem> QueueManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueItem> items;
    items.reserve(sizeLocked());
    items.insert(items.end(), admin_items_.begin(), admin_items_.end());
    items.insert(items.end(), normal_items_.begin(), normal_items_.end());
    return items;
}

bool& QueueManager::sourceFlag(Source source) {
    switch (source) {
        case Source::Voice: return voice_enabled_;
        case Source::LiveChat: return live_chat_enabled_;
        case Source::Text: break;
    }
    return text_enabled_;
}

bool QueueManager::sourceFlag(Source source) const {
    switch (source) {
        case Source::Voice: return voice_enabled_;
        case Source::LiveChat: return live_chat_enabled_;
        case Source::Text: break;
    }
    return text_enabled_;
}

} // namespace vox::core
