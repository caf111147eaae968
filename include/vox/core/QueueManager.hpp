/**
 * QueueManager.hpp - Bounded, priority-aware work queue
 *
 * The only state shared between producers (adapters) and the consumer
 * (ResponsePipeline). Items from admin users are dequeued before all others
 * and may evict the oldest normal item when the queue is full; within a
 * priority class items leave in arrival order.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/QueueItem.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace vox::core {

enum class EnqueueResult {
    Accepted,
    AcceptedWithEviction,
    RejectedFull,
    RejectedClosed,
    RejectedSourceDisabled,
    RejectedPaused
};

const char* toString(EnqueueResult result);

inline bool isAccepted(EnqueueResult result) {
    return result == EnqueueResult::Accepted || result == EnqueueResult::AcceptedWithEviction;
}

struct QueueStats {
    size_t size = 0;
    size_t admin_size = 0;
    size_t normal_size = 0;
    size_t capacity = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t evicted = 0;
    uint64_t dequeued = 0;
    bool paused = false;
    bool stopped = false;
};

class QueueManager {
public:
    explicit QueueManager(const QueueConfig& config);

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    /// Stamps priority, enqueued_at and sequence, then stores the item.
    EnqueueResult enqueue(QueueItem item);

    /// Waits for the next item. Empty result = stopped and drained.
    std::optional<QueueItem> dequeueBlocking();

    /// Idempotent. Rejects further enqueues and releases waiting consumers
    /// once the buffer is empty.
    void stop();
    bool stopped() const;

    void setSourceEnabled(Source source, bool enabled);
    bool sourceEnabled(Source source) const;

    /// While paused, enqueue is rejected and dequeue keeps waiting.
    void setPaused(bool paused);
    bool paused() const;

    /// Drops every pending item. Returns how many were dropped.
    size_t clear();

    size_t size() const;
    size_t capacity() const { return max_size_; }
    bool isAdmin(const std::string& user_id) const;

    QueueStats stats() const;

    /// Copies of the pending items in dequeue order.
    std::vector<QueueItem> snapshot() const;

private:
    const size_t max_size_;
    const std::unordered_set<std::string> admin_ids_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::deque<QueueItem> admin_items_;
    std::deque<QueueItem> normal_items_;

    bool stopped_ = false;
    bool paused_ = false;
    bool voice_enabled_ = true;
    bool text_enabled_ = true;
    bool live_chat_enabled_ = true;

    uint64_t next_sequence_ = 1;
    uint64_t accepted_ = 0;
    uint64_t rejected_ = 0;
    uint64_t evicted_ = 0;
    uint64_t dequeued_ = 0;

    bool& sourceFlag(Source source);
    bool sourceFlag(Source source) const;
    size_t sizeLocked() const { return admin_items_.size() + normal_items_.size(); }
};

} // namespace vox::core
