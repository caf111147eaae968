/**
 * FakeCollaborators.hpp - Scriptable in-memory collaborators for core tests
 */

#pragma once

#include "vox/core/Collaborators.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vox::testing {

/// Replies "re: <text>"; suppresses text containing `suppress_containing`.
class FakeGenerator : public core::ReplyGenerator {
public:
    core::Reply generate(const std::string& text, const std::string& /*user*/, core::Source /*source*/) override {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(text);
        if (throw_next) {
            throw_next = false;
            throw std::runtime_error("generator exploded");
        }
        if (!suppress_containing.empty() && text.find(suppress_containing) != std::string::npos) {
            return core::Reply::suppressed("blocked topic");
        }
        return core::Reply::ok("re: " + text);
    }

    std::mutex mutex;
    std::vector<std::string> seen;
    std::string suppress_containing;
    bool throw_next = false;
};

/// Returns a short fixed buffer; fails for text containing any of `fail_on`.
class FakeSynthesizer : public core::SpeechSynthesizer {
public:
    core::Synthesis synthesize(const std::string& text) override {
        calls++;
        core::Synthesis out;
        for (const auto& f : fail_on) {
            if (text.find(f) != std::string::npos) {
                out.error = "voice model offline";
                return out;
            }
        }
        out.ok = true;
        out.sample_rate = 16000;
        out.samples = {0.1f, -0.4f, 0.2f, 0.05f, -0.1f};
        if (nan_output) {
            out.samples[1] = std::numeric_limits<float>::quiet_NaN();
        }
        return out;
    }

    std::atomic<int> calls{0};
    std::vector<std::string> fail_on;
    bool nan_output = false;
};

/// Records every buffer. When `hold` is set, play() blocks until release().
/// `fail` reports a device error and `throw_on_play` throws instead.
class FakePlayback : public core::PlaybackSink {
public:
    core::PlaybackResult play(const std::vector<float>& samples, int sample_rate) override {
        std::unique_lock<std::mutex> lock(mutex);
        buffers.push_back(samples);
        last_rate = sample_rate;
        if (throw_on_play) {
            throw std::runtime_error("output stream vanished");
        }
        if (fail) {
            return {false, "device unplugged"};
        }
        playing = true;
        cv.notify_all();
        cv.wait(lock, [this]() { return !hold; });
        playing = false;
        ++finished;
        cv.notify_all();
        return {};
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            hold = false;
        }
        cv.notify_all();
    }

    bool waitUntilPlaying(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this]() { return playing; });
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return buffers.size();
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::vector<float>> buffers;
    int last_rate = 0;
    bool hold = false;
    bool fail = false;
    bool throw_on_play = false;
    bool playing = false;
    int finished = 0;
};

class FakeAvatar : public core::AvatarController {
public:
    bool connect() override {
        connects++;
        return reachable;
    }
    void disconnect() override { disconnects++; }
    bool setTalking(bool talking) override {
        std::lock_guard<std::mutex> lock(mutex);
        talking_calls.push_back(talking);
        return !reject_talking;
    }
    void tick() override { ticks++; }

    std::vector<bool> talkingCalls() {
        std::lock_guard<std::mutex> lock(mutex);
        return talking_calls;
    }

    bool reachable = true;
    bool reject_talking = false;
    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    std::atomic<int> ticks{0};
    std::mutex mutex;
    std::vector<bool> talking_calls;
};

/// connectAndRun() either throws, drops, or serves until stop().
/// With `hold_connect` set, Serve waits for allowConnect() (or stop) before
/// reporting the link as up.
class FakeAdapter : public core::InteractiveAdapter {
public:
    enum class Mode { Throw, Drop, Serve };

    explicit FakeAdapter(std::string name, Mode mode = Mode::Serve)
        : name_(std::move(name)), mode_(mode) {}

    std::string name() const override { return name_; }

    core::LinkResult connectAndRun(const core::LinkUpCallback& onConnected) override {
        attempts++;
        if (mode_ == Mode::Throw) {
            throw std::runtime_error("host unreachable");
        }
        if (mode_ == Mode::Drop) {
            return core::LinkResult::dropped("socket closed");
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !hold_connect || stopped_; });
        if (stopped_) {
            return core::LinkResult::stoppedByCaller();
        }
        onConnected();
        cv_.wait(lock, [this]() { return stopped_; });
        return core::LinkResult::stoppedByCaller();
    }

    void allowConnect() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hold_connect = false;
        }
        cv_.notify_all();
    }

    void stop() override {
        stops++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    std::atomic<int> attempts{0};
    std::atomic<int> stops{0};
    bool hold_connect = false;  // set before run starts

private:
    std::string name_;
    Mode mode_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

class FakeFeedback : public core::FeedbackSink {
public:
    void sendFeedback(const core::QueueItem& item, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(item.user_id + ": " + message);
    }

    std::mutex mutex;
    std::vector<std::string> messages;
};

inline core::QueueItem makeItem(const std::string& user_id,
                                const std::string& content,
                                core::Source source = core::Source::Text) {
    core::QueueItem item;
    item.user_id = user_id;
    item.user_name = user_id;
    item.content = content;
    item.source = source;
    return item;
}

} // namespace vox::testing
