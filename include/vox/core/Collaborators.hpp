/**
 * Collaborators.hpp - Contracts between the orchestration core and the
 * integrations around it (LLM, TTS, audio output, avatar, chat hosts)
 *
 * Implementations are handed to the core by reference at construction time.
 * Every call reports failure through its return value; the core decides per
 * call site whether a failure aborts an item, is retried or is ignored.
 */

#pragma once

#include "vox/core/QueueItem.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace vox::core {

// ============================================================================
// Reply generation
// ============================================================================

enum class ReplyStatus {
    Ok,          // text holds the reply
    Suppressed,  // policy decided not to answer; reason says why
    Failed       // generator error; reason says why
};

struct Reply {
    ReplyStatus status = ReplyStatus::Failed;
    std::string text;
    std::string reason;

    static Reply ok(std::string text) { return {ReplyStatus::Ok, std::move(text), {}}; }
    static Reply suppressed(std::string reason) { return {ReplyStatus::Suppressed, {}, std::move(reason)}; }
    static Reply failed(std::string reason) { return {ReplyStatus::Failed, {}, std::move(reason)}; }
};

class ReplyGenerator {
public:
    virtual ~ReplyGenerator() = default;
    virtual Reply generate(const std::string& text, const std::string& user, Source source) = 0;
};

// ============================================================================
// Speech synthesis
// ============================================================================

struct Synthesis {
    bool ok = false;
    std::vector<float> samples;
    int sample_rate = 0;
    std::string error;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual Synthesis synthesize(const std::string& text) = 0;
};

// ============================================================================
// Playback
// ============================================================================

struct PlaybackResult {
    bool ok = true;
    std::string error;
};

class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    /// Blocks until the buffer has been handed to the device.
    virtual PlaybackResult play(const std::vector<float>& samples, int sample_rate) = 0;
};

// ============================================================================
// Avatar control
// ============================================================================

class AvatarController {
public:
    virtual ~AvatarController() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;

    /// Best-effort; false means the signal did not reach the avatar.
    virtual bool setTalking(bool talking) = 0;

    /// Called once per animation frame while connected.
    virtual void tick() {}
};

// ============================================================================
// Interactive adapters (chat/voice hosts)
// ============================================================================

struct LinkResult {
    bool stopped = true;  // false = connection dropped
    std::string error;

    static LinkResult stoppedByCaller() { return {true, {}}; }
    static LinkResult dropped(std::string error) { return {false, std::move(error)}; }
};

/// Called by an adapter once its link is actually up (socket bound, first
/// successful poll, model loaded).
using LinkUpCallback = std::function<void()>;

class InteractiveAdapter {
public:
    virtual ~InteractiveAdapter() = default;

    virtual std::string name() const = 0;

    /// Runs until stop() is called or the connection drops. Calls
    /// `onConnected` at most once, when the link is established.
    virtual LinkResult connectAndRun(const LinkUpCallback& onConnected) = 0;

    /// Permanent: a later connectAndRun() returns immediately.
    virtual void stop() = 0;
};

/// Channel back to the user who sent an item.
class FeedbackSink {
public:
    virtual ~FeedbackSink() = default;
    virtual void sendFeedback(const QueueItem& item, const std::string& message) = 0;
};

} // namespace vox::core
