/**
 * VoiceListener.hpp - Microphone -> VAD -> whisper -> queue
 *
 * The capture callback only feeds the VAD; finished utterances are handed
 * to the listener thread (the one inside connectAndRun) for transcription,
 * so whisper never runs on the audio thread. Empty transcripts are dropped.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"
#include "vox/core/QueueManager.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace vox::adapters {

class VoiceListener : public core::InteractiveAdapter {
public:
    VoiceListener(core::QueueManager& queue, const VoiceConfig& config);
    ~VoiceListener() override;

    std::string name() const override { return "voice"; }
    core::LinkResult connectAndRun(const core::LinkUpCallback& onConnected) override;
    void stop() override;

    /// Queues one transcript as a voice item. Blank text is dropped and
    /// yields no result.
    std::optional<core::EnqueueResult> submitTranscript(const std::string& text, int duration_ms);

    uint64_t transcribed() const { return transcribed_.load(); }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    core::QueueManager& queue_;
    VoiceConfig config_;
    std::atomic<uint64_t> transcribed_{0};
};

} // namespace vox::adapters
