/**
 * PortAudioPlayback.hpp - Blocking speaker output through PortAudio
 *
 * Each play() opens a mono float32 stream at the buffer's own sample rate,
 * writes the whole buffer and waits for it to drain before returning.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vox::audio {

class PortAudioPlayback : public core::PlaybackSink {
public:
    explicit PortAudioPlayback(const PlaybackConfig& config);
    ~PortAudioPlayback() override;

    PortAudioPlayback(const PortAudioPlayback&) = delete;
    PortAudioPlayback& operator=(const PortAudioPlayback&) = delete;

    /// Initializes PortAudio and resolves the output device.
    bool initialize();

    core::PlaybackResult play(const std::vector<float>& samples, int sample_rate) override;

    std::string lastError() const;

    static std::vector<std::string> listOutputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    PlaybackConfig config_;
};

} // namespace vox::audio
