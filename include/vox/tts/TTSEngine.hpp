/**
 * TTSEngine.hpp - Speech synthesis through a persistent TTS HTTP server
 *
 * The server keeps its model loaded and answers POST /synthesize with a
 * WAV body. 16-bit PCM and 32-bit float WAVs are accepted; multi-channel
 * audio is mixed down to mono.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"

#include <memory>
#include <string>
#include <vector>

namespace vox::tts {

struct WavAudio {
    bool ok = false;
    std::vector<float> samples;  // mono, [-1, 1]
    int sample_rate = 0;
    int channels = 0;
    std::string error;
};

/// Parses a RIFF/WAVE byte buffer. Never throws.
WavAudio decodeWav(const std::string& bytes);

class TTSEngine : public core::SpeechSynthesizer {
public:
    explicit TTSEngine(const TTSConfig& config);
    ~TTSEngine() override;

    TTSEngine(const TTSEngine&) = delete;
    TTSEngine& operator=(const TTSEngine&) = delete;

    /// GET /health on the server.
    bool isReady();

    core::Synthesis synthesize(const std::string& text) override;

    const std::string& lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vox::tts
