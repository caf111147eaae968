/**
 * VADProcessor.hpp - Cuts a microphone stream into speech segments (libfvad)
 *
 * Samples are fed in arbitrary block sizes; every time a run of speech is
 * followed by `silence_timeout_ms` of silence and lasted at least
 * `min_speech_ms`, the segment callback receives the whole utterance.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vox::audio {

struct SpeechSegment {
    std::vector<float> samples;
    int duration_ms = 0;
};

using SegmentCallback = std::function<void(SpeechSegment segment)>;

struct VADSettings {
    int sample_rate = 16000;       // 8000, 16000, 32000 or 48000
    int mode = 2;                  // 0 (permissive) .. 3 (aggressive)
    int frame_ms = 30;             // 10, 20 or 30
    int silence_timeout_ms = 500;
    int min_speech_ms = 300;
    int max_segment_ms = 30000;    // force a cut on endless speech
};

class VADProcessor {
public:
    explicit VADProcessor(const VADSettings& settings = {});
    ~VADProcessor();

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    /// False if libfvad rejected the settings; see lastError().
    bool isReady() const;
    std::string lastError() const;

    void process(const float* samples, size_t count);
    void setSegmentCallback(SegmentCallback callback);

    bool isSpeaking() const;
    void reset();

private:
    void processFrame();
    void emitSegment();

    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace vox::audio
