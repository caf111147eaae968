/**
 * VADProcessor.cpp - Voice activity detection via libfvad
 */

#include "vox/audio/VADProcessor.hpp"

#include <fvad.h>

#include <algorithm>
#include <cstdint>
#include <iostream>

namespace vox::audio {

struct VADProcessor::Impl {
    Fvad* vad = nullptr;
    VADSettings settings;
    std::string lastError;

    size_t frameSamples = 0;
    int silenceTimeoutFrames = 1;
    int minSpeechFrames = 1;
    int maxSegmentFrames = 1;

    std::vector<float> frame;
    std::vector<int16_t> frame16;

    std::vector<float> speech;
    int speechFrames = 0;   // frames classified as speech in the current run
    int silenceFrames = 0;  // trailing non-speech frames
    bool inSpeech = false;

    SegmentCallback callback;
};

VADProcessor::VADProcessor(const VADSettings& settings)
    : pImpl_(std::make_unique<Impl>())
{
    auto& impl = *pImpl_;
    impl.settings = settings;

    int frame_ms = std::max(10, settings.frame_ms);
    impl.frameSamples = static_cast<size_t>(settings.sample_rate) * frame_ms / 1000;
    impl.silenceTimeoutFrames = std::max(1, settings.silence_timeout_ms / frame_ms);
    impl.minSpeechFrames = std::max(1, settings.min_speech_ms / frame_ms);
    impl.maxSegmentFrames = std::max(1, settings.max_segment_ms / frame_ms);
    impl.frame.reserve(impl.frameSamples);
    impl.frame16.resize(impl.frameSamples);

    impl.vad = fvad_new();
    if (!impl.vad) {
        impl.lastError = "fvad_new failed";
        std::cerr << "[VADProcessor] " << impl.lastError << std::endl;
        return;
    }

    if (fvad_set_sample_rate(impl.vad, settings.sample_rate) < 0) {
        impl.lastError = "unsupported sample rate " + std::to_string(settings.sample_rate);
    } else if (fvad_set_mode(impl.vad, settings.mode) < 0) {
        impl.lastError = "invalid mode " + std::to_string(settings.mode);
    }

    if (!impl.lastError.empty()) {
        std::cerr << "[VADProcessor] " << impl.lastError << std::endl;
        fvad_free(impl.vad);
        impl.vad = nullptr;
        return;
    }

    std::cout << "[VADProcessor] Initialized (sample_rate=" << settings.sample_rate
              << "Hz, frame=" << frame_ms << "ms, mode=" << settings.mode << ")" << std::endl;
}

VADProcessor::~VADProcessor() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool VADProcessor::isReady() const {
    return pImpl_->vad != nullptr;
}

std::string VADProcessor::lastError() const {
    return pImpl_->lastError;
}

void VADProcessor::process(const float* samples, size_t count) {
    if (!pImpl_->vad) return;

    for (size_t i = 0; i < count; ++i) {
        pImpl_->frame.push_back(samples[i]);
        if (pImpl_->frame.size() >= pImpl_->frameSamples) {
            processFrame();
        }
    }
}

void VADProcessor::processFrame() {
    auto& impl = *pImpl_;

    for (size_t i = 0; i < impl.frameSamples; ++i) {
        float sample = std::clamp(impl.frame[i], -1.0f, 1.0f);
        impl.frame16[i] = static_cast<int16_t>(sample * 32767.0f);
    }

    int result = fvad_process(impl.vad, impl.frame16.data(), impl.frameSamples);
    bool isSpeech = (result == 1);

    if (isSpeech || impl.inSpeech) {
        // Short pauses inside an utterance are kept
        impl.speech.insert(impl.speech.end(), impl.frame.begin(), impl.frame.end());
    }

    if (isSpeech) {
        impl.inSpeech = true;
        impl.silenceFrames = 0;
        ++impl.speechFrames;
    } else if (impl.inSpeech) {
        ++impl.silenceFrames;
    }

    impl.frame.clear();

    if (!impl.inSpeech) return;

    int totalFrames = static_cast<int>(impl.speech.size() / impl.frameSamples);
    if (impl.silenceFrames >= impl.silenceTimeoutFrames || totalFrames >= impl.maxSegmentFrames) {
        emitSegment();
    }
}

void VADProcessor::emitSegment() {
    auto& impl = *pImpl_;

    if (impl.speechFrames >= impl.minSpeechFrames && impl.callback) {
        SpeechSegment segment;
        segment.duration_ms = static_cast<int>(impl.speech.size() * 1000 / impl.settings.sample_rate);
        segment.samples = std::move(impl.speech);
        impl.callback(std::move(segment));
    }

    impl.speech.clear();
    impl.speechFrames = 0;
    impl.silenceFrames = 0;
    impl.inSpeech = false;
}

void VADProcessor::setSegmentCallback(SegmentCallback callback) {
    pImpl_->callback = std::move(callback);
}

bool VADProcessor::isSpeaking() const {
    return pImpl_->inSpeech;
}

void VADProcessor::reset() {
    pImpl_->frame.clear();
    pImpl_->speech.clear();
    pImpl_->speechFrames = 0;
    pImpl_->silenceFrames = 0;
    pImpl_->inSpeech = false;

    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
    }
}

} // namespace vox::audio
