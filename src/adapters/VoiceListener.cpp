/**
 * VoiceListener.cpp - Local microphone as an interactive adapter
 */

#include "vox/adapters/VoiceListener.hpp"

#include "vox/audio/MicrophoneCapture.hpp"
#include "vox/audio/VADProcessor.hpp"
#include "vox/stt/STTEngine.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>

namespace vox::adapters {

namespace {

constexpr int kSampleRate = 16000;
constexpr size_t kMaxPendingSegments = 8;

} // anonymous namespace

struct VoiceListener::Impl {
    std::unique_ptr<stt::STTEngine> stt;  // loaded once, kept across reconnects

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<audio::SpeechSegment> segments;
    bool stopped = false;
};

VoiceListener::VoiceListener(core::QueueManager& queue, const VoiceConfig& config)
    : impl_(std::make_unique<Impl>())
    , queue_(queue)
    , config_(config)
{
}

VoiceListener::~VoiceListener() {
    stop();
}

core::LinkResult VoiceListener::connectAndRun(const core::LinkUpCallback& onConnected) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopped) {
            return core::LinkResult::stoppedByCaller();
        }
    }

    if (!impl_->stt) {
        impl_->stt = std::make_unique<stt::STTEngine>(config_.whisper_model, config_.language, config_.threads);
    }
    if (!impl_->stt->isReady()) {
        std::string error = impl_->stt->lastError();
        impl_->stt.reset();
        return core::LinkResult::dropped(error);
    }

    audio::VADSettings settings;
    settings.sample_rate = kSampleRate;
    settings.mode = config_.vad_mode;
    settings.silence_timeout_ms = config_.silence_timeout_ms;
    settings.min_speech_ms = config_.min_speech_ms;

    audio::VADProcessor vad(settings);
    if (!vad.isReady()) {
        return core::LinkResult::dropped("VAD unavailable: " + vad.lastError());
    }

    // Runs on the audio thread: hand off and return
    vad.setSegmentCallback([this](audio::SpeechSegment segment) {
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (impl_->segments.size() >= kMaxPendingSegments) {
                impl_->segments.pop_front();
            }
            impl_->segments.push_back(std::move(segment));
        }
        impl_->cv.notify_one();
    });

    audio::CaptureConfig capture_config;
    capture_config.sample_rate = kSampleRate;
    capture_config.device = config_.device;

    audio::MicrophoneCapture mic(capture_config);
    mic.setCallback([&vad](const float* samples, size_t count) {
        vad.process(samples, count);
    });

    if (!mic.start()) {
        return core::LinkResult::dropped("microphone unavailable: " + mic.lastError());
    }

    std::cout << "[VoiceListener] Listening as " << config_.user_name << std::endl;
    onConnected();

    while (true) {
        audio::SpeechSegment segment;
        {
            std::unique_lock<std::mutex> lock(impl_->mutex);
            impl_->cv.wait(lock, [this]() {
                return impl_->stopped || !impl_->segments.empty();
            });
            if (impl_->stopped) {
                break;
            }
            segment = std::move(impl_->segments.front());
            impl_->segments.pop_front();
        }

        auto started = std::chrono::steady_clock::now();
        std::string text = impl_->stt->transcribe(segment.samples);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        std::cout << "[VoiceListener] " << segment.duration_ms << "ms of speech transcribed in "
                  << elapsed.count() << "ms" << std::endl;
        submitTranscript(text, segment.duration_ms);
    }

    mic.stop();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->segments.clear();
    }
    std::cout << "[VoiceListener] Stopped" << std::endl;
    return core::LinkResult::stoppedByCaller();
}

void VoiceListener::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopped = true;
    }
    impl_->cv.notify_all();
}

std::optional<core::EnqueueResult> VoiceListener::submitTranscript(const std::string& text, int duration_ms) {
    std::string cleaned = stt::cleanTranscript(text);
    if (cleaned.empty()) {
        std::cout << "[VoiceListener] Empty transcript dropped" << std::endl;
        return std::nullopt;
    }

    ++transcribed_;

    core::QueueItem item;
    item.content = cleaned;
    item.source = core::Source::Voice;
    item.user_id = config_.user_id;
    item.user_name = config_.user_name;
    item.metadata = {{"duration_ms", duration_ms}};

    core::EnqueueResult result = queue_.enqueue(std::move(item));
    if (!core::isAccepted(result)) {
        std::cerr << "[VoiceListener] Transcript not queued: " << core::toString(result) << std::endl;
    }
    return result;
}

} // namespace vox::adapters
