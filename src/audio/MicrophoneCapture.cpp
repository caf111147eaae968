/**
 * MicrophoneCapture.cpp - PortAudio capture wrapper
 */

#include "vox/audio/MicrophoneCapture.hpp"

#include <portaudio.h>

#include <atomic>
#include <iostream>
#include <mutex>

namespace vox::audio {

namespace {

// Shared with the PortAudio callback, which cannot name the private Impl
struct CaptureState {
    PaStream* stream = nullptr;
    std::atomic<bool> running{false};
    bool initialized = false;

    std::mutex callbackMutex;
    CaptureCallback callback;
    std::string lastError;
};

int inputCallback(
    const void* input,
    void* /*output*/,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* /*timeInfo*/,
    PaStreamCallbackFlags /*statusFlags*/,
    void* userData
) {
    auto* impl = static_cast<CaptureState*>(userData);
    const float* samples = static_cast<const float*>(input);

    std::lock_guard<std::mutex> lock(impl->callbackMutex);
    if (impl->callback && samples) {
        impl->callback(samples, frameCount);
    }

    return paContinue;
}

} // anonymous namespace

struct MicrophoneCapture::Impl : public CaptureState {};

MicrophoneCapture::MicrophoneCapture(const CaptureConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
}

MicrophoneCapture::~MicrophoneCapture() {
    stop();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool MicrophoneCapture::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err);
        std::cerr << "[Microphone] " << pImpl_->lastError << std::endl;
        return false;
    }

    pImpl_->initialized = true;
    return true;
}

bool MicrophoneCapture::start() {
    if (pImpl_->running) {
        return true;
    }
    if (!initialize()) {
        return false;
    }

    PaStreamParameters inputParams;
    inputParams.device = (config_.device >= 0) ? config_.device : Pa_GetDefaultInputDevice();

    if (inputParams.device == paNoDevice || !Pa_GetDeviceInfo(inputParams.device)) {
        pImpl_->lastError = "No input device available";
        std::cerr << "[Microphone] " << pImpl_->lastError << std::endl;
        return false;
    }

    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = Pa_GetDeviceInfo(inputParams.device)->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(
        &pImpl_->stream,
        &inputParams,
        nullptr,  // No output
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        inputCallback,
        static_cast<CaptureState*>(pImpl_.get())
    );
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err);
        std::cerr << "[Microphone] " << pImpl_->lastError << std::endl;
        pImpl_->stream = nullptr;
        return false;
    }

    err = Pa_StartStream(pImpl_->stream);
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err);
        std::cerr << "[Microphone] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->stream);
        pImpl_->stream = nullptr;
        return false;
    }

    pImpl_->running = true;
    std::cout << "[Microphone] Capturing from '" << Pa_GetDeviceInfo(inputParams.device)->name
              << "' (" << config_.sample_rate << "Hz, " << config_.frames_per_buffer
              << " frames)" << std::endl;
    return true;
}

void MicrophoneCapture::stop() {
    if (!pImpl_->running.exchange(false)) {
        return;
    }

    if (pImpl_->stream) {
        Pa_StopStream(pImpl_->stream);
        Pa_CloseStream(pImpl_->stream);
        pImpl_->stream = nullptr;
    }

    std::cout << "[Microphone] Stopped" << std::endl;
}

bool MicrophoneCapture::isRunning() const {
    return pImpl_->running;
}

void MicrophoneCapture::setCallback(CaptureCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->callback = std::move(callback);
}

std::string MicrophoneCapture::lastError() const {
    return pImpl_->lastError;
}

std::vector<std::string> MicrophoneCapture::listInputDevices() {
    std::vector<std::string> devices;

    if (Pa_Initialize() != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(std::to_string(i) + ": " + info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

} // namespace vox::audio
