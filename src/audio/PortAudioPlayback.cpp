/**
 * PortAudioPlayback.cpp - Blocking-write PortAudio output
 */

#include "vox/audio/PortAudioPlayback.hpp"

#include <portaudio.h>

#include <algorithm>
#include <iostream>

namespace vox::audio {

struct PortAudioPlayback::Impl {
    bool initialized = false;
    PaDeviceIndex device = paNoDevice;
    std::string lastError;

    core::PlaybackResult fail(const std::string& what, PaError err) {
        lastError = what + ": " + Pa_GetErrorText(err);
        std::cerr << "[Playback] " << lastError << std::endl;
        return {false, lastError};
    }
};

PortAudioPlayback::PortAudioPlayback(const PlaybackConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
}

PortAudioPlayback::~PortAudioPlayback() {
    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool PortAudioPlayback::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err);
        std::cerr << "[Playback] " << pImpl_->lastError << std::endl;
        return false;
    }
    pImpl_->initialized = true;

    pImpl_->device = (config_.device >= 0) ? config_.device : Pa_GetDefaultOutputDevice();
    const PaDeviceInfo* info = (pImpl_->device != paNoDevice) ? Pa_GetDeviceInfo(pImpl_->device) : nullptr;
    if (!info || info->maxOutputChannels < 1) {
        pImpl_->lastError = "No output device available";
        std::cerr << "[Playback] " << pImpl_->lastError << std::endl;
        return false;
    }

    std::cout << "[Playback] Output device: " << info->name << std::endl;
    return true;
}

core::PlaybackResult PortAudioPlayback::play(const std::vector<float>& samples, int sample_rate) {
    if (samples.empty()) {
        return {};
    }
    if (sample_rate <= 0) {
        pImpl_->lastError = "invalid sample rate " + std::to_string(sample_rate);
        return {false, pImpl_->lastError};
    }
    if (!initialize()) {
        return {false, pImpl_->lastError};
    }

    PaStreamParameters outputParams;
    outputParams.device = pImpl_->device;
    outputParams.channelCount = 1;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = Pa_GetDeviceInfo(outputParams.device)->defaultHighOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(
        &stream,
        nullptr,  // No input
        &outputParams,
        sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        nullptr,  // Blocking I/O
        nullptr
    );
    if (err != paNoError) {
        return pImpl_->fail("Pa_OpenStream failed", err);
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        return pImpl_->fail("Pa_StartStream failed", err);
    }

    size_t chunk = static_cast<size_t>(config_.frames_per_buffer);
    for (size_t offset = 0; offset < samples.size(); offset += chunk) {
        unsigned long frames = static_cast<unsigned long>(std::min(chunk, samples.size() - offset));
        err = Pa_WriteStream(stream, samples.data() + offset, frames);
        // An underflow only means a short gap on the device
        if (err != paNoError && err != paOutputUnderflowed) {
            Pa_AbortStream(stream);
            Pa_CloseStream(stream);
            return pImpl_->fail("Pa_WriteStream failed", err);
        }
    }

    // Pa_StopStream returns once every queued buffer has been played
    err = Pa_StopStream(stream);
    Pa_CloseStream(stream);
    if (err != paNoError) {
        return pImpl_->fail("Pa_StopStream failed", err);
    }

    return {};
}

std::string PortAudioPlayback::lastError() const {
    return pImpl_->lastError;
}

std::vector<std::string> PortAudioPlayback::listOutputDevices() {
    std::vector<std::string> devices;

    if (Pa_Initialize() != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxOutputChannels > 0) {
            devices.push_back(std::to_string(i) + ": " + info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

} // namespace vox::audio
