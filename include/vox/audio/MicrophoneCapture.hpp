/**
 * MicrophoneCapture.hpp - PortAudio input stream delivering mono float frames
 *
 * The callback runs on PortAudio's audio thread and must not block.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vox::audio {

using CaptureCallback = std::function<void(const float* samples, size_t count)>;

struct CaptureConfig {
    int sample_rate = 16000;       // what whisper and libfvad expect
    int frames_per_buffer = 480;   // 30ms at 16kHz
    int device = -1;               // -1 = default input
};

class MicrophoneCapture {
public:
    explicit MicrophoneCapture(const CaptureConfig& config = {});
    ~MicrophoneCapture();

    MicrophoneCapture(const MicrophoneCapture&) = delete;
    MicrophoneCapture& operator=(const MicrophoneCapture&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    void setCallback(CaptureCallback callback);

    std::string lastError() const;

    static std::vector<std::string> listInputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    CaptureConfig config_;
};

} // namespace vox::audio
