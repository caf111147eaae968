/**
 * STTEngine.hpp - Offline speech recognition with whisper.cpp
 *
 * The model is loaded once and stays resident. transcribe() is not
 * reentrant; the voice listener calls it from a single thread.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace vox::stt {

class STTEngine {
public:
    STTEngine(const std::string& model_path, const std::string& language, int n_threads);
    ~STTEngine();

    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    bool isReady() const;
    std::string lastError() const;

    /// 16kHz mono float samples. Returns the trimmed transcript, or an empty
    /// string when nothing intelligible was said or decoding failed.
    std::string transcribe(const std::vector<float>& audio);

    std::string modelInfo() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Strips whitespace and whisper's non-speech markers such as
/// "[BLANK_AUDIO]" or "(music)".
std::string cleanTranscript(const std::string& raw);

} // namespace vox::stt
