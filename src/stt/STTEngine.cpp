/**
 * STTEngine.cpp - whisper.cpp wrapper
 */

#include "vox/stt/STTEngine.hpp"

#include <cctype>
#include <iostream>

#include "whisper.h"

namespace vox::stt {

namespace {

/// Removes every "[...]" and "(...)" span.
std::string stripMarkers(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    char closing = 0;
    for (char c : text) {
        if (closing) {
            if (c == closing) closing = 0;
            continue;
        }
        if (c == '[') { closing = ']'; continue; }
        if (c == '(') { closing = ')'; continue; }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string cleanTranscript(const std::string& raw) {
    std::string text = stripMarkers(raw);

    // Collapse runs of whitespace and trim both ends
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

struct STTEngine::Impl {
    std::string model_path;
    std::string language;
    std::string lastError;

    whisper_context* ctx = nullptr;
    whisper_full_params params;

    Impl(const std::string& path, const std::string& lang, int threads)
        : model_path(path), language(lang) {

        whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);

        if (!ctx) {
            lastError = "failed to load whisper model: " + model_path;
            std::cerr << "[STTEngine] " << lastError << std::endl;
            return;
        }

        // Greedy decoding keeps latency low for short utterances
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = language.c_str();
        params.n_threads = threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.no_context = true;
        params.suppress_blank = true;

        std::cout << "[STTEngine] Model loaded: " << model_path
                  << " (language=" << language << ", threads=" << threads << ")" << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
        }
    }
};

STTEngine::STTEngine(const std::string& model_path, const std::string& language, int n_threads)
    : impl_(std::make_unique<Impl>(model_path, language, n_threads)) {
}

STTEngine::~STTEngine() = default;

bool STTEngine::isReady() const {
    return impl_->ctx != nullptr;
}

std::string STTEngine::lastError() const {
    return impl_->lastError;
}

std::string STTEngine::transcribe(const std::vector<float>& audio) {
    if (!impl_->ctx || audio.empty()) {
        return "";
    }

    int result = whisper_full(impl_->ctx, impl_->params, audio.data(), static_cast<int>(audio.size()));
    if (result != 0) {
        impl_->lastError = "whisper_full failed with code " + std::to_string(result);
        std::cerr << "[STTEngine] " << impl_->lastError << std::endl;
        return "";
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(impl_->ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    return cleanTranscript(text);
}

std::string STTEngine::modelInfo() const {
    if (!isReady()) {
        return "model not loaded";
    }
    return "whisper (" + impl_->model_path + ", " + impl_->language + ")";
}

} // namespace vox::stt
