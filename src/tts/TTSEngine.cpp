/**
 * TTSEngine.cpp - HTTP client for the speech server plus WAV decoding
 */

#include "vox/tts/TTSEngine.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vox::tts {

namespace {

template <typename T>
T readLE(const std::string& bytes, size_t offset) {
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

bool tagAt(const std::string& bytes, size_t offset, const char* tag) {
    return offset + 4 <= bytes.size() && std::memcmp(bytes.data() + offset, tag, 4) == 0;
}

} // anonymous namespace

WavAudio decodeWav(const std::string& bytes) {
    WavAudio wav;

    if (bytes.size() < 12 || !tagAt(bytes, 0, "RIFF") || !tagAt(bytes, 8, "WAVE")) {
        wav.error = "not a RIFF/WAVE buffer";
        return wav;
    }

    uint16_t audio_format = 0;
    uint16_t bits_per_sample = 0;
    bool have_fmt = false;
    size_t data_offset = 0;
    size_t data_size = 0;

    // Walk the chunk list; servers are free to add LIST/fact chunks
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = readLE<uint32_t>(bytes, pos + 4);
        size_t body = pos + 8;

        if (tagAt(bytes, pos, "fmt ") && chunk_size >= 16 && body + 16 <= bytes.size()) {
            audio_format = readLE<uint16_t>(bytes, body);
            wav.channels = readLE<uint16_t>(bytes, body + 2);
            wav.sample_rate = static_cast<int>(readLE<uint32_t>(bytes, body + 4));
            bits_per_sample = readLE<uint16_t>(bytes, body + 14);
            have_fmt = true;
        } else if (tagAt(bytes, pos, "data")) {
            data_offset = body;
            data_size = std::min<size_t>(chunk_size, bytes.size() - body);
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) {
        wav.error = "missing fmt chunk";
        return wav;
    }
    if (data_offset == 0) {
        wav.error = "missing data chunk";
        return wav;
    }
    if (wav.channels < 1 || wav.sample_rate <= 0) {
        wav.error = "invalid channel count or sample rate";
        return wav;
    }

    size_t bytes_per_sample;
    if (audio_format == 1 && bits_per_sample == 16) {
        bytes_per_sample = 2;
    } else if (audio_format == 3 && bits_per_sample == 32) {
        bytes_per_sample = 4;
    } else {
        wav.error = "unsupported WAV format " + std::to_string(audio_format) +
                    " with " + std::to_string(bits_per_sample) + " bits";
        return wav;
    }

    size_t frame_bytes = bytes_per_sample * wav.channels;
    size_t frames = data_size / frame_bytes;
    wav.samples.reserve(frames);

    for (size_t f = 0; f < frames; ++f) {
        float mixed = 0.0f;
        for (int c = 0; c < wav.channels; ++c) {
            size_t at = data_offset + f * frame_bytes + c * bytes_per_sample;
            if (bytes_per_sample == 2) {
                mixed += static_cast<float>(readLE<int16_t>(bytes, at)) / 32768.0f;
            } else {
                mixed += readLE<float>(bytes, at);
            }
        }
        wav.samples.push_back(mixed / static_cast<float>(wav.channels));
    }

    wav.ok = true;
    return wav;
}

struct TTSEngine::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string server_url;
    std::string last_error;

    explicit Impl(const TTSConfig& config) : server_url(config.url) {
        client = std::make_unique<httplib::Client>(config.url);
        client->set_connection_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
        client->set_read_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
        client->set_write_timeout(config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000);
    }

    core::Synthesis fail(const std::string& error) {
        last_error = error;
        std::cerr << "[TTSEngine] " << error << std::endl;
        core::Synthesis result;
        result.error = error;
        return result;
    }
};

TTSEngine::TTSEngine(const TTSConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    std::cout << "[TTSEngine] Using speech server at " << config.url << std::endl;
}

TTSEngine::~TTSEngine() = default;

bool TTSEngine::isReady() {
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

core::Synthesis TTSEngine::synthesize(const std::string& text) {
    if (text.empty()) {
        return impl_->fail("nothing to synthesize");
    }

    json body = {{"text", text}};
    auto res = impl_->client->Post("/synthesize", body.dump(), "application/json");

    if (!res) {
        return impl_->fail("speech server unreachable at " + impl_->server_url +
                           " (" + httplib::to_string(res.error()) + ")");
    }
    if (res->status != 200) {
        return impl_->fail("speech server returned HTTP " + std::to_string(res->status));
    }

    WavAudio wav = decodeWav(res->body);
    if (!wav.ok) {
        return impl_->fail("invalid WAV from speech server: " + wav.error);
    }
    if (wav.samples.empty()) {
        return impl_->fail("speech server returned empty audio");
    }

    core::Synthesis result;
    result.ok = true;
    result.samples = std::move(wav.samples);
    result.sample_rate = wav.sample_rate;
    return result;
}

const std::string& TTSEngine::lastError() const {
    return impl_->last_error;
}

} // namespace vox::tts
