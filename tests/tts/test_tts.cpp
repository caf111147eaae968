/**
 * test_tts.cpp - WAV decoding and TTS server integration
 */

#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "vox/tts/TTSEngine.hpp"

using namespace vox;
using namespace vox::tts;

namespace {

void put16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

/// Builds a WAV file in memory, optionally with a LIST chunk before "data".
std::string makeWav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                    const std::string& data, bool with_list = false) {
    std::string body = "WAVE";
    body += "fmt ";
    put32(body, 16);
    put16(body, format);
    put16(body, channels);
    put32(body, rate);
    put32(body, rate * channels * bits / 8);
    put16(body, static_cast<uint16_t>(channels * bits / 8));
    put16(body, bits);
    if (with_list) {
        body += "LIST";
        put32(body, 3);
        body += "abc";
        body.push_back('\0');  // pad byte
    }
    body += "data";
    put32(body, static_cast<uint32_t>(data.size()));
    body += data;

    std::string wav = "RIFF";
    put32(wav, static_cast<uint32_t>(body.size()));
    return wav + body;
}

} // anonymous namespace

void test_decode_pcm16_stereo() {
    std::string data;
    put16(data, 16384);                          // L = 0.5
    put16(data, 0);                              // R = 0
    put16(data, static_cast<uint16_t>(-16384));  // L = -0.5
    put16(data, static_cast<uint16_t>(-16384));  // R = -0.5

    WavAudio wav = decodeWav(makeWav(1, 2, 24000, 16, data, true));
    assert(wav.ok);
    assert(wav.sample_rate == 24000);
    assert(wav.channels == 2);
    assert(wav.samples.size() == 2);
    assert(std::fabs(wav.samples[0] - 0.25f) < 1e-6f);
    assert(std::fabs(wav.samples[1] + 0.5f) < 1e-6f);

    std::cout << "[PASS] test_decode_pcm16_stereo" << std::endl;
}

void test_decode_float32() {
    std::string data;
    for (float f : {0.1f, -0.2f, 0.3f}) {
        char raw[4];
        std::memcpy(raw, &f, 4);
        data.append(raw, 4);
    }

    WavAudio wav = decodeWav(makeWav(3, 1, 16000, 32, data));
    assert(wav.ok);
    assert(wav.samples.size() == 3);
    assert(wav.samples[1] == -0.2f);

    std::cout << "[PASS] test_decode_float32" << std::endl;
}

void test_decode_errors() {
    assert(decodeWav("").error == "not a RIFF/WAVE buffer");
    assert(decodeWav("RIFF\0\0\0\0AVI LIST").error == "not a RIFF/WAVE buffer");

    std::string no_data = makeWav(1, 1, 16000, 16, "");
    no_data.resize(no_data.size() - 8);  // drop the data header
    assert(decodeWav(no_data).error == "missing data chunk");

    std::string only_riff = "RIFF";
    put32(only_riff, 4);
    only_riff += "WAVE";
    assert(decodeWav(only_riff).error == "missing fmt chunk");

    WavAudio mulaw = decodeWav(makeWav(7, 1, 8000, 8, "\x01\x02"));
    assert(!mulaw.ok);
    assert(mulaw.error.find("unsupported WAV format") == 0);

    std::cout << "[PASS] test_decode_errors" << std::endl;
}

void test_tts_server() {
    std::cout << "\n--- Test: TTS server ---" << std::endl;

    TTSConfig config;
    TTSEngine engine(config);

    if (!engine.isReady()) {
        std::cout << "[SKIP] TTS server not available at " << config.url << std::endl;
        std::cout << "  Run: docker-compose up -d" << std::endl;
        return;
    }

    std::string text = "Hello, I am Vox, your stream co-host.";
    std::cout << "Synthesizing: \"" << text << "\"" << std::endl;
    core::Synthesis speech = engine.synthesize(text);

    if (speech.ok && !speech.samples.empty()) {
        float duration = static_cast<float>(speech.samples.size()) / static_cast<float>(speech.sample_rate);
        std::cout << "  " << speech.samples.size() << " samples @ " << speech.sample_rate
                  << "Hz (" << duration << "s)" << std::endl;
        std::cout << "[PASS] Synthesis works" << std::endl;
    } else {
        std::cout << "[FAIL] " << speech.error << std::endl;
    }
}

int main() {
    std::cout << "=== TTS Tests ===" << std::endl;

    test_decode_pcm16_stereo();
    test_decode_float32();
    test_decode_errors();
    test_tts_server();

    std::cout << "\nTests complete!" << std::endl;
    return 0;
}
