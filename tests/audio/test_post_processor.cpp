/**
 * test_post_processor.cpp - Peak normalization and DC removal
 */

#include "vox/audio/AudioPostProcessor.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>

using namespace vox::audio;

namespace {

float peakOf(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) peak = std::max(peak, std::fabs(s));
    return peak;
}

double meanOf(const std::vector<float>& samples) {
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<double>(samples.size());
}

} // anonymous namespace

void test_peak_and_mean() {
    AudioPostProcessor processor;
    std::vector<float> out = processor.process(std::vector<float>{0.1f, -0.4f, 0.2f}, 24000);

    assert(out.size() == 3);
    assert(std::fabs(peakOf(out) - 0.95f) < 1e-5f);
    assert(std::fabs(meanOf(out)) < 1e-6);

    std::cout << "[PASS] test_peak_and_mean" << std::endl;
}

void test_dc_offset_removed() {
    AudioPostProcessor processor;
    std::vector<float> input(480);
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = 0.3f + 0.1f * std::sin(static_cast<float>(i) * 0.2f);
    }

    std::vector<float> out = processor.process(input, 16000);
    assert(std::fabs(peakOf(out) - 0.95f) < 1e-5f);
    assert(std::fabs(meanOf(out)) < 1e-5);

    std::cout << "[PASS] test_dc_offset_removed" << std::endl;
}

void test_int16_input() {
    AudioPostProcessor processor;
    std::vector<int16_t> pcm = {1000, -8000, 4000, 0};
    std::vector<float> out = processor.process(pcm, 22050);

    assert(out.size() == pcm.size());
    assert(std::fabs(peakOf(out) - 0.95f) < 1e-5f);

    std::cout << "[PASS] test_int16_input" << std::endl;
}

void test_silence_and_empty() {
    AudioPostProcessor processor;
    assert(processor.process(std::vector<float>{}, 16000).empty());

    std::vector<float> silence(64, 0.0f);
    std::vector<float> out = processor.process(silence, 16000);
    assert(out.size() == 64);
    assert(peakOf(out) == 0.0f);

    std::cout << "[PASS] test_silence_and_empty" << std::endl;
}

void test_non_finite_rejected() {
    AudioPostProcessor processor;
    bool threw = false;
    try {
        processor.process(std::vector<float>{0.1f, std::numeric_limits<float>::quiet_NaN()}, 16000);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        processor.process(std::vector<float>{std::numeric_limits<float>::infinity()}, 16000);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_non_finite_rejected" << std::endl;
}

int main() {
    std::cout << "=== AudioPostProcessor Tests ===" << std::endl;

    test_peak_and_mean();
    test_dc_offset_removed();
    test_int16_input();
    test_silence_and_empty();
    test_non_finite_rejected();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
