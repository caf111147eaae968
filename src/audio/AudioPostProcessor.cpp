/**
 * AudioPostProcessor.cpp - Peak normalization and DC removal
 */

#include "vox/audio/AudioPostProcessor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace vox::audio {

namespace {

double peakOf(const std::vector<double>& buffer) {
    double peak = 0.0;
    for (double s : buffer) {
        peak = std::max(peak, std::abs(s));
    }
    return peak;
}

void scaleTo(std::vector<double>& buffer, double target) {
    double peak = peakOf(buffer);
    if (peak > 0.0) {
        double gain = target / peak;
        for (double& s : buffer) s *= gain;
    }
}

} // anonymous namespace

AudioPostProcessor::AudioPostProcessor(float target_peak)
    : target_peak_(target_peak) {
}

std::vector<float> AudioPostProcessor::process(const std::vector<float>& samples, int /*sample_rate*/) const {
    if (samples.empty()) return {};

    // Work in double so the mean does not drift on long buffers
    std::vector<double> buffer(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        if (!std::isfinite(samples[i])) {
            throw std::invalid_argument("non-finite sample at index " + std::to_string(i));
        }
        buffer[i] = samples[i];
    }

    scaleTo(buffer, target_peak_);

    double sum = 0.0;
    for (double s : buffer) sum += s;
    double mean = sum / static_cast<double>(buffer.size());
    for (double& s : buffer) s -= mean;

    // Removing the offset moves the peak; scaling a zero-mean buffer keeps
    // the mean at zero, so restore the target peak.
    scaleTo(buffer, target_peak_);

    std::vector<float> out(buffer.size());
    for (size_t i = 0; i < buffer.size(); ++i) {
        out[i] = static_cast<float>(buffer[i]);
    }
    return out;
}

std::vector<float> AudioPostProcessor::process(const std::vector<int16_t>& samples, int sample_rate) const {
    std::vector<float> converted(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        converted[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return process(converted, sample_rate);
}

} // namespace vox::audio
