/**
 * AudioPostProcessor.hpp - Final conditioning of synthesized speech
 *
 * Peak-normalizes to 95% of full scale and removes DC offset. Output peak
 * is exactly the target and output mean is zero, within float rounding.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace vox::audio {

class AudioPostProcessor {
public:
    explicit AudioPostProcessor(float target_peak = 0.95f);

    /// Throws std::invalid_argument if any sample is NaN or infinite.
    std::vector<float> process(const std::vector<float>& samples, int sample_rate) const;

    /// 16-bit PCM input, converted to [-1, 1) floats first.
    std::vector<float> process(const std::vector<int16_t>& samples, int sample_rate) const;


private:
    float target_peak_;
};

} // namespace vox::audio
