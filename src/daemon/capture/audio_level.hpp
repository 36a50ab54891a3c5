#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>

namespace audio_level {

// Root mean square of the buffer, normalized so full scale is 1.0.
inline float rms(std::span<const int16_t> samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (int16_t s : samples) {
        double v = s / 32768.0;
        sum += v * v;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

// Speech RMS sits well below full scale, so it is amplified 10x before clamping.
inline float normalize(float rms_value) {
    return std::clamp(rms_value * 10.0f, 0.0f, 1.0f);
}

// Exponential smoothing; factor is the weight of the new value.
inline float smooth(float previous, float current, float factor) {
    return std::clamp(previous * (1.0f - factor) + current * factor, 0.0f, 1.0f);
}

} // namespace audio_level
