#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace soda {

// RMS of 16-bit samples, normalized to [0, 1].
inline float compute_rms(const std::int16_t* samples, std::size_t n) {
    if (!samples || n == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double s = static_cast<double>(samples[i]) / 32768.0;
        acc += s * s;
    }
    const double mean = acc / static_cast<double>(n);
    return static_cast<float>(std::sqrt(mean));
}

// Maps an RMS to [0, 1] over a -60..0 dBFS window.
inline float rms_to_level(float rms) {
    const float db = (rms > 0.0f) ? 20.0f * std::log10(rms) : -100.0f;
    return std::clamp((db + 60.0f) / 60.0f, 0.0f, 1.0f);
}

// Converts float [-1.0, 1.0] to int16 [-32768, 32767], clamping.
inline std::vector<std::int16_t> to_pcm16(const float* samples, std::size_t n) {
    std::vector<std::int16_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        out.push_back(static_cast<std::int16_t>(s * 32767.0f));
    }
    return out;
}

} // namespace soda
