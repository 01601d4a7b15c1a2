#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace retrohost {

// Convert one signed 16-bit sample to float in [-1, 1]
inline float s16_to_float(int16_t sample) {
    float value = static_cast<float>(sample) / 32768.0f;
    return value < -1.0f ? -1.0f : (value > 1.0f ? 1.0f : value);
}

// Convert interleaved stereo s16 frames to interleaved float
// frames is the number of stereo pairs; out is resized to frames * 2.
void convert_s16_to_float(const int16_t* samples, size_t frames, std::vector<float>& out);

} // namespace retrohost
