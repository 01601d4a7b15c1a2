#include "sample_convert.hpp"

namespace retrohost {

void convert_s16_to_float(const int16_t* samples, size_t frames, std::vector<float>& out) {
    if (!samples || frames == 0) {
        out.clear();
        return;
    }

    const size_t count = frames * 2;
    out.resize(count);
    for (size_t i = 0; i < count; i++) {
        out[i] = s16_to_float(samples[i]);
    }
}

} // namespace retrohost
