#include "core/sample_convert.hpp"

#include <gtest/gtest.h>

namespace retrohost {
namespace {

TEST(SampleConvertTest, ScalesByFullRange) {
    EXPECT_FLOAT_EQ(s16_to_float(0), 0.0f);
    EXPECT_FLOAT_EQ(s16_to_float(-32768), -1.0f);
    EXPECT_FLOAT_EQ(s16_to_float(16384), 0.5f);
    EXPECT_FLOAT_EQ(s16_to_float(-16384), -0.5f);
    EXPECT_FLOAT_EQ(s16_to_float(32767), 32767.0f / 32768.0f);
}

TEST(SampleConvertTest, OutputStaysWithinUnitRange) {
    for (int sample = -32768; sample <= 32767; sample += 97) {
        float value = s16_to_float(static_cast<int16_t>(sample));
        EXPECT_GE(value, -1.0f);
        EXPECT_LE(value, 1.0f);
    }
}

TEST(SampleConvertTest, ConvertsInterleavedStereo) {
    const int16_t input[] = {0, 32767, -32768, 16384};
    std::vector<float> out;
    convert_s16_to_float(input, 2, out);

    ASSERT_EQ(out.size(), 4u);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_FLOAT_EQ(out[1], 32767.0f / 32768.0f);
    EXPECT_FLOAT_EQ(out[2], -1.0f);
    EXPECT_FLOAT_EQ(out[3], 0.5f);
}

TEST(SampleConvertTest, EmptyOrNullInputClearsOutput) {
    std::vector<float> out = {1.0f, 2.0f};
    convert_s16_to_float(nullptr, 4, out);
    EXPECT_TRUE(out.empty());

    const int16_t input[] = {1, 2};
    out = {1.0f};
    convert_s16_to_float(input, 0, out);
    EXPECT_TRUE(out.empty());
}

} // namespace
} // namespace retrohost
