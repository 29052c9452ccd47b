#include "color.hpp"

namespace {

constexpr int32_t kGray4Max = 15;

/**
 * @brief round(sum / 3), half up, for a non-negative sum
 */
constexpr int32_t roundedMean3(int32_t sum)
{
    return (2 * sum + 3) / 6;
}

/**
 * @brief round(gray * 15 / 255), half up
 */
constexpr int32_t grayToIndex(int32_t gray)
{
    return (gray * kGray4Max * 2 + 255) / 510;
}

static_assert(grayToIndex(roundedMean3(0)) == 0, "black must map to index 0");
static_assert(grayToIndex(roundedMean3(3 * 102)) == 6, "dark must map to index 6");
static_assert(grayToIndex(roundedMean3(3 * 153)) == 9, "gray must map to index 9");
static_assert(grayToIndex(roundedMean3(3 * 187)) == 11, "light must map to index 11");
static_assert(grayToIndex(roundedMean3(3 * 255)) == 15, "white must map to index 15");

} // namespace

roundscreen::Status roundscreen::ToNative(const Rgb& rgb, ColorDepth depth, NativeColor& out) noexcept
{
    if (!IsValidColor(rgb)) {
        return Status::InvalidColor;
    }

    switch (depth) {
        case ColorDepth::Grayscale4: {
            const int32_t gray = roundedMean3(static_cast<int32_t>(rgb.r) + rgb.g + rgb.b);
            out = static_cast<NativeColor>(grayToIndex(gray));
            return Status::Ok;
        }
        case ColorDepth::Rgb565:
        default:
            out = colors::rgb565(static_cast<uint8_t>(rgb.r), static_cast<uint8_t>(rgb.g),
                                 static_cast<uint8_t>(rgb.b));
            return Status::Ok;
    }
}

roundscreen::Rgb roundscreen::NativeToRgb(NativeColor native, ColorDepth depth) noexcept
{
    if (depth == ColorDepth::Grayscale4) {
        const int16_t level = static_cast<int16_t>((native & 0x0F) * 17);
        return {level, level, level};
    }

    const int16_t r5 = static_cast<int16_t>((native >> 11) & 0x1F);
    const int16_t g6 = static_cast<int16_t>((native >> 5) & 0x3F);
    const int16_t b5 = static_cast<int16_t>(native & 0x1F);
    return {
        static_cast<int16_t>((r5 << 3) | (r5 >> 2)),
        static_cast<int16_t>((g6 << 2) | (g6 >> 4)),
        static_cast<int16_t>((b5 << 3) | (b5 >> 2)),
    };
}
