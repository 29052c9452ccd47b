/**
 * @file color.hpp
 * @brief Abstract RGB colors and their conversion to native panel formats.
 * @details Widgets work in 8-bit-per-channel RGB. Each backend declares the
 *          color depth it stores and the color model converts to it:
 *            - Grayscale4 : 4-bit gray index (SSD1327 class OLED)
 *            - Rgb565     : 16-bit packed color (GC9A01 class TFT)
 */

#pragma once

#include <cstdint>

#include "status.hpp"

namespace roundscreen {

/**
 * @brief Pixel encoding stored by a backend
 */
enum class ColorDepth : uint8_t {
    Grayscale4 = 4,   ///< 16 gray levels, 0 = black, 15 = white
    Rgb565 = 16,      ///< 5/6/5 packed RGB
};

/**
 * @brief Backend-specific encoded color (gray index or RGB565 word)
 */
using NativeColor = uint16_t;

/**
 * @brief Abstract color, one channel per component
 * @details Channels are signed so that out-of-range caller values can be
 *          detected and rejected instead of wrapping.
 */
struct Rgb {
    int16_t r;
    int16_t g;
    int16_t b;

    constexpr bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    constexpr bool operator!=(const Rgb& o) const { return !(*this == o); }
};

/**
 * @brief Color palette namespace
 * @details The gray ramp is chosen so that every entry lands exactly on a
 *          4-bit index (level = index * 17).
 */
namespace colors {
    // Gray ramp
    constexpr Rgb black  = {0, 0, 0};        ///< Index 0
    constexpr Rgb dark   = {102, 102, 102};  ///< Index 6
    constexpr Rgb gray   = {153, 153, 153};  ///< Index 9
    constexpr Rgb light  = {187, 187, 187};  ///< Index 11
    constexpr Rgb white  = {255, 255, 255};  ///< Index 15

    // Accent colors (collapse to their channel mean on grayscale panels)
    constexpr Rgb green  = {0, 255, 0};
    constexpr Rgb red    = {255, 0, 0};
    constexpr Rgb yellow = {255, 255, 0};
    constexpr Rgb blue   = {0, 0, 255};

    /**
     * @brief Convert 8-bit RGB to RGB565 format
     * @param r Red component (0-255)
     * @param g Green component (0-255)
     * @param b Blue component (0-255)
     * @return RGB565 color value
     */
    constexpr uint16_t rgb565(uint8_t r, uint8_t g, uint8_t b) {
        return static_cast<uint16_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
    }
}

/**
 * @brief Check that every channel is within 0-255
 */
constexpr bool IsValidColor(const Rgb& c)
{
    return c.r >= 0 && c.r <= 255 && c.g >= 0 && c.g <= 255 && c.b >= 0 && c.b <= 255;
}

/**
 * @brief Convert an abstract color to a backend's native encoding
 * @details Grayscale: gray = round((r+g+b)/3), index = round(gray*15/255),
 *          both computed in integers with round-half-up.
 *          RGB565: plain truncation to 5/6/5 bits, no dithering.
 * @param rgb Color to convert
 * @param depth Target encoding
 * @param out Native color (untouched on failure)
 * @return Status::Ok, or Status::InvalidColor if a channel is outside 0-255
 */
Status ToNative(const Rgb& rgb, ColorDepth depth, NativeColor& out) noexcept;

/**
 * @brief Expand a native color back to 8-bit RGB
 * @details Gray index i maps to level i*17; RGB565 channels are expanded by
 *          bit replication.
 */
Rgb NativeToRgb(NativeColor native, ColorDepth depth) noexcept;

} // namespace roundscreen
