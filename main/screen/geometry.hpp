/**
 * @file geometry.hpp
 * @brief Per-screen geometry profiles and the fixed layout offsets shared by all widgets.
 * @details A profile only carries numbers. Widgets derive every offset from
 *          these numbers, so the same widget code serves the 128px and the
 *          240px panels.
 */

#pragma once

#include <cstdint>

namespace roundscreen {

// ------------- LAYOUT CONSTANTS -------------
// Chrome offsets are absolute pixels; only the content zone between them scales.

static constexpr int16_t CHAR_W_ = 8;                 ///< Font cell width
static constexpr int16_t CHAR_H_ = 8;                 ///< Font cell height
static constexpr int16_t TITLE_Y_ = 20;               ///< Title top row
static constexpr int16_t SUBTITLE_OFFSET_ = 20;       ///< One-line subtitle top = height - 20
static constexpr int16_t SUBTITLE_FIRST_OFFSET_ = 21; ///< Two-line subtitle, first row = height - 21
static constexpr int16_t SUBTITLE_SECOND_OFFSET_ = 10;///< Two-line subtitle, second row = height - 10
static constexpr int16_t CONTENT_TOP_ = 28;           ///< First row below the title

/**
 * @brief Integer pixel position
 */
struct Point {
    int16_t x;
    int16_t y;
};

/**
 * @brief Immutable description of one square framebuffer with a circular visible area
 */
struct GeometryProfile {
    int16_t width;           ///< Framebuffer width (== height)
    int16_t height;          ///< Framebuffer height
    Point center;            ///< (width/2, height/2)
    int16_t radius;          ///< width/2
    int16_t chars_per_line;  ///< width / 8

    /**
     * @brief Build the profile of a square panel
     * @param size Panel side in pixels
     */
    static constexpr GeometryProfile Square(int16_t size)
    {
        return {size, size,
                {static_cast<int16_t>(size / 2), static_cast<int16_t>(size / 2)},
                static_cast<int16_t>(size / 2),
                static_cast<int16_t>(size / CHAR_W_)};
    }

    constexpr bool IsValid() const
    {
        return width > 0 && width == height && (width % CHAR_W_) == 0 &&
               radius == width / 2 && center.x == radius && center.y == radius &&
               chars_per_line == width / CHAR_W_;
    }

    /// First row of the content zone (below the title)
    constexpr int16_t ContentTop() const { return CONTENT_TOP_; }

    /// Last row of the content zone (top of the one-line subtitle)
    constexpr int16_t ContentBottom() const { return static_cast<int16_t>(height - SUBTITLE_OFFSET_); }

    /// Vertical middle of the content zone
    constexpr int16_t ContentMiddle() const { return static_cast<int16_t>((ContentTop() + ContentBottom()) / 2); }

    /// True if pixel (x, y) lies inside the visible disc
    constexpr bool Contains(int32_t x, int32_t y) const
    {
        return (x - center.x) * (x - center.x) + (y - center.y) * (y - center.y) <=
               static_cast<int32_t>(radius) * radius;
    }

    /**
     * @brief Half of the visible disc width on row y
     * @return floor(sqrt(r^2 - (y - cy)^2)), or 0 outside the disc
     */
    int16_t HalfChord(int16_t y) const noexcept;
};

constexpr GeometryProfile kRound128 = GeometryProfile::Square(128);  ///< SSD1327 128x128 grayscale OLED
constexpr GeometryProfile kRound240 = GeometryProfile::Square(240);  ///< GC9A01 240x240 RGB TFT

static_assert(kRound128.IsValid(), "128px profile must be consistent");
static_assert(kRound240.IsValid(), "240px profile must be consistent");

/**
 * @brief Integer square root, floor(sqrt(v)) for v >= 0
 */
int32_t ISqrt(int32_t v) noexcept;

/**
 * @brief Point at a given distance and compass bearing from a center
 * @details Bearing 0 is north (up), 90 is east; used by the compass and watch.
 *          A non-finite length or bearing yields the center.
 */
Point PolarPoint(Point center, float length, float bearing_deg) noexcept;

} // namespace roundscreen
