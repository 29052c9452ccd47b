/**
 * @file text.hpp
 * @brief Fixed-cell text rendering on top of the 8x8 font.
 * @details Every string is validated as a whole before the first glyph is
 *          drawn, so an unsupported character never leaves half a word on
 *          screen.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "backend.hpp"
#include "geometry.hpp"
#include "status.hpp"

namespace roundscreen {

/**
 * @brief Text cell size in pixels (cell width == cell height == pitch)
 */
enum class FontSize : uint8_t {
    Small = 7,     ///< Condensed, sampled from the 8x8 glyph
    Normal = 8,    ///< Native font
    Medium = 10,   ///< Units under large values, sampled from the 8x8 glyph
    Double = 16,   ///< Scale 2 blit
    Triple = 24,   ///< Scale 3 blit
};

/**
 * @brief Placement on the circular screen
 */
enum class Cardinal : uint8_t {
    N, NE, E, SE, S, SW, W, NW, Center,
};

constexpr int16_t CellSize(FontSize size) { return static_cast<int16_t>(size); }

/**
 * @brief Pixel width of a run of characters
 */
constexpr int16_t TextWidth(size_t len, FontSize size)
{
    return static_cast<int16_t>(len * static_cast<size_t>(CellSize(size)));
}

/**
 * @brief Check that every character has a glyph
 * @param text NUL-terminated string (nullptr counts as empty)
 * @param len Receives the string length
 * @return Status::Ok or Status::UnsupportedGlyph
 */
Status ValidateText(const char* text, size_t& len) noexcept;

/**
 * @brief Draw text anchored at its top-left corner
 */
Status DrawText(Backend& backend, const char* text, int16_t x, int16_t y,
                NativeColor color, FontSize size = FontSize::Normal) noexcept;

/**
 * @brief Draw text horizontally centered on cx
 * @details x = cx - len * cell / 2
 */
Status DrawCenteredText(Backend& backend, const char* text, int16_t cx, int16_t y,
                        NativeColor color, FontSize size = FontSize::Normal) noexcept;

/**
 * @brief Draw text at an integer scale of the 8x8 font
 * @param scale 1, 2 or 3; anything else is rejected
 * @return Status::InvalidScale for any other scale (including fractions)
 */
Status DrawScaledText(Backend& backend, const char* text, int16_t x, int16_t y,
                      NativeColor color, float scale) noexcept;

/**
 * @brief Top-left corner of a text run placed at a cardinal position
 * @details N/S rows are pushed inward until the run fits the disc chord
 *          (2 px padding); E/W keep a side margin of one cell plus 4 px.
 * @param geo Screen profile
 * @param at Position
 * @param len Number of characters
 * @param size Cell size
 */
Point ResolveCardinal(const GeometryProfile& geo, Cardinal at, size_t len, FontSize size) noexcept;

/**
 * @brief Parse "N", "NE", ..., "CENTER"
 * @return false for unknown names (at is left unchanged)
 */
bool ParseCardinal(const char* name, Cardinal& at) noexcept;

} // namespace roundscreen
