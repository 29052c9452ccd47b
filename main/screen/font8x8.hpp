/**
 * @file font8x8.hpp
 * @brief Fixed 8x8 bitmap font covering printable ASCII.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace roundscreen {

static constexpr char FONT_FIRST_CHAR_ = 0x20;  ///< Space
static constexpr char FONT_LAST_CHAR_ = 0x7E;   ///< Tilde
static constexpr size_t FONT_GLYPH_COUNT_ = FONT_LAST_CHAR_ - FONT_FIRST_CHAR_ + 1;

extern const uint8_t kFont8x8[FONT_GLYPH_COUNT_][8];

/**
 * @brief True if the font has a glyph for c
 */
constexpr bool IsPrintable(char c)
{
    return c >= FONT_FIRST_CHAR_ && c <= FONT_LAST_CHAR_;
}

/**
 * @brief Glyph rows for a printable character
 * @return 8 row bytes, or nullptr if c has no glyph
 */
inline const uint8_t* GlyphRows(char c) noexcept
{
    if (!IsPrintable(c)) {
        return nullptr;
    }
    return kFont8x8[static_cast<size_t>(c - FONT_FIRST_CHAR_)];
}

} // namespace roundscreen
