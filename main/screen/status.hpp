/**
 * @file status.hpp
 * @brief Result codes returned by every drawing call.
 */

#pragma once

#include <cstdint>

namespace roundscreen {

/**
 * @brief Drawing call result
 * @details Failures are local to a single call. Pixels drawn before the
 *          failure was detected are not rolled back.
 */
enum class Status : uint8_t {
    Ok = 0,              ///< Call completed
    InvalidColor,        ///< RGB channel outside 0-255
    UnsupportedGlyph,    ///< Character outside printable ASCII (0x20-0x7E)
    InvalidScale,        ///< Text scale other than 1, 2 or 3
    TextTooLong,         ///< Text wider than the widget allows
    InvalidRange,        ///< Empty or inverted value range, or field out of range
    IndexOutOfRange,     ///< Menu selection outside the item list
    UnknownExpression,   ///< Face expression name not in the catalog
    TooManyLines,        ///< Subtitle with more than two lines
};

/**
 * @brief Human-readable status name for logs
 * @param status Status value
 * @return Static string, never nullptr
 */
const char* StatusToName(Status status) noexcept;

} // namespace roundscreen
