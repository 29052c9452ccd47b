/**
 * @file faces.hpp
 * @brief Expression catalog for the face widget.
 */

#pragma once

#include <cstdint>

#include "status.hpp"

namespace roundscreen {

static constexpr int16_t FACE_GRID_ = 8;  ///< Logical cells per side

enum class Expression : uint8_t {
    Happy = 0,
    Sad,
    Surprised,
    Sleeping,
    Angry,
    Love,
};

static constexpr uint8_t EXPRESSION_COUNT_ = 6;

/**
 * @brief Look up an expression by its lowercase name
 * @param name "happy", "sad", "surprised", "sleeping", "angry" or "love"
 * @param out Expression (untouched on failure)
 * @return Status::Ok or Status::UnknownExpression
 */
Status ParseExpression(const char* name, Expression& out) noexcept;

/**
 * @brief Lowercase name of an expression
 */
const char* ExpressionName(Expression expression) noexcept;

/**
 * @brief 8 rows of the expression bitmap, MSB = leftmost cell
 */
const uint8_t* ExpressionBitmap(Expression expression) noexcept;

} // namespace roundscreen
