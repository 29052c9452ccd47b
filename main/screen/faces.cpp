#include "faces.hpp"

#include <cstring>

namespace {

struct FaceEntry {
    const char* name;
    uint8_t rows[roundscreen::FACE_GRID_];
};

// Indexed by Expression. Outline in rows 0-1 and 6-7, eyes in rows 2-3, mouth in rows 4-6.
constexpr FaceEntry FACES_[roundscreen::EXPRESSION_COUNT_] = {
    {"happy",     {0x3C, 0x42, 0xA5, 0x81, 0xA5, 0x99, 0x42, 0x3C}},
    {"sad",       {0x3C, 0x42, 0xA5, 0x81, 0x99, 0xA5, 0x42, 0x3C}},
    {"surprised", {0x3C, 0x42, 0xA5, 0x81, 0x99, 0x99, 0x42, 0x3C}},
    {"sleeping",  {0x3C, 0x42, 0x81, 0xE7, 0x81, 0x99, 0x42, 0x3C}},
    {"angry",     {0x3C, 0x66, 0xA5, 0x81, 0xBD, 0xC3, 0x42, 0x3C}},
    {"love",      {0x3C, 0x42, 0xDB, 0xA5, 0x81, 0xA5, 0x5A, 0x3C}},
};

} // namespace

roundscreen::Status roundscreen::ParseExpression(const char* name, Expression& out) noexcept
{
    if (name == nullptr) {
        return Status::UnknownExpression;
    }
    for (uint8_t i = 0; i < EXPRESSION_COUNT_; ++i) {
        if (std::strcmp(FACES_[i].name, name) == 0) {
            out = static_cast<Expression>(i);
            return Status::Ok;
        }
    }
    return Status::UnknownExpression;
}

const char* roundscreen::ExpressionName(Expression expression) noexcept
{
    const uint8_t i = static_cast<uint8_t>(expression);
    return (i < EXPRESSION_COUNT_) ? FACES_[i].name : "unknown";
}

const uint8_t* roundscreen::ExpressionBitmap(Expression expression) noexcept
{
    const uint8_t i = static_cast<uint8_t>(expression);
    return (i < EXPRESSION_COUNT_) ? FACES_[i].rows : FACES_[0].rows;
}
