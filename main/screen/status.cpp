#include "status.hpp"

const char* roundscreen::StatusToName(Status status) noexcept
{
    switch (status) {
        case Status::Ok:
            return "Ok";
        case Status::InvalidColor:
            return "InvalidColor";
        case Status::UnsupportedGlyph:
            return "UnsupportedGlyph";
        case Status::InvalidScale:
            return "InvalidScale";
        case Status::TextTooLong:
            return "TextTooLong";
        case Status::InvalidRange:
            return "InvalidRange";
        case Status::IndexOutOfRange:
            return "IndexOutOfRange";
        case Status::UnknownExpression:
            return "UnknownExpression";
        case Status::TooManyLines:
            return "TooManyLines";
        default:
            return "Unknown";
    }
}
