#include "text.hpp"

#include "font8x8.hpp"

#include <algorithm>
#include <cstring>

namespace {

/**
 * @brief Distance from the top (or bottom) edge at which a run of width tw
 *        fits inside the disc, never less than from_edge
 */
int16_t safeMargin(const roundscreen::GeometryProfile& geo, int32_t tw, int16_t from_edge) noexcept
{
    const int32_t r = geo.radius;
    if (tw >= 2 * r) {
        return static_cast<int16_t>(r);
    }
    // floor(sqrt(r^2 - (tw/2)^2)) without leaving integers
    const int32_t max_d = roundscreen::ISqrt(4 * r * r - tw * tw) / 2;
    const int32_t min_margin = r - max_d;
    return static_cast<int16_t>(std::max<int32_t>(min_margin + 2, from_edge));
}

struct CardinalName {
    const char* name;
    roundscreen::Cardinal at;
};

constexpr CardinalName CARDINAL_NAMES_[] = {
    {"N", roundscreen::Cardinal::N},   {"NE", roundscreen::Cardinal::NE},
    {"E", roundscreen::Cardinal::E},   {"SE", roundscreen::Cardinal::SE},
    {"S", roundscreen::Cardinal::S},   {"SW", roundscreen::Cardinal::SW},
    {"W", roundscreen::Cardinal::W},   {"NW", roundscreen::Cardinal::NW},
    {"CENTER", roundscreen::Cardinal::Center},
};

} // namespace

roundscreen::Status roundscreen::ValidateText(const char* text, size_t& len) noexcept
{
    len = 0;
    if (text == nullptr) {
        return Status::Ok;
    }
    for (const char* p = text; *p != '\0'; ++p) {
        if (!IsPrintable(*p)) {
            return Status::UnsupportedGlyph;
        }
        ++len;
    }
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawText(Backend& backend, const char* text, int16_t x, int16_t y,
                                          NativeColor color, FontSize size) noexcept
{
    size_t len = 0;
    const Status st = ValidateText(text, len);
    if (st != Status::Ok) {
        return st;
    }
    const int16_t cell = CellSize(size);
    for (size_t i = 0; i < len; ++i) {
        backend.DrawGlyph(text[i], static_cast<int16_t>(x + static_cast<int32_t>(i) * cell), y, color, cell);
    }
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawCenteredText(Backend& backend, const char* text, int16_t cx, int16_t y,
                                                  NativeColor color, FontSize size) noexcept
{
    size_t len = 0;
    const Status st = ValidateText(text, len);
    if (st != Status::Ok) {
        return st;
    }
    const int16_t x = static_cast<int16_t>(cx - TextWidth(len, size) / 2);
    return DrawText(backend, text, x, y, color, size);
}

roundscreen::Status roundscreen::DrawScaledText(Backend& backend, const char* text, int16_t x, int16_t y,
                                                NativeColor color, float scale) noexcept
{
    FontSize size = FontSize::Normal;
    if (scale == 1.0f) {
        size = FontSize::Normal;
    } else if (scale == 2.0f) {
        size = FontSize::Double;
    } else if (scale == 3.0f) {
        size = FontSize::Triple;
    } else {
        return Status::InvalidScale;
    }
    return DrawText(backend, text, x, y, color, size);
}

roundscreen::Point roundscreen::ResolveCardinal(const GeometryProfile& geo, Cardinal at, size_t len,
                                                FontSize size) noexcept
{
    const int16_t cx = geo.center.x;
    const int16_t cy = geo.center.y;
    const int16_t ch = CellSize(size);
    const int16_t tw = TextWidth(len, size);

    const int16_t margin_ns = safeMargin(geo, tw, ch);
    const int16_t margin_ew = static_cast<int16_t>(ch + 4);

    const int16_t left = margin_ew;
    const int16_t right = static_cast<int16_t>(geo.width - margin_ew - tw);
    const int16_t middle_x = static_cast<int16_t>(cx - tw / 2);
    const int16_t top = margin_ns;
    const int16_t bottom = static_cast<int16_t>(geo.height - margin_ns - ch);
    const int16_t middle_y = static_cast<int16_t>(cy - ch / 2);

    switch (at) {
        case Cardinal::N:  return {middle_x, top};
        case Cardinal::NE: return {right, top};
        case Cardinal::E:  return {right, middle_y};
        case Cardinal::SE: return {right, bottom};
        case Cardinal::S:  return {middle_x, bottom};
        case Cardinal::SW: return {left, bottom};
        case Cardinal::W:  return {left, middle_y};
        case Cardinal::NW: return {left, top};
        case Cardinal::Center:
        default:
            return {middle_x, middle_y};
    }
}

bool roundscreen::ParseCardinal(const char* name, Cardinal& at) noexcept
{
    if (name == nullptr) {
        return false;
    }
    for (const auto& entry : CARDINAL_NAMES_) {
        if (std::strcmp(entry.name, name) == 0) {
            at = entry.at;
            return true;
        }
    }
    return false;
}
