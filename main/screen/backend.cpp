#include "backend.hpp"

#include "font8x8.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {

constexpr float DEG_TO_RAD_ = 3.14159265358979f / 180.0f;

inline bool bitSet(const uint8_t* row, int32_t col) noexcept
{
    return (row[col >> 3] & (0x80 >> (col & 7))) != 0;
}

/// Floor division for possibly negative numerators
inline int32_t floorDiv(int32_t num, int32_t den) noexcept
{
    int32_t q = num / den;
    if ((num % den != 0) && ((num < 0) != (den < 0))) {
        --q;
    }
    return q;
}

inline int32_t interpolateX(int32_t ya, int32_t xa, int32_t yb, int32_t xb, int32_t y) noexcept
{
    if (yb == ya) {
        return xa;
    }
    return xa + floorDiv((xb - xa) * (y - ya), yb - ya);
}

inline bool inSector(int32_t dx, int32_t dy, float start_deg, float sweep_deg) noexcept
{
    if (sweep_deg >= 360.0f) {
        return true;
    }
    float angle = std::atan2(static_cast<float>(dy), static_cast<float>(dx)) / DEG_TO_RAD_;
    float rel = std::fmod(angle - start_deg, 360.0f);
    if (rel < 0.0f) {
        rel += 360.0f;
    }
    return rel <= sweep_deg;
}

} // namespace

void roundscreen::Backend::DrawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, NativeColor color) noexcept
{
    // Bresenham, all octants
    int32_t x = x0;
    int32_t y = y0;
    const int32_t dx = std::abs(static_cast<int32_t>(x1) - x0);
    const int32_t dy = -std::abs(static_cast<int32_t>(y1) - y0);
    const int32_t sx = (x0 < x1) ? 1 : -1;
    const int32_t sy = (y0 < y1) ? 1 : -1;
    int32_t err = dx + dy;

    while (true) {
        SetPixel(static_cast<int16_t>(x), static_cast<int16_t>(y), color);
        if (x == x1 && y == y1) {
            break;
        }
        const int32_t e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y += sy;
        }
    }
}

void roundscreen::Backend::DrawHLine(int16_t x, int16_t y, int16_t w, NativeColor color) noexcept
{
    for (int32_t i = 0; i < w; ++i) {
        SetPixel(static_cast<int16_t>(x + i), y, color);
    }
}

void roundscreen::Backend::DrawVLine(int16_t x, int16_t y, int16_t h, NativeColor color) noexcept
{
    for (int32_t i = 0; i < h; ++i) {
        SetPixel(x, static_cast<int16_t>(y + i), color);
    }
}

void roundscreen::Backend::FillRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept
{
    if (w <= 0) {
        return;
    }
    for (int32_t row = 0; row < h; ++row) {
        DrawHLine(x, static_cast<int16_t>(y + row), w, color);
    }
}

void roundscreen::Backend::DrawRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept
{
    if (w <= 0 || h <= 0) {
        return;
    }
    DrawHLine(x, y, w, color);
    DrawHLine(x, static_cast<int16_t>(y + h - 1), w, color);
    DrawVLine(x, y, h, color);
    DrawVLine(static_cast<int16_t>(x + w - 1), y, h, color);
}

void roundscreen::Backend::DrawCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept
{
    if (r < 0) {
        return;
    }
    // Midpoint circle, eight-way symmetric
    int32_t x = r;
    int32_t y = 0;
    int32_t d = 1 - r;
    while (x >= y) {
        SetPixel(static_cast<int16_t>(cx + x), static_cast<int16_t>(cy + y), color);
        SetPixel(static_cast<int16_t>(cx + y), static_cast<int16_t>(cy + x), color);
        SetPixel(static_cast<int16_t>(cx - x), static_cast<int16_t>(cy + y), color);
        SetPixel(static_cast<int16_t>(cx - y), static_cast<int16_t>(cy + x), color);
        SetPixel(static_cast<int16_t>(cx + x), static_cast<int16_t>(cy - y), color);
        SetPixel(static_cast<int16_t>(cx + y), static_cast<int16_t>(cy - x), color);
        SetPixel(static_cast<int16_t>(cx - x), static_cast<int16_t>(cy - y), color);
        SetPixel(static_cast<int16_t>(cx - y), static_cast<int16_t>(cy - x), color);
        ++y;
        if (d < 0) {
            d += 2 * y + 1;
        } else {
            --x;
            d += 2 * (y - x) + 1;
        }
    }
}

void roundscreen::Backend::FillCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept
{
    if (r < 0) {
        return;
    }
    const int32_t r2 = static_cast<int32_t>(r) * r;
    for (int32_t dy = -r; dy <= r; ++dy) {
        const int32_t dx = ISqrt(r2 - dy * dy);
        DrawHLine(static_cast<int16_t>(cx - dx), static_cast<int16_t>(cy + dy),
                  static_cast<int16_t>(2 * dx + 1), color);
    }
}

void roundscreen::Backend::FillArc(int16_t cx, int16_t cy, int16_t r_outer, int16_t r_inner, float start_deg,
                                   float sweep_deg, NativeColor color) noexcept
{
    if (!(sweep_deg > 0.0f) || r_outer < 0) {
        return;
    }
    const int32_t ro2 = static_cast<int32_t>(r_outer) * r_outer;
    const int32_t ri2 = (r_inner > 0) ? static_cast<int32_t>(r_inner) * r_inner : 0;

    for (int32_t dy = -r_outer; dy <= r_outer; ++dy) {
        int32_t dx = -r_outer;
        while (dx <= r_outer) {
            const int32_t d2 = dx * dx + dy * dy;
            if (d2 > ro2 || d2 < ri2 || !inSector(dx, dy, start_deg, sweep_deg)) {
                ++dx;
                continue;
            }
            const int32_t run_start = dx;
            while (dx <= r_outer) {
                const int32_t e2 = dx * dx + dy * dy;
                if (e2 > ro2 || e2 < ri2 || !inSector(dx, dy, start_deg, sweep_deg)) {
                    break;
                }
                ++dx;
            }
            DrawHLine(static_cast<int16_t>(cx + run_start), static_cast<int16_t>(cy + dy),
                      static_cast<int16_t>(dx - run_start), color);
        }
    }
}

void roundscreen::Backend::FillTriangle(Point a, Point b, Point c, NativeColor color) noexcept
{
    Point pts[3] = {a, b, c};
    std::sort(pts, pts + 3, [](const Point& l, const Point& r) { return l.y < r.y; });
    const Point& p0 = pts[0];
    const Point& p1 = pts[1];
    const Point& p2 = pts[2];

    for (int32_t y = p0.y; y <= p2.y; ++y) {
        int32_t xl = interpolateX(p0.y, p0.x, p2.y, p2.x, y);
        int32_t xr = (y < p1.y) ? interpolateX(p0.y, p0.x, p1.y, p1.x, y)
                                : interpolateX(p1.y, p1.x, p2.y, p2.x, y);
        if (xl > xr) {
            std::swap(xl, xr);
        }
        DrawHLine(static_cast<int16_t>(xl), static_cast<int16_t>(y), static_cast<int16_t>(xr - xl + 1), color);
    }
}

void roundscreen::Backend::Blit(const Bitmap& bitmap, int16_t x, int16_t y) noexcept
{
    if (bitmap.rows == nullptr || bitmap.width <= 0 || bitmap.height <= 0) {
        return;
    }
    const int32_t scale = (bitmap.scale < 1) ? 1 : bitmap.scale;
    const int32_t stride = (bitmap.width + 7) / 8;

    for (int32_t row = 0; row < bitmap.height; ++row) {
        const uint8_t* bits = bitmap.rows + row * stride;
        int32_t col = 0;
        while (col < bitmap.width) {
            if (!bitSet(bits, col)) {
                ++col;
                continue;
            }
            // Emit one rectangle per horizontal run of set bits.
            const int32_t start = col;
            while (col < bitmap.width && bitSet(bits, col)) {
                ++col;
            }
            FillRect(static_cast<int16_t>(x + start * scale), static_cast<int16_t>(y + row * scale),
                     static_cast<int16_t>((col - start) * scale), static_cast<int16_t>(scale), bitmap.color);
        }
    }
}

void roundscreen::Backend::DrawGlyph(char c, int16_t x, int16_t y, NativeColor color, int16_t cell) noexcept
{
    const uint8_t* rows = GlyphRows(c);
    if (rows == nullptr || cell <= 0) {
        return;
    }

    if ((cell % CHAR_W_) == 0) {
        Bitmap glyph{};
        glyph.rows = rows;
        glyph.width = CHAR_W_;
        glyph.height = CHAR_H_;
        glyph.scale = static_cast<int16_t>(cell / CHAR_W_);
        glyph.color = color;
        Blit(glyph, x, y);
        return;
    }

    for (int32_t dy = 0; dy < cell; ++dy) {
        const uint8_t bits = rows[(dy * CHAR_H_) / cell];
        int32_t dx = 0;
        while (dx < cell) {
            if ((bits & (0x80 >> ((dx * CHAR_W_) / cell))) == 0) {
                ++dx;
                continue;
            }
            const int32_t start = dx;
            while (dx < cell && (bits & (0x80 >> ((dx * CHAR_W_) / cell))) != 0) {
                ++dx;
            }
            DrawHLine(static_cast<int16_t>(x + start), static_cast<int16_t>(y + dy),
                      static_cast<int16_t>(dx - start), color);
        }
    }
}
