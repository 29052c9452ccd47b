#include "geometry.hpp"

#include <cmath>

namespace {

constexpr float DEG_TO_RAD_ = 3.14159265358979f / 180.0f;

} // namespace

int32_t roundscreen::ISqrt(int32_t v) noexcept
{
    if (v <= 0) {
        return 0;
    }
    int32_t s = static_cast<int32_t>(std::sqrt(static_cast<double>(v)));
    // Correct the float estimate so the result is exact on every platform.
    const int64_t target = v;
    while (static_cast<int64_t>(s) * s > target) {
        --s;
    }
    while (static_cast<int64_t>(s + 1) * (s + 1) <= target) {
        ++s;
    }
    return s;
}

int16_t roundscreen::GeometryProfile::HalfChord(int16_t y) const noexcept
{
    const int32_t dy = static_cast<int32_t>(y) - center.y;
    const int32_t r2 = static_cast<int32_t>(radius) * radius;
    const int32_t rest = r2 - dy * dy;
    if (rest <= 0) {
        return 0;
    }
    return static_cast<int16_t>(ISqrt(rest));
}

roundscreen::Point roundscreen::PolarPoint(Point center, float length, float bearing_deg) noexcept
{
    if (!std::isfinite(length) || !std::isfinite(bearing_deg)) {
        return center;
    }
    const float rad = bearing_deg * DEG_TO_RAD_;
    return {static_cast<int16_t>(center.x + std::lround(length * std::sin(rad))),
            static_cast<int16_t>(center.y - std::lround(length * std::cos(rad)))};
}
