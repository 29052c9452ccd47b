#include "widgets.hpp"

#include "text.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace {

using roundscreen::DrawContext;
using roundscreen::NativeColor;
using roundscreen::Rgb;
using roundscreen::Status;

constexpr size_t TEXT_BUF_SIZE_ = 48;

/// Native value of a palette constant
NativeColor paletteColor(const DrawContext& ctx, const Rgb& rgb) noexcept
{
    NativeColor native = 0;
    // Palette constants are always within 0-255
    (void)ctx.Native(rgb, native);
    return native;
}

inline bool isEmpty(const char* text) noexcept
{
    return text == nullptr || text[0] == '\0';
}

inline float clampf(float v, float lo, float hi) noexcept
{
    return std::max(lo, std::min(v, hi));
}

/// Half-width available to a menu row band
inline int16_t menuBandHalfWidth(const roundscreen::GeometryProfile& geo, int16_t row) noexcept
{
    return roundscreen::BandHalfWidth(geo, static_cast<int16_t>(roundscreen::MenuRowY(row) - 2),
                                      roundscreen::MENU_PITCH_);
}

} // namespace

// ------------- LAYOUT HELPERS -------------

roundscreen::Status roundscreen::FormatValue(float value, uint8_t decimals, const char* text,
                                             char* out, size_t out_size) noexcept
{
    if (out == nullptr || out_size == 0) {
        return Status::TextTooLong;
    }
    int n = 0;
    if (text != nullptr) {
        n = std::snprintf(out, out_size, "%s", text);
    } else {
        n = std::snprintf(out, out_size, "%.*f", static_cast<int>(decimals), static_cast<double>(value));
    }
    if (n < 0 || static_cast<size_t>(n) >= out_size || static_cast<size_t>(n) > VALUE_MAX_CHARS_) {
        return Status::TextTooLong;
    }
    return Status::Ok;
}

int16_t roundscreen::BandHalfWidth(const GeometryProfile& geo, int16_t top, int16_t height) noexcept
{
    const int16_t bottom = static_cast<int16_t>(top + height - 1);
    return std::min(geo.HalfChord(top), geo.HalfChord(bottom));
}

roundscreen::Status roundscreen::FitSpan(const GeometryProfile& geo, int16_t top, int16_t height, int16_t center_x,
                                         int16_t width, int16_t& x) noexcept
{
    const int16_t half = BandHalfWidth(geo, top, height);
    if (width > 2 * half) {
        return Status::TextTooLong;
    }
    const int32_t lo = geo.center.x - half;
    const int32_t hi = geo.center.x + half - width;
    x = static_cast<int16_t>(std::max(lo, std::min<int32_t>(center_x - width / 2, hi)));
    return Status::Ok;
}

roundscreen::Status roundscreen::ComputeValueLayout(const GeometryProfile& geo, const ValueSpec& spec,
                                                    size_t text_len, ValueLayout& layout) noexcept
{
    switch (spec.at) {
        case ValueAnchor::West:
            layout.center_x = static_cast<int16_t>(geo.width / 4);
            break;
        case ValueAnchor::East:
            layout.center_x = static_cast<int16_t>(3 * geo.width / 4);
            break;
        case ValueAnchor::Center:
        default:
            layout.center_x = static_cast<int16_t>(geo.width / 2);
            break;
    }
    layout.width = static_cast<int16_t>(text_len * VALUE_SCALE_CELL_);

    int16_t block_h = VALUE_SCALE_CELL_;
    if (!isEmpty(spec.unit)) {
        block_h = static_cast<int16_t>(block_h + VALUE_UNIT_GAP_ + CellSize(FontSize::Medium));
    }
    layout.y = static_cast<int16_t>(geo.ContentMiddle() - block_h / 2 + spec.y_offset);
    return FitSpan(geo, layout.y, VALUE_SCALE_CELL_, layout.center_x, layout.width, layout.x);
}

roundscreen::Status roundscreen::ComputeBarLayout(const GeometryProfile& geo, const BarSpec& spec,
                                                  BarLayout& out) noexcept
{
    if (!(spec.max_value > 0.0f)) {
        return Status::InvalidRange;
    }
    out.track_width = static_cast<int16_t>(geo.width - 2 * BAR_SIDE_MARGIN_);
    out.height = BAR_HEIGHT_;
    out.x = static_cast<int16_t>(geo.center.x - out.track_width / 2);
    out.y = static_cast<int16_t>(geo.center.y + BAR_DROP_ + spec.y_offset);

    const float v = clampf(spec.value, 0.0f, spec.max_value);
    out.fill_width = static_cast<int16_t>(std::lround(out.track_width * v / spec.max_value));
    return Status::Ok;
}

roundscreen::Status roundscreen::ComputeGaugeLayout(const GeometryProfile& geo, const GaugeSpec& spec,
                                                    GaugeLayout& out) noexcept
{
    if (!(spec.max_value > spec.min_value)) {
        return Status::InvalidRange;
    }
    out.thickness = std::max<int16_t>(GAUGE_MIN_THICKNESS_, static_cast<int16_t>(geo.radius / 9));
    out.arc_radius = static_cast<int16_t>(geo.radius - out.thickness / 2 - 1);
    out.outer_radius = static_cast<int16_t>(out.arc_radius + out.thickness / 2);
    out.inner_radius = static_cast<int16_t>(out.outer_radius - out.thickness + 1);

    const float ratio = clampf((spec.value - spec.min_value) / (spec.max_value - spec.min_value), 0.0f, 1.0f);
    out.fill_sweep = GAUGE_SWEEP_DEG_ * ratio;
    return Status::Ok;
}

roundscreen::Status roundscreen::ComputeGraphLayout(const GeometryProfile& geo, const GraphSpec& spec,
                                                    GraphLayout& out) noexcept
{
    if (!(spec.max_value > spec.min_value)) {
        return Status::InvalidRange;
    }
    // Rows GRAPH_TOP_ .. GRAPH_TOP_ + GRAPH_HEIGHT_ inclusive, the last one holds the x axis
    const int16_t half = static_cast<int16_t>(
        std::max(BandHalfWidth(geo, GRAPH_TOP_, static_cast<int16_t>(GRAPH_HEIGHT_ + 1)) - GRAPH_SIDE_PAD_, 0));
    out.x = static_cast<int16_t>(geo.center.x - half);
    out.y = GRAPH_TOP_;
    out.width = static_cast<int16_t>(2 * half);
    out.height = GRAPH_HEIGHT_;

    const size_t count = (spec.data == nullptr) ? 0 : spec.count;
    out.shown = std::min(count, static_cast<size_t>(std::max<int16_t>(out.width, 0)));
    out.first = count - out.shown;
    return Status::Ok;
}

int16_t roundscreen::GraphSampleX(const GraphLayout& layout, size_t i) noexcept
{
    if (layout.shown <= 1) {
        return layout.x;
    }
    const int32_t span = layout.width - 1;
    return static_cast<int16_t>(layout.x + static_cast<int32_t>(i) * span / static_cast<int32_t>(layout.shown - 1));
}

int16_t roundscreen::GraphSampleY(const GraphLayout& layout, const GraphSpec& spec, float value) noexcept
{
    const float ratio = clampf((value - spec.min_value) / (spec.max_value - spec.min_value), 0.0f, 1.0f);
    return static_cast<int16_t>(layout.y + layout.height - std::lround(ratio * layout.height));
}

roundscreen::Status roundscreen::ComputeMenuWindow(const GeometryProfile& geo, size_t count, int32_t selected,
                                                   MenuWindow& out) noexcept
{
    if (selected < 0 || static_cast<size_t>(selected) >= count) {
        return Status::IndexOutOfRange;
    }
    const int32_t rows = (geo.height - MENU_RESERVED_) / MENU_PITCH_;
    const int32_t visible = std::min<int32_t>(static_cast<int32_t>(count), rows);
    const int32_t last_start = static_cast<int32_t>(count) - visible;

    out.visible = static_cast<int16_t>(visible);
    out.start = std::max<int32_t>(0, std::min<int32_t>(selected - visible / 2, last_start));
    return Status::Ok;
}

size_t roundscreen::MenuRowChars(const GeometryProfile& geo, int16_t row) noexcept
{
    return static_cast<size_t>(2 * menuBandHalfWidth(geo, row) / CHAR_W_);
}

int16_t roundscreen::MenuRowX(const GeometryProfile& geo, int16_t row, size_t text_len) noexcept
{
    const int16_t half = menuBandHalfWidth(geo, row);
    const int32_t chord_x = geo.center.x - half + 4;
    const int32_t centered_x = geo.center.x - static_cast<int32_t>(TextWidth(text_len, FontSize::Normal)) / 2;
    return static_cast<int16_t>(std::max<int32_t>(0, std::min(chord_x, centered_x)));
}

roundscreen::FaceLayout roundscreen::ComputeFaceLayout(const GeometryProfile& geo, bool compact) noexcept
{
    FaceLayout layout{};
    layout.cell = static_cast<int16_t>((geo.width * (compact ? 7 : 11)) / 128);
    const int16_t size = static_cast<int16_t>(layout.cell * FACE_GRID_);
    const int16_t cy = compact ? geo.ContentMiddle() : geo.center.y;
    layout.x = static_cast<int16_t>(geo.center.x - size / 2);
    layout.y = static_cast<int16_t>(cy - size / 2);
    return layout;
}

roundscreen::Status roundscreen::ComputeWatchAngles(int32_t hours, int32_t minutes, int32_t seconds,
                                                    WatchAngles& out) noexcept
{
    if (hours < 0 || hours >= 24 || minutes < 0 || minutes >= 60 || seconds < 0 || seconds >= 60) {
        return Status::InvalidRange;
    }
    out.hour = static_cast<float>(hours % 12) * 30.0f + static_cast<float>(minutes) * 0.5f;
    out.minute = static_cast<float>(minutes) * 6.0f;
    out.second = static_cast<float>(seconds) * 6.0f;
    return Status::Ok;
}

float roundscreen::NormalizeHeading(float heading) noexcept
{
    if (!std::isfinite(heading)) {
        return 0.0f;
    }
    float h = std::fmod(heading, 360.0f);
    if (h < 0.0f) {
        h += 360.0f;
    }
    // fmod of a tiny negative value can round back up to 360
    return (h >= 360.0f) ? 0.0f : h;
}

// ------------- RENDERERS -------------

roundscreen::Status roundscreen::DrawTitle(const DrawContext& ctx, const char* text, const Rgb& color) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(color, native);
    if (st != Status::Ok) {
        return st;
    }
    size_t len = 0;
    st = ValidateText(text, len);
    if (st != Status::Ok) {
        return st;
    }
    int16_t x = 0;
    st = FitSpan(ctx.geo, TITLE_Y_, CHAR_H_, ctx.geo.center.x, TextWidth(len, FontSize::Normal), x);
    if (st != Status::Ok) {
        return st;
    }
    return DrawText(ctx.backend, text, x, TITLE_Y_, native);
}

roundscreen::Status roundscreen::DrawSubtitle(const DrawContext& ctx, const char* const* lines, size_t count,
                                              const Rgb& color) noexcept
{
    if (count == 0) {
        return Status::Ok;
    }
    if (count > 2) {
        return Status::TooManyLines;
    }
    if (lines == nullptr) {
        return Status::InvalidRange;
    }
    NativeColor native = 0;
    Status st = ctx.Native(color, native);
    if (st != Status::Ok) {
        return st;
    }

    int16_t rows[2] = {static_cast<int16_t>(ctx.geo.height - SUBTITLE_OFFSET_), 0};
    if (count == 2) {
        rows[0] = static_cast<int16_t>(ctx.geo.height - SUBTITLE_FIRST_OFFSET_);
        rows[1] = static_cast<int16_t>(ctx.geo.height - SUBTITLE_SECOND_OFFSET_);
    }
    int16_t xs[2] = {0, 0};
    for (size_t i = 0; i < count; ++i) {
        size_t len = 0;
        st = ValidateText(lines[i], len);
        if (st != Status::Ok) {
            return st;
        }
        st = FitSpan(ctx.geo, rows[i], CHAR_H_, ctx.geo.center.x, TextWidth(len, FontSize::Normal), xs[i]);
        if (st != Status::Ok) {
            return st;
        }
    }

    for (size_t i = 0; i < count; ++i) {
        st = DrawText(ctx.backend, lines[i], xs[i], rows[i], native);
        if (st != Status::Ok) {
            return st;
        }
    }
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawValue(const DrawContext& ctx, const ValueSpec& spec) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }

    char text[TEXT_BUF_SIZE_];
    st = FormatValue(spec.value, spec.decimals, spec.text, text, sizeof(text));
    if (st != Status::Ok) {
        return st;
    }
    size_t len = 0;
    size_t unit_len = 0;
    size_t label_len = 0;
    if ((st = ValidateText(text, len)) != Status::Ok ||
        (st = ValidateText(spec.unit, unit_len)) != Status::Ok ||
        (st = ValidateText(spec.label, label_len)) != Status::Ok) {
        return st;
    }

    ValueLayout layout{};
    st = ComputeValueLayout(ctx.geo, spec, len, layout);
    if (st != Status::Ok) {
        return st;
    }

    // Label and unit are placed before anything is drawn so a misfit leaves the buffer alone
    const int16_t label_y = static_cast<int16_t>(layout.y - CHAR_H_ - VALUE_LABEL_GAP_);
    const int16_t unit_y = static_cast<int16_t>(layout.y + VALUE_SCALE_CELL_ + VALUE_UNIT_GAP_);
    int16_t label_x = 0;
    int16_t unit_x = 0;
    if (label_len > 0 &&
        (st = FitSpan(ctx.geo, label_y, CHAR_H_, layout.center_x, TextWidth(label_len, FontSize::Normal),
                      label_x)) != Status::Ok) {
        return st;
    }
    if (unit_len > 0 &&
        (st = FitSpan(ctx.geo, unit_y, CellSize(FontSize::Medium), layout.center_x,
                      TextWidth(unit_len, FontSize::Medium), unit_x)) != Status::Ok) {
        return st;
    }

    if (label_len > 0) {
        st = DrawText(ctx.backend, spec.label, label_x, label_y, paletteColor(ctx, colors::gray));
        if (st != Status::Ok) {
            return st;
        }
    }

    st = DrawText(ctx.backend, text, layout.x, layout.y, native, FontSize::Double);
    if (st != Status::Ok) {
        return st;
    }

    if (unit_len > 0) {
        st = DrawText(ctx.backend, spec.unit, unit_x, unit_y, paletteColor(ctx, colors::light), FontSize::Medium);
    }
    return st;
}

roundscreen::Status roundscreen::DrawBar(const DrawContext& ctx, const BarSpec& spec) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    BarLayout layout{};
    st = ComputeBarLayout(ctx.geo, spec, layout);
    if (st != Status::Ok) {
        return st;
    }

    ctx.backend.FillRect(layout.x, layout.y, layout.track_width, layout.height, paletteColor(ctx, colors::dark));
    if (layout.fill_width > 0) {
        ctx.backend.FillRect(layout.x, layout.y, layout.fill_width, layout.height, native);
    }
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawGauge(const DrawContext& ctx, const GaugeSpec& spec) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    GaugeLayout layout{};
    st = ComputeGaugeLayout(ctx.geo, spec, layout);
    if (st != Status::Ok) {
        return st;
    }
    char text[TEXT_BUF_SIZE_];
    st = FormatValue(spec.value, spec.decimals, nullptr, text, sizeof(text));
    if (st != Status::Ok) {
        return st;
    }
    size_t len = 0;
    size_t unit_len = 0;
    if ((st = ValidateText(text, len)) != Status::Ok ||
        (st = ValidateText(spec.unit, unit_len)) != Status::Ok) {
        return st;
    }

    const int16_t cx = ctx.geo.center.x;
    const int16_t cy = ctx.geo.center.y;
    const int16_t text_y = static_cast<int16_t>(cy - CHAR_H_);
    const int16_t unit_y = static_cast<int16_t>(cy + CHAR_H_ + 2);
    int16_t text_x = 0;
    int16_t unit_x = 0;
    if ((st = FitSpan(ctx.geo, text_y, VALUE_SCALE_CELL_, cx, TextWidth(len, FontSize::Double), text_x)) !=
            Status::Ok ||
        (st = FitSpan(ctx.geo, unit_y, CHAR_H_, cx, TextWidth(unit_len, FontSize::Normal), unit_x)) != Status::Ok) {
        return st;
    }

    ctx.backend.FillArc(cx, cy, layout.outer_radius, layout.inner_radius, GAUGE_START_DEG_, GAUGE_SWEEP_DEG_,
                        paletteColor(ctx, colors::dark));
    ctx.backend.FillArc(cx, cy, layout.outer_radius, layout.inner_radius, GAUGE_START_DEG_, layout.fill_sweep,
                        native);

    st = DrawText(ctx.backend, text, text_x, text_y, paletteColor(ctx, colors::white), FontSize::Double);
    if (st != Status::Ok) {
        return st;
    }
    if (unit_len > 0) {
        st = DrawText(ctx.backend, spec.unit, unit_x, unit_y, paletteColor(ctx, colors::light));
    }
    return st;
}

roundscreen::Status roundscreen::DrawGraph(const DrawContext& ctx, const GraphSpec& spec) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    GraphLayout layout{};
    st = ComputeGraphLayout(ctx.geo, spec, layout);
    if (st != Status::Ok) {
        return st;
    }

    const NativeColor axis = paletteColor(ctx, colors::dark);
    ctx.backend.DrawVLine(layout.x, layout.y, layout.height, axis);
    ctx.backend.DrawHLine(layout.x, static_cast<int16_t>(layout.y + layout.height), layout.width, axis);

    if (layout.shown == 0) {
        return Status::Ok;
    }
    const float* samples = spec.data + layout.first;
    if (layout.shown == 1) {
        ctx.backend.SetPixel(GraphSampleX(layout, 0), GraphSampleY(layout, spec, samples[0]), native);
        return Status::Ok;
    }

    int16_t prev_x = GraphSampleX(layout, 0);
    int16_t prev_y = GraphSampleY(layout, spec, samples[0]);
    for (size_t i = 1; i < layout.shown; ++i) {
        const int16_t x = GraphSampleX(layout, i);
        const int16_t y = GraphSampleY(layout, spec, samples[i]);
        ctx.backend.DrawLine(prev_x, prev_y, x, y, native);
        prev_x = x;
        prev_y = y;
    }
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawMenu(const DrawContext& ctx, const MenuSpec& spec) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    const size_t count = (spec.items == nullptr) ? 0 : spec.count;
    MenuWindow window{};
    st = ComputeMenuWindow(ctx.geo, count, spec.selected, window);
    if (st != Status::Ok) {
        return st;
    }

    const size_t max_item = static_cast<size_t>(ctx.geo.chars_per_line - MENU_ITEM_MARGIN_CHARS_);
    for (size_t i = 0; i < count; ++i) {
        size_t len = 0;
        st = ValidateText(spec.items[i], len);
        if (st != Status::Ok) {
            return st;
        }
        if (len > max_item) {
            return Status::TextTooLong;
        }
    }

    const NativeColor highlight = paletteColor(ctx, colors::dark);
    const NativeColor idle = paletteColor(ctx, colors::gray);
    const int16_t cx = ctx.geo.center.x;

    for (int16_t row = 0; row < window.visible; ++row) {
        const int32_t index = window.start + row;
        const bool selected = (index == spec.selected);
        const char* item = (spec.items[index] != nullptr) ? spec.items[index] : "";

        char line[TEXT_BUF_SIZE_];
        std::snprintf(line, sizeof(line), "%s%s", selected ? "> " : "  ", item);
        size_t line_len = std::strlen(line);
        const size_t row_chars = MenuRowChars(ctx.geo, row);
        if (line_len > row_chars) {
            // Rows near the rim are cut to their chord
            line[row_chars] = '\0';
            line_len = row_chars;
        }
        const int16_t y = MenuRowY(row);

        if (selected) {
            const int16_t half = menuBandHalfWidth(ctx.geo, row);
            if (half > 2) {
                ctx.backend.FillRect(static_cast<int16_t>(cx - half + 2), static_cast<int16_t>(y - 2),
                                     static_cast<int16_t>(2 * (half - 2)), MENU_PITCH_, highlight);
            }
        }
        st = DrawText(ctx.backend, line, MenuRowX(ctx.geo, row, line_len), y, selected ? native : idle);
        if (st != Status::Ok) {
            return st;
        }
    }
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawCompass(const DrawContext& ctx, const CompassSpec& spec) noexcept
{
    NativeColor native = 0;
    const Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    if (!std::isfinite(spec.heading)) {
        return Status::InvalidRange;
    }

    const Point c = ctx.geo.center;
    const int16_t r = static_cast<int16_t>(ctx.geo.radius - COMPASS_INSET_);
    const NativeColor dark = paletteColor(ctx, colors::dark);
    const NativeColor light = paletteColor(ctx, colors::light);
    const NativeColor gray = paletteColor(ctx, colors::gray);

    ctx.backend.DrawCircle(c.x, c.y, r, dark);
    ctx.backend.DrawCircle(c.x, c.y, static_cast<int16_t>(r * 7 / 10), dark);

    for (int32_t angle = 0; angle < 360; angle += 45) {
        const Point p0 = PolarPoint(c, static_cast<float>(r - COMPASS_TICK_LEN_), static_cast<float>(angle));
        const Point p1 = PolarPoint(c, static_cast<float>(r), static_cast<float>(angle));
        ctx.backend.DrawLine(p0.x, p0.y, p1.x, p1.y, (angle % 90 == 0) ? light : dark);
    }

    static constexpr struct {
        char label[2];
        int16_t bearing;
    } CARDINAL_LABELS_[] = {{"N", 0}, {"E", 90}, {"S", 180}, {"W", 270}};

    for (const auto& entry : CARDINAL_LABELS_) {
        const Point p = PolarPoint(c, static_cast<float>(r + COMPASS_LABEL_GAP_), entry.bearing);
        ctx.backend.DrawGlyph(entry.label[0], static_cast<int16_t>(p.x - CHAR_W_ / 2),
                              static_cast<int16_t>(p.y - CHAR_H_ / 2),
                              (entry.bearing == 0) ? paletteColor(ctx, colors::white) : gray, CHAR_W_);
    }

    const float heading = NormalizeHeading(spec.heading);
    const float needle = static_cast<float>(r * 85 / 100);
    const Point tip = PolarPoint(c, needle, heading);
    const Point tail = PolarPoint(c, needle, heading + 180.0f);
    const Point side_a = PolarPoint(c, COMPASS_NEEDLE_HALF_W_, heading + 90.0f);
    const Point side_b = PolarPoint(c, COMPASS_NEEDLE_HALF_W_, heading - 90.0f);

    ctx.backend.FillTriangle(tip, side_a, side_b, native);
    ctx.backend.FillTriangle(tail, side_a, side_b, dark);
    ctx.backend.FillCircle(c.x, c.y, COMPASS_PIVOT_R_, gray);
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawWatch(const DrawContext& ctx, const WatchSpec& spec) noexcept
{
    NativeColor native = 0;
    Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    WatchAngles angles{};
    st = ComputeWatchAngles(spec.hours, spec.minutes, spec.seconds, angles);
    if (st != Status::Ok) {
        return st;
    }

    const Point c = ctx.geo.center;
    const int16_t dial = static_cast<int16_t>(ctx.geo.radius - WATCH_INSET_);
    const NativeColor light = paletteColor(ctx, colors::light);
    const NativeColor dark = paletteColor(ctx, colors::dark);

    ctx.backend.DrawCircle(c.x, c.y, dial, paletteColor(ctx, colors::gray));
    for (int32_t hour = 0; hour < 12; ++hour) {
        const bool quarter = (hour % 3) == 0;
        const int16_t len = static_cast<int16_t>(quarter ? dial / 8 : dial / 16);
        const Point p0 = PolarPoint(c, static_cast<float>(dial - len), static_cast<float>(hour * 30));
        const Point p1 = PolarPoint(c, static_cast<float>(dial), static_cast<float>(hour * 30));
        ctx.backend.DrawLine(p0.x, p0.y, p1.x, p1.y, quarter ? light : dark);
    }

    const Point hour_tip = PolarPoint(c, static_cast<float>(dial / 2), angles.hour);
    const Point minute_tip = PolarPoint(c, static_cast<float>(dial * 3 / 4), angles.minute);
    const Point second_tip = PolarPoint(c, static_cast<float>(dial * 85 / 100), angles.second);

    ctx.backend.DrawLine(c.x, c.y, hour_tip.x, hour_tip.y, light);
    ctx.backend.DrawLine(c.x, c.y, minute_tip.x, minute_tip.y, native);
    ctx.backend.DrawLine(c.x, c.y, second_tip.x, second_tip.y, paletteColor(ctx, colors::red));
    ctx.backend.FillCircle(c.x, c.y, 2, native);
    return Status::Ok;
}

roundscreen::Status roundscreen::DrawFace(const DrawContext& ctx, const FaceSpec& spec) noexcept
{
    NativeColor native = 0;
    const Status st = ctx.Native(spec.color, native);
    if (st != Status::Ok) {
        return st;
    }
    if (static_cast<uint8_t>(spec.expression) >= EXPRESSION_COUNT_) {
        return Status::UnknownExpression;
    }

    const FaceLayout layout = ComputeFaceLayout(ctx.geo, spec.compact);
    Bitmap bitmap{};
    bitmap.rows = ExpressionBitmap(spec.expression);
    bitmap.width = FACE_GRID_;
    bitmap.height = FACE_GRID_;
    bitmap.scale = layout.cell;
    bitmap.color = native;
    ctx.backend.Blit(bitmap, layout.x, layout.y);
    return Status::Ok;
}
