/**
 * @file widgets.hpp
 * @brief Widget renderers for the round screen.
 * @details Every widget is a pure function of (geometry profile, parameters)
 *          that issues backend draw calls. Widgets keep no state: menu
 *          selection and graph history belong to the caller.
 *
 *          Vertical layout is fixed at the edges and elastic in the middle:
 *            - title     : y = 20
 *            - content   : [28, height - 20]
 *            - subtitle  : y = height - 20 (one line), height - 21 / height - 10 (two lines)
 *
 *          Every text run must fit the disc chord over the rows it covers;
 *          a run that cannot fit is rejected with Status::TextTooLong.
 *
 *          The layout helpers (Compute*) are the exact arithmetic the
 *          renderers use and are exposed so the numbers can be checked
 *          without rasterizing.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "backend.hpp"
#include "color.hpp"
#include "faces.hpp"
#include "geometry.hpp"
#include "status.hpp"

namespace roundscreen {

// ------------- WIDGET CONSTANTS -------------

static constexpr size_t VALUE_MAX_CHARS_ = 8;          ///< Longest value text (scale 2)
static constexpr int16_t VALUE_SCALE_CELL_ = 16;       ///< Value glyph cell
static constexpr int16_t VALUE_UNIT_GAP_ = 8;          ///< Gap between value and unit
static constexpr int16_t VALUE_LABEL_GAP_ = 4;         ///< Gap between label and value

static constexpr int16_t BAR_SIDE_MARGIN_ = 20;        ///< Track width = width - 2 * margin
static constexpr int16_t BAR_HEIGHT_ = 8;
static constexpr int16_t BAR_DROP_ = 20;               ///< Track top = center.y + drop

static constexpr float GAUGE_START_DEG_ = 135.0f;      ///< Lower-left, gap at the bottom
static constexpr float GAUGE_SWEEP_DEG_ = 270.0f;
static constexpr int16_t GAUGE_MIN_THICKNESS_ = 5;

// Plot rows are literal; the x range is the disc chord over those rows
static constexpr int16_t GRAPH_TOP_ = 38;
static constexpr int16_t GRAPH_HEIGHT_ = 52;
static constexpr int16_t GRAPH_SIDE_PAD_ = 4;          ///< Inset from the chord on each side

static constexpr int16_t MENU_TOP_ = 35;
static constexpr int16_t MENU_PITCH_ = 14;             ///< 8 px glyph + 6 px spacing
static constexpr int16_t MENU_RESERVED_ = 40;          ///< Rows = (height - reserved) / pitch
static constexpr int16_t MENU_PREFIX_CHARS_ = 2;       ///< "> " or "  "
static constexpr int16_t MENU_ITEM_MARGIN_CHARS_ = 4;  ///< Item <= chars_per_line - 4

static constexpr int16_t COMPASS_INSET_ = 12;          ///< Rose radius = radius - inset
static constexpr int16_t COMPASS_TICK_LEN_ = 6;
static constexpr int16_t COMPASS_LABEL_GAP_ = 5;
static constexpr int16_t COMPASS_NEEDLE_HALF_W_ = 3;
static constexpr int16_t COMPASS_PIVOT_R_ = 3;

static constexpr int16_t WATCH_INSET_ = 8;             ///< Dial radius = radius - inset

// ------------- CONTEXT -------------

/**
 * @brief Target of a widget draw: one backend and its screen profile
 */
struct DrawContext {
    Backend& backend;
    const GeometryProfile& geo;

    /// Convert an abstract color to the backend's encoding
    Status Native(const Rgb& rgb, NativeColor& out) const noexcept
    {
        return ToNative(rgb, backend.GetColorDepth(), out);
    }
};

// ------------- WIDGET PARAMETERS -------------

enum class ValueAnchor : uint8_t {
    Center,   ///< x centered on width / 2
    West,     ///< x centered on width / 4
    East,     ///< x centered on 3 * width / 4
};

struct ValueSpec {
    float value = 0.0f;
    uint8_t decimals = 0;          ///< Digits after the point when formatting value
    const char* text = nullptr;    ///< Preformatted text, overrides value (e.g. "87%")
    const char* unit = nullptr;    ///< Drawn below in the medium font
    const char* label = nullptr;   ///< Drawn above in the normal font
    ValueAnchor at = ValueAnchor::Center;
    int16_t y_offset = 0;
    Rgb color = colors::white;
};

struct BarSpec {
    float value = 0.0f;
    float max_value = 100.0f;
    int16_t y_offset = 0;
    Rgb color = colors::light;
};

struct GaugeSpec {
    float value = 0.0f;
    float min_value = 0.0f;
    float max_value = 100.0f;
    const char* unit = nullptr;
    uint8_t decimals = 0;
    Rgb color = colors::light;
};

struct GraphSpec {
    const float* data = nullptr;   ///< Samples, newest last
    size_t count = 0;
    float min_value = 0.0f;
    float max_value = 100.0f;
    Rgb color = colors::light;
};

struct MenuSpec {
    const char* const* items = nullptr;
    size_t count = 0;
    int32_t selected = 0;
    Rgb color = colors::white;
};

struct CompassSpec {
    float heading = 0.0f;          ///< Degrees clockwise from north, any value
    Rgb color = colors::light;
};

struct WatchSpec {
    int32_t hours = 0;             ///< 0-23, shown modulo 12
    int32_t minutes = 0;
    int32_t seconds = 0;
    Rgb color = colors::white;     ///< Minute hand; hour hand is light, second hand red
};

struct FaceSpec {
    Expression expression = Expression::Happy;
    Rgb color = colors::white;
    bool compact = false;          ///< Shrink into the content zone to share the screen
};

// ------------- LAYOUT HELPERS -------------

struct ValueLayout {
    int16_t x;          ///< Value text left
    int16_t y;          ///< Value text top
    int16_t width;      ///< Value text width
    int16_t center_x;   ///< Column the block is centered on
};

struct BarLayout {
    int16_t x;
    int16_t y;
    int16_t track_width;
    int16_t fill_width;
    int16_t height;
};

struct GaugeLayout {
    int16_t thickness;
    int16_t arc_radius;    ///< Ring center line
    int16_t outer_radius;
    int16_t inner_radius;
    float fill_sweep;      ///< Degrees, 0 at min and 270 at max
};

struct GraphLayout {
    int16_t x;
    int16_t y;
    int16_t width;
    int16_t height;
    size_t first;          ///< Index of the oldest sample drawn
    size_t shown;          ///< Number of samples drawn
};

struct MenuWindow {
    int16_t visible;       ///< Rows drawn
    int32_t start;         ///< Item shown in the first row
};

struct FaceLayout {
    int16_t cell;
    int16_t x;
    int16_t y;
};

struct WatchAngles {
    float hour;
    float minute;
    float second;
};

/**
 * @brief Format a value the way the value widget prints it
 * @return Status::TextTooLong if the text exceeds VALUE_MAX_CHARS_
 */
Status FormatValue(float value, uint8_t decimals, const char* text, char* out, size_t out_size) noexcept;

/// Half-width of the disc over rows [top, top + height), taken at the narrower edge
int16_t BandHalfWidth(const GeometryProfile& geo, int16_t top, int16_t height) noexcept;

/**
 * @brief Place a run of pixels centered on center_x inside the disc
 * @details The run is shifted inwards when its centered position would
 *          cross the chord of the band [top, top + height).
 * @param x Left edge of the run on success
 * @return Status::TextTooLong if width exceeds the chord
 */
Status FitSpan(const GeometryProfile& geo, int16_t top, int16_t height, int16_t center_x, int16_t width,
               int16_t& x) noexcept;

/**
 * @brief Value text position
 * @return Status::TextTooLong if the text cannot fit the chord of its rows
 */
Status ComputeValueLayout(const GeometryProfile& geo, const ValueSpec& spec, size_t text_len,
                          ValueLayout& layout) noexcept;

Status ComputeBarLayout(const GeometryProfile& geo, const BarSpec& spec, BarLayout& out) noexcept;

/**
 * @brief Gauge ring and fill sweep
 * @return Status::InvalidRange if max_value <= min_value
 */
Status ComputeGaugeLayout(const GeometryProfile& geo, const GaugeSpec& spec, GaugeLayout& out) noexcept;

Status ComputeGraphLayout(const GeometryProfile& geo, const GraphSpec& spec, GraphLayout& out) noexcept;

/// x of the i-th drawn sample (0 = oldest drawn)
int16_t GraphSampleX(const GraphLayout& layout, size_t i) noexcept;

/// y of a sample value, clamped into the plot
int16_t GraphSampleY(const GraphLayout& layout, const GraphSpec& spec, float value) noexcept;

/**
 * @brief Scroll window that keeps the selection visible
 * @return Status::IndexOutOfRange if selected is outside [0, count)
 */
Status ComputeMenuWindow(const GeometryProfile& geo, size_t count, int32_t selected, MenuWindow& out) noexcept;

/// Top of the glyphs in a menu row
constexpr int16_t MenuRowY(int16_t row) { return static_cast<int16_t>(MENU_TOP_ + row * MENU_PITCH_); }

/// Characters (prefix included) that fit the chord of a menu row; longer rows are cut
size_t MenuRowChars(const GeometryProfile& geo, int16_t row) noexcept;

/**
 * @brief Left edge of a menu row's text
 * @details Hugs the disc chord of the row's band; a row too wide for the
 *          chord is centered instead.
 */
int16_t MenuRowX(const GeometryProfile& geo, int16_t row, size_t text_len) noexcept;

FaceLayout ComputeFaceLayout(const GeometryProfile& geo, bool compact) noexcept;

/**
 * @brief Hand angles in degrees clockwise from 12 o'clock
 * @return Status::InvalidRange if a field is out of range
 */
Status ComputeWatchAngles(int32_t hours, int32_t minutes, int32_t seconds, WatchAngles& out) noexcept;

/// Heading reduced to [0, 360); non-finite headings give 0
float NormalizeHeading(float heading) noexcept;

// ------------- RENDERERS -------------

Status DrawTitle(const DrawContext& ctx, const char* text, const Rgb& color = colors::gray) noexcept;

/**
 * @brief Draw one or two subtitle lines at the bottom
 * @details Zero lines draw nothing and succeed. A null entry is an empty line.
 * @return Status::InvalidRange if lines is null while count > 0
 */
Status DrawSubtitle(const DrawContext& ctx, const char* const* lines, size_t count,
                    const Rgb& color = colors::dark) noexcept;

Status DrawValue(const DrawContext& ctx, const ValueSpec& spec) noexcept;
Status DrawBar(const DrawContext& ctx, const BarSpec& spec) noexcept;
Status DrawGauge(const DrawContext& ctx, const GaugeSpec& spec) noexcept;
Status DrawGraph(const DrawContext& ctx, const GraphSpec& spec) noexcept;
Status DrawMenu(const DrawContext& ctx, const MenuSpec& spec) noexcept;

/**
 * @brief Draw the compass rose and needle
 * @return Status::InvalidRange for a NaN or infinite heading
 */
Status DrawCompass(const DrawContext& ctx, const CompassSpec& spec) noexcept;
Status DrawWatch(const DrawContext& ctx, const WatchSpec& spec) noexcept;
Status DrawFace(const DrawContext& ctx, const FaceSpec& spec) noexcept;

} // namespace roundscreen
