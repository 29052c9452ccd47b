/**
 * @file frame_controller.hpp
 * @brief Frame lifecycle and widget entry points for one round screen.
 * @details A frame is "Clear once, draw any number of widgets, Present
 *          once". The controller owns its backend and tracks composition:
 *          immersive widgets (compass, watch, full-size face) are meant to
 *          own the disc, so drawing one after a content widget in the same
 *          frame is counted as a layout warning. Nothing is rejected.
 *
 *          Skipping Clear() is legal; the next frame is drawn on top of the
 *          previous one.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "backend.hpp"
#include "color.hpp"
#include "geometry.hpp"
#include "status.hpp"
#include "text.hpp"
#include "widgets.hpp"

namespace roundscreen {

enum class FrameState : uint8_t {
    Idle,       ///< Presented (or never cleared); widgets draw over the previous frame
    Cleared,    ///< Buffer zeroed, nothing drawn yet
    Drawing,    ///< At least one widget drawn since Clear
};

class FrameController {
public:
    FrameController(const GeometryProfile& geo, std::unique_ptr<Backend> backend) noexcept;

    FrameController(const FrameController&) = delete;
    FrameController& operator=(const FrameController&) = delete;

    // ------------- FRAME -------------

    /**
     * @brief Zero the frame buffer and reset composition tracking
     */
    void Clear() noexcept;

    /**
     * @brief Flush the frame buffer to the device
     * @details Does not clear the buffer. Two Presents in a row send the same frame.
     */
    void Present() noexcept;

    // ------------- WIDGETS -------------

    Status Title(const char* text, const Rgb& color = colors::gray) noexcept;
    Status Subtitle(const char* line, const Rgb& color = colors::dark) noexcept;
    Status Subtitle(const char* line1, const char* line2, const Rgb& color = colors::dark) noexcept;
    Status Subtitle(const char* const* lines, size_t count, const Rgb& color = colors::dark) noexcept;
    Status Value(const ValueSpec& spec) noexcept;
    Status Bar(const BarSpec& spec) noexcept;
    Status Gauge(const GaugeSpec& spec) noexcept;
    Status Graph(const GraphSpec& spec) noexcept;
    Status Menu(const MenuSpec& spec) noexcept;
    Status Compass(const CompassSpec& spec) noexcept;
    Status Watch(const WatchSpec& spec) noexcept;
    Status Face(const FaceSpec& spec) noexcept;

    /**
     * @brief Face by expression name
     * @return Status::UnknownExpression for names outside the catalog
     */
    Status Face(const char* expression, const Rgb& color = colors::white, bool compact = false) noexcept;

    // ------------- TEXT & PRIMITIVES -------------

    /**
     * @brief Text at a cardinal position of the disc
     */
    Status Text(const char* text, Cardinal at = Cardinal::Center, const Rgb& color = colors::white,
                FontSize size = FontSize::Normal) noexcept;

    /**
     * @brief Text with its top-left corner at (x, y)
     */
    Status TextAt(const char* text, int16_t x, int16_t y, const Rgb& color = colors::white,
                  FontSize size = FontSize::Normal) noexcept;

    Status Line(int16_t x0, int16_t y0, int16_t x1, int16_t y1, const Rgb& color = colors::white) noexcept;
    Status Circle(int16_t cx, int16_t cy, int16_t r, const Rgb& color = colors::white, bool fill = false) noexcept;
    Status Rect(int16_t x, int16_t y, int16_t w, int16_t h, const Rgb& color = colors::white,
                bool fill = false) noexcept;
    Status Pixel(int16_t x, int16_t y, const Rgb& color = colors::white) noexcept;

    // ------------- STATE -------------

    FrameState State() const noexcept { return state_; }
    const GeometryProfile& Geometry() const noexcept { return geo_; }
    Backend& GetBackend() noexcept { return *backend_; }

    /// Layout warnings raised since the last Clear()
    uint32_t FrameWarnings() const noexcept { return frame_warnings_; }

    /// Layout warnings raised since construction
    uint32_t LayoutWarnings() const noexcept { return total_warnings_; }

private:
    enum class WidgetRole : uint8_t {
        Content,
        Immersive,
        Primitive,
    };

    void beginDraw_(WidgetRole role, const char* name) noexcept;
    Status finishDraw_(Status status, const char* name) noexcept;
    DrawContext context_() noexcept { return DrawContext{*backend_, geo_}; }

    const GeometryProfile geo_;
    std::unique_ptr<Backend> backend_;

    FrameState state_ = FrameState::Idle;
    bool content_drawn_ = false;
    uint32_t frame_warnings_ = 0;
    uint32_t total_warnings_ = 0;
};

} // namespace roundscreen
