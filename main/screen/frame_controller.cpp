#include "frame_controller.hpp"

#include "esp_log.h"

#include <utility>

static const char* TAG_ = "frame";

roundscreen::FrameController::FrameController(const GeometryProfile& geo, std::unique_ptr<Backend> backend) noexcept
    : geo_(geo)
    , backend_(std::move(backend))
{
    ESP_LOGI(TAG_, "Frame controller %dx%d (r=%d, %d chars/line, %d bpp)",
             geo_.width, geo_.height, geo_.radius, geo_.chars_per_line,
             static_cast<int>(backend_->GetColorDepth()));
}

void roundscreen::FrameController::Clear() noexcept
{
    backend_->ClearBuffer();
    state_ = FrameState::Cleared;
    content_drawn_ = false;
    frame_warnings_ = 0;
}

void roundscreen::FrameController::Present() noexcept
{
    backend_->Present();
    state_ = FrameState::Idle;
}

void roundscreen::FrameController::beginDraw_(WidgetRole role, const char* name) noexcept
{
    if (state_ == FrameState::Idle) {
        ESP_LOGD(TAG_, "%s drawn without Clear(), frame accumulates", name);
    }
    state_ = FrameState::Drawing;

    if (role == WidgetRole::Content) {
        content_drawn_ = true;
    } else if (role == WidgetRole::Immersive && content_drawn_) {
        ++frame_warnings_;
        ++total_warnings_;
        ESP_LOGW(TAG_, "Immersive widget %s drawn over content widgets", name);
    }
}

roundscreen::Status roundscreen::FrameController::finishDraw_(Status status, const char* name) noexcept
{
    if (status != Status::Ok) {
        ESP_LOGD(TAG_, "%s failed: %s", name, StatusToName(status));
    }
    return status;
}

// ------------- WIDGETS -------------

roundscreen::Status roundscreen::FrameController::Title(const char* text, const Rgb& color) noexcept
{
    beginDraw_(WidgetRole::Content, "title");
    return finishDraw_(DrawTitle(context_(), text, color), "title");
}

roundscreen::Status roundscreen::FrameController::Subtitle(const char* line, const Rgb& color) noexcept
{
    const char* lines[] = {line};
    return Subtitle(lines, 1, color);
}

roundscreen::Status roundscreen::FrameController::Subtitle(const char* line1, const char* line2,
                                                           const Rgb& color) noexcept
{
    const char* lines[] = {line1, line2};
    return Subtitle(lines, 2, color);
}

roundscreen::Status roundscreen::FrameController::Subtitle(const char* const* lines, size_t count,
                                                           const Rgb& color) noexcept
{
    beginDraw_(WidgetRole::Content, "subtitle");
    return finishDraw_(DrawSubtitle(context_(), lines, count, color), "subtitle");
}

roundscreen::Status roundscreen::FrameController::Value(const ValueSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Content, "value");
    return finishDraw_(DrawValue(context_(), spec), "value");
}

roundscreen::Status roundscreen::FrameController::Bar(const BarSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Content, "bar");
    return finishDraw_(DrawBar(context_(), spec), "bar");
}

roundscreen::Status roundscreen::FrameController::Gauge(const GaugeSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Content, "gauge");
    return finishDraw_(DrawGauge(context_(), spec), "gauge");
}

roundscreen::Status roundscreen::FrameController::Graph(const GraphSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Content, "graph");
    return finishDraw_(DrawGraph(context_(), spec), "graph");
}

roundscreen::Status roundscreen::FrameController::Menu(const MenuSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Content, "menu");
    return finishDraw_(DrawMenu(context_(), spec), "menu");
}

roundscreen::Status roundscreen::FrameController::Compass(const CompassSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Immersive, "compass");
    return finishDraw_(DrawCompass(context_(), spec), "compass");
}

roundscreen::Status roundscreen::FrameController::Watch(const WatchSpec& spec) noexcept
{
    beginDraw_(WidgetRole::Immersive, "watch");
    return finishDraw_(DrawWatch(context_(), spec), "watch");
}

roundscreen::Status roundscreen::FrameController::Face(const FaceSpec& spec) noexcept
{
    beginDraw_(spec.compact ? WidgetRole::Content : WidgetRole::Immersive, "face");
    return finishDraw_(DrawFace(context_(), spec), "face");
}

roundscreen::Status roundscreen::FrameController::Face(const char* expression, const Rgb& color, bool compact) noexcept
{
    FaceSpec spec{};
    const Status st = ParseExpression(expression, spec.expression);
    if (st != Status::Ok) {
        ESP_LOGD(TAG_, "face '%s' rejected: %s", expression ? expression : "(null)", StatusToName(st));
        return st;
    }
    spec.color = color;
    spec.compact = compact;
    return Face(spec);
}

// ------------- TEXT & PRIMITIVES -------------

roundscreen::Status roundscreen::FrameController::Text(const char* text, Cardinal at, const Rgb& color,
                                                       FontSize size) noexcept
{
    beginDraw_(WidgetRole::Primitive, "text");
    size_t len = 0;
    Status st = ValidateText(text, len);
    if (st != Status::Ok) {
        return finishDraw_(st, "text");
    }
    const Point p = ResolveCardinal(geo_, at, len, size);
    NativeColor native = 0;
    st = context_().Native(color, native);
    if (st != Status::Ok) {
        return finishDraw_(st, "text");
    }
    return finishDraw_(DrawText(*backend_, text, p.x, p.y, native, size), "text");
}

roundscreen::Status roundscreen::FrameController::TextAt(const char* text, int16_t x, int16_t y, const Rgb& color,
                                                         FontSize size) noexcept
{
    beginDraw_(WidgetRole::Primitive, "text");
    NativeColor native = 0;
    const Status st = context_().Native(color, native);
    if (st != Status::Ok) {
        return finishDraw_(st, "text");
    }
    return finishDraw_(DrawText(*backend_, text, x, y, native, size), "text");
}

roundscreen::Status roundscreen::FrameController::Line(int16_t x0, int16_t y0, int16_t x1, int16_t y1,
                                                       const Rgb& color) noexcept
{
    beginDraw_(WidgetRole::Primitive, "line");
    NativeColor native = 0;
    const Status st = context_().Native(color, native);
    if (st == Status::Ok) {
        backend_->DrawLine(x0, y0, x1, y1, native);
    }
    return finishDraw_(st, "line");
}

roundscreen::Status roundscreen::FrameController::Circle(int16_t cx, int16_t cy, int16_t r, const Rgb& color,
                                                         bool fill) noexcept
{
    beginDraw_(WidgetRole::Primitive, "circle");
    NativeColor native = 0;
    const Status st = context_().Native(color, native);
    if (st == Status::Ok) {
        if (fill) {
            backend_->FillCircle(cx, cy, r, native);
        } else {
            backend_->DrawCircle(cx, cy, r, native);
        }
    }
    return finishDraw_(st, "circle");
}

roundscreen::Status roundscreen::FrameController::Rect(int16_t x, int16_t y, int16_t w, int16_t h, const Rgb& color,
                                                       bool fill) noexcept
{
    beginDraw_(WidgetRole::Primitive, "rect");
    NativeColor native = 0;
    const Status st = context_().Native(color, native);
    if (st == Status::Ok) {
        if (fill) {
            backend_->FillRect(x, y, w, h, native);
        } else {
            backend_->DrawRect(x, y, w, h, native);
        }
    }
    return finishDraw_(st, "rect");
}

roundscreen::Status roundscreen::FrameController::Pixel(int16_t x, int16_t y, const Rgb& color) noexcept
{
    beginDraw_(WidgetRole::Primitive, "pixel");
    NativeColor native = 0;
    const Status st = context_().Native(color, native);
    if (st == Status::Ok) {
        backend_->SetPixel(x, y, native);
    }
    return finishDraw_(st, "pixel");
}
