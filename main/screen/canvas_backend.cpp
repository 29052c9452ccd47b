#include "canvas_backend.hpp"

#include "esp_log.h"

#include <algorithm>

static const char* TAG_ = "canvas";

roundscreen::CanvasBackend::CanvasBackend(lgfx::LovyanGFX* target, ColorDepth depth) noexcept
    : target_(target)
    , depth_(depth)
{
}

roundscreen::CanvasBackend::~CanvasBackend()
{
    if (canvas_ != nullptr) {
        canvas_->deleteSprite();
        delete canvas_;
        canvas_ = nullptr;
    }
}

bool roundscreen::CanvasBackend::Init(int16_t width, int16_t height) noexcept
{
    if (target_ == nullptr) {
        ESP_LOGE(TAG_, "No target display");
        return false;
    }
    if (canvas_ == nullptr) {
        canvas_ = new LGFX_Sprite(target_);
    }

    canvas_->setColorDepth(static_cast<int>(depth_));
    if (canvas_->createSprite(width, height) == nullptr) {
        ESP_LOGE(TAG_, "Failed to create %dx%d sprite (%d bpp)", width, height, static_cast<int>(depth_));
        return false;
    }

    if (depth_ == ColorDepth::Grayscale4) {
        if (!canvas_->createPalette()) {
            ESP_LOGE(TAG_, "Failed to create gray palette");
            return false;
        }
        for (uint16_t index = 0; index < 16; ++index) {
            const Rgb level = NativeToRgb(index, depth_);
            canvas_->setPaletteColor(index, static_cast<uint8_t>(level.r), static_cast<uint8_t>(level.g),
                                     static_cast<uint8_t>(level.b));
        }
    }

    width_ = width;
    height_ = height;
    canvas_->fillScreen(0);
    ESP_LOGI(TAG_, "Canvas %dx%d ready (%d bpp)", width_, height_, static_cast<int>(depth_));
    return true;
}

void roundscreen::CanvasBackend::SetPixel(int16_t x, int16_t y, NativeColor color) noexcept
{
    if (canvas_ == nullptr) {
        return;
    }
    canvas_->drawPixel(x, y, color);
}

void roundscreen::CanvasBackend::ClearBuffer() noexcept
{
    if (canvas_ == nullptr) {
        return;
    }
    canvas_->fillScreen(0);
}

void roundscreen::CanvasBackend::Present() noexcept
{
    if (canvas_ == nullptr) {
        return;
    }
    canvas_->pushSprite(target_, 0, 0);
}

void roundscreen::CanvasBackend::DrawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, NativeColor color) noexcept
{
    if (canvas_ == nullptr) {
        return;
    }
    canvas_->drawLine(x0, y0, x1, y1, color);
}

void roundscreen::CanvasBackend::DrawHLine(int16_t x, int16_t y, int16_t w, NativeColor color) noexcept
{
    if (canvas_ == nullptr || w <= 0) {
        return;
    }
    canvas_->drawFastHLine(x, y, w, color);
}

void roundscreen::CanvasBackend::DrawVLine(int16_t x, int16_t y, int16_t h, NativeColor color) noexcept
{
    if (canvas_ == nullptr || h <= 0) {
        return;
    }
    canvas_->drawFastVLine(x, y, h, color);
}

void roundscreen::CanvasBackend::FillRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept
{
    if (canvas_ == nullptr || w <= 0 || h <= 0) {
        return;
    }
    canvas_->fillRect(x, y, w, h, color);
}

void roundscreen::CanvasBackend::DrawRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept
{
    if (canvas_ == nullptr || w <= 0 || h <= 0) {
        return;
    }
    canvas_->drawRect(x, y, w, h, color);
}

void roundscreen::CanvasBackend::DrawCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept
{
    if (canvas_ == nullptr || r < 0) {
        return;
    }
    canvas_->drawCircle(cx, cy, r, color);
}

void roundscreen::CanvasBackend::FillCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept
{
    if (canvas_ == nullptr || r < 0) {
        return;
    }
    canvas_->fillCircle(cx, cy, r, color);
}

void roundscreen::CanvasBackend::FillArc(int16_t cx, int16_t cy, int16_t r_outer, int16_t r_inner, float start_deg,
                                         float sweep_deg, NativeColor color) noexcept
{
    if (canvas_ == nullptr || !(sweep_deg > 0.0f) || r_outer < 0) {
        return;
    }
    // M5GFX angles share the screen convention: degrees, 0 = east, clockwise
    const float end_deg = start_deg + std::min(sweep_deg, 360.0f);
    canvas_->fillArc(cx, cy, r_outer, std::max<int16_t>(r_inner, 0), start_deg, end_deg, color);
}

void roundscreen::CanvasBackend::FillTriangle(Point a, Point b, Point c, NativeColor color) noexcept
{
    if (canvas_ == nullptr) {
        return;
    }
    canvas_->fillTriangle(a.x, a.y, b.x, b.y, c.x, c.y, color);
}
