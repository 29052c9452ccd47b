/**
 * @file canvas_backend.hpp
 * @brief M5GFX backend: renders into an off-screen sprite, pushes it on Present().
 * @details Double buffering keeps widget redraws flicker free. The sprite is
 *          16-bit for RGB565 panels; grayscale panels get a 4-bit palette
 *          sprite whose 16 entries form a linear gray ramp, so a native gray
 *          index is also the palette index.
 */

#pragma once

#include <cstdint>

#include <M5GFX.h>

#include "backend.hpp"

namespace roundscreen {

class CanvasBackend : public Backend {
public:
    /**
     * @brief Bind to a display
     * @param target Display the sprite is pushed to (e.g. &M5.Display)
     * @param depth Native encoding of the sprite
     */
    CanvasBackend(lgfx::LovyanGFX* target, ColorDepth depth) noexcept;
    ~CanvasBackend() override;

    CanvasBackend(const CanvasBackend&) = delete;
    CanvasBackend& operator=(const CanvasBackend&) = delete;

    /**
     * @brief Allocate the sprite (and palette)
     * @return true on success
     */
    bool Init(int16_t width, int16_t height) noexcept;

    int16_t Width() const noexcept override { return width_; }
    int16_t Height() const noexcept override { return height_; }
    ColorDepth GetColorDepth() const noexcept override { return depth_; }

    void SetPixel(int16_t x, int16_t y, NativeColor color) noexcept override;
    void ClearBuffer() noexcept override;
    void Present() noexcept override;

    void DrawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, NativeColor color) noexcept override;
    void DrawHLine(int16_t x, int16_t y, int16_t w, NativeColor color) noexcept override;
    void DrawVLine(int16_t x, int16_t y, int16_t h, NativeColor color) noexcept override;
    void FillRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept override;
    void DrawRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept override;
    void DrawCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept override;
    void FillCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept override;
    void FillArc(int16_t cx, int16_t cy, int16_t r_outer, int16_t r_inner, float start_deg, float sweep_deg,
                 NativeColor color) noexcept override;
    void FillTriangle(Point a, Point b, Point c, NativeColor color) noexcept override;

private:
    lgfx::LovyanGFX* target_;
    LGFX_Sprite* canvas_ = nullptr;
    ColorDepth depth_;
    int16_t width_ = 0;
    int16_t height_ = 0;
};

} // namespace roundscreen
