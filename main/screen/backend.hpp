/**
 * @file backend.hpp
 * @brief Drawing surface capability set implemented once per physical or simulated display.
 * @details Colors passed to a backend are already native (see color.hpp).
 *          Only the pixel write, buffer control and description calls are
 *          mandatory; every other primitive has a portable rasterization
 *          built on SetPixel that a backend may replace with a native one.
 *          Coordinates outside the framebuffer must be ignored (clipped).
 */

#pragma once

#include <cstdint>

#include "color.hpp"
#include "geometry.hpp"

namespace roundscreen {

/**
 * @brief 1-bit bitmap drawn in a single color
 */
struct Bitmap {
    const uint8_t* rows = nullptr;  ///< (width+7)/8 bytes per row, MSB = leftmost pixel
    int16_t width = 0;              ///< Width in bitmap pixels
    int16_t height = 0;             ///< Height in bitmap pixels
    int16_t scale = 1;              ///< Output pixels per bitmap pixel (>= 1)
    NativeColor color = 0;          ///< Color of set bits; clear bits are left untouched
};

/**
 * @brief Abstract display backend
 */
class Backend {
public:
    virtual ~Backend() = default;

    virtual int16_t Width() const noexcept = 0;
    virtual int16_t Height() const noexcept = 0;

    /**
     * @brief Native pixel encoding, consulted by the color model
     */
    virtual ColorDepth GetColorDepth() const noexcept = 0;

    virtual void SetPixel(int16_t x, int16_t y, NativeColor color) noexcept = 0;

    /**
     * @brief Zero the whole frame buffer (black)
     */
    virtual void ClearBuffer() noexcept = 0;

    /**
     * @brief Flush the frame buffer to the device
     * @details May block on the transport. Does not clear the buffer.
     */
    virtual void Present() noexcept = 0;

    virtual void DrawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, NativeColor color) noexcept;
    virtual void DrawHLine(int16_t x, int16_t y, int16_t w, NativeColor color) noexcept;
    virtual void DrawVLine(int16_t x, int16_t y, int16_t h, NativeColor color) noexcept;
    virtual void FillRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept;
    virtual void DrawRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept;
    virtual void DrawCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept;
    virtual void FillCircle(int16_t cx, int16_t cy, int16_t r, NativeColor color) noexcept;
    virtual void Blit(const Bitmap& bitmap, int16_t x, int16_t y) noexcept;

    /**
     * @brief Fill a ring sector
     * @details Angles are in degrees on screen axes: 0 points east and
     *          angles grow clockwise (y grows downwards).
     * @param cx,cy Ring center
     * @param r_outer Outer radius (inclusive)
     * @param r_inner Inner radius (inclusive)
     * @param start_deg Sector start angle
     * @param sweep_deg Clockwise extent; <= 0 draws nothing, >= 360 draws the full ring
     * @param color Native color
     */
    virtual void FillArc(int16_t cx, int16_t cy, int16_t r_outer, int16_t r_inner, float start_deg,
                         float sweep_deg, NativeColor color) noexcept;

    virtual void FillTriangle(Point a, Point b, Point c, NativeColor color) noexcept;

    /**
     * @brief Draw one font glyph into a cell of cell x cell pixels
     * @details Multiples of 8 are integer blits of the 8x8 glyph; other cell
     *          sizes sample the glyph nearest-neighbour (floor mapping).
     *          Characters without a glyph draw nothing.
     * @param c Character
     * @param x,y Top-left corner of the cell
     * @param color Native color
     * @param cell Cell side in pixels
     */
    virtual void DrawGlyph(char c, int16_t x, int16_t y, NativeColor color, int16_t cell) noexcept;
};

} // namespace roundscreen
