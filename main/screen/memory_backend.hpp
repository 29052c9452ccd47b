/**
 * @file memory_backend.hpp
 * @brief In-memory framebuffer backend (simulator).
 * @details Stores one native color per pixel. Present() copies the buffer to
 *          the "device" side, so tests can inspect exactly what was sent.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "backend.hpp"

namespace roundscreen {

class MemoryBackend : public Backend {
public:
    MemoryBackend(int16_t width, int16_t height, ColorDepth depth) noexcept;

    int16_t Width() const noexcept override { return width_; }
    int16_t Height() const noexcept override { return height_; }
    ColorDepth GetColorDepth() const noexcept override { return depth_; }

    void SetPixel(int16_t x, int16_t y, NativeColor color) noexcept override;
    void DrawHLine(int16_t x, int16_t y, int16_t w, NativeColor color) noexcept override;
    void FillRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept override;
    void ClearBuffer() noexcept override;
    void Present() noexcept override;

    /**
     * @brief Pixel in the working buffer
     * @return Native color, 0 outside the framebuffer
     */
    NativeColor PixelAt(int16_t x, int16_t y) const noexcept;

    /// Working buffer, row-major
    const std::vector<NativeColor>& Buffer() const noexcept { return buffer_; }

    /// Last frame flushed by Present() (empty before the first Present)
    const std::vector<NativeColor>& PresentedFrame() const noexcept { return presented_; }

    /// Number of Present() calls so far
    uint32_t PresentCount() const noexcept { return present_count_; }

    /// CRC32 of the working buffer, for reproducible-output checks
    uint32_t Crc32() const noexcept;

    /// Number of non-black pixels in the working buffer
    size_t CountLit() const noexcept;

private:
    int16_t width_;
    int16_t height_;
    ColorDepth depth_;
    std::vector<NativeColor> buffer_;
    std::vector<NativeColor> presented_;
    uint32_t present_count_ = 0;
};

} // namespace roundscreen
