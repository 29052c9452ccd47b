#include "memory_backend.hpp"

#include "crc32.hpp"

#include <algorithm>

roundscreen::MemoryBackend::MemoryBackend(int16_t width, int16_t height, ColorDepth depth) noexcept
    : width_(width)
    , height_(height)
    , depth_(depth)
    , buffer_(static_cast<size_t>(std::max<int16_t>(width, 0)) * static_cast<size_t>(std::max<int16_t>(height, 0)), 0)
{
}

void roundscreen::MemoryBackend::SetPixel(int16_t x, int16_t y, NativeColor color) noexcept
{
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return;
    }
    buffer_[static_cast<size_t>(y) * width_ + x] = color;
}

void roundscreen::MemoryBackend::DrawHLine(int16_t x, int16_t y, int16_t w, NativeColor color) noexcept
{
    if (y < 0 || y >= height_ || w <= 0) {
        return;
    }
    const int32_t x0 = std::max<int32_t>(x, 0);
    const int32_t x1 = std::min<int32_t>(static_cast<int32_t>(x) + w, width_);
    if (x0 >= x1) {
        return;
    }
    auto row = buffer_.begin() + static_cast<ptrdiff_t>(y) * width_;
    std::fill(row + x0, row + x1, color);
}

void roundscreen::MemoryBackend::FillRect(int16_t x, int16_t y, int16_t w, int16_t h, NativeColor color) noexcept
{
    const int32_t y0 = std::max<int32_t>(y, 0);
    const int32_t y1 = std::min<int32_t>(static_cast<int32_t>(y) + h, height_);
    for (int32_t row = y0; row < y1; ++row) {
        DrawHLine(x, static_cast<int16_t>(row), w, color);
    }
}

void roundscreen::MemoryBackend::ClearBuffer() noexcept
{
    std::fill(buffer_.begin(), buffer_.end(), 0);
}

void roundscreen::MemoryBackend::Present() noexcept
{
    presented_ = buffer_;
    ++present_count_;
}

roundscreen::NativeColor roundscreen::MemoryBackend::PixelAt(int16_t x, int16_t y) const noexcept
{
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return 0;
    }
    return buffer_[static_cast<size_t>(y) * width_ + x];
}

uint32_t roundscreen::MemoryBackend::Crc32() const noexcept
{
    return Crc32Ieee(reinterpret_cast<const uint8_t*>(buffer_.data()), buffer_.size() * sizeof(NativeColor));
}

size_t roundscreen::MemoryBackend::CountLit() const noexcept
{
    return static_cast<size_t>(std::count_if(buffer_.begin(), buffer_.end(),
                                              [](NativeColor c) { return c != 0; }));
}
