#include <gtest/gtest.h>

#include "screen/crc32.hpp"
#include "screen/memory_backend.hpp"

#include <cmath>
#include <cstring>
#include <limits>

using namespace roundscreen;

TEST(MemoryBackend, ClipsOutsideFramebuffer)
{
    MemoryBackend backend(128, 128, ColorDepth::Grayscale4);
    backend.SetPixel(-1, 0, 15);
    backend.SetPixel(128, 5, 15);
    backend.SetPixel(3, 200, 15);
    EXPECT_EQ(backend.CountLit(), 0u);

    backend.FillRect(-5, -5, 10, 10, 15);
    EXPECT_EQ(backend.CountLit(), 25u);
    EXPECT_EQ(backend.PixelAt(-1, -1), 0);
}

TEST(MemoryBackend, Lines)
{
    MemoryBackend backend(32, 32, ColorDepth::Rgb565);
    backend.DrawLine(0, 0, 9, 0, 0xFFFF);
    EXPECT_EQ(backend.CountLit(), 10u);

    backend.ClearBuffer();
    backend.DrawLine(4, 4, 0, 0, 0xFFFF);
    EXPECT_EQ(backend.CountLit(), 5u);
    EXPECT_EQ(backend.PixelAt(0, 0), 0xFFFF);
    EXPECT_EQ(backend.PixelAt(4, 4), 0xFFFF);

    backend.ClearBuffer();
    backend.DrawVLine(2, 3, 4, 1);
    backend.DrawHLine(10, 3, 0, 1);
    EXPECT_EQ(backend.CountLit(), 4u);
}

TEST(MemoryBackend, Circles)
{
    MemoryBackend backend(32, 32, ColorDepth::Grayscale4);
    backend.FillCircle(10, 10, 3, 15);
    EXPECT_EQ(backend.CountLit(), 29u);

    backend.ClearBuffer();
    backend.DrawCircle(16, 16, 5, 15);
    EXPECT_EQ(backend.PixelAt(21, 16), 15);
    EXPECT_EQ(backend.PixelAt(16, 11), 15);
    EXPECT_EQ(backend.PixelAt(16, 16), 0);
}

TEST(MemoryBackend, BlitScalesRuns)
{
    MemoryBackend backend(16, 16, ColorDepth::Grayscale4);
    const uint8_t rows[] = {0xA0};  // 1 0 1
    Bitmap bitmap{};
    bitmap.rows = rows;
    bitmap.width = 3;
    bitmap.height = 1;
    bitmap.scale = 2;
    bitmap.color = 7;
    backend.Blit(bitmap, 0, 0);

    EXPECT_EQ(backend.CountLit(), 8u);
    EXPECT_EQ(backend.PixelAt(1, 1), 7);
    EXPECT_EQ(backend.PixelAt(2, 0), 0);
    EXPECT_EQ(backend.PixelAt(5, 1), 7);
}

TEST(MemoryBackend, PresentCopiesWithoutClearing)
{
    MemoryBackend backend(8, 8, ColorDepth::Grayscale4);
    EXPECT_TRUE(backend.PresentedFrame().empty());

    backend.SetPixel(1, 1, 15);
    backend.Present();
    EXPECT_EQ(backend.PresentCount(), 1u);
    EXPECT_EQ(backend.PresentedFrame(), backend.Buffer());
    EXPECT_EQ(backend.PixelAt(1, 1), 15);

    backend.SetPixel(2, 2, 15);
    EXPECT_NE(backend.PresentedFrame(), backend.Buffer());
}

TEST(MemoryBackend, FrameFingerprint)
{
    MemoryBackend a(64, 64, ColorDepth::Rgb565);
    MemoryBackend b(64, 64, ColorDepth::Rgb565);
    a.FillCircle(32, 32, 10, 0x07E0);
    b.FillCircle(32, 32, 10, 0x07E0);
    EXPECT_EQ(a.Crc32(), b.Crc32());

    b.SetPixel(0, 0, 1);
    EXPECT_NE(a.Crc32(), b.Crc32());
}

TEST(Crc32, MatchesIeeeCheckValue)
{
    const char* check = "123456789";
    EXPECT_EQ(Crc32Ieee(reinterpret_cast<const uint8_t*>(check), std::strlen(check)), 0xCBF43926u);

    // Chained computation equals the one-shot checksum
    const uint32_t head = Crc32Ieee(reinterpret_cast<const uint8_t*>(check), 4);
    EXPECT_EQ(Crc32Ieee(reinterpret_cast<const uint8_t*>(check) + 4, 5, head), 0xCBF43926u);
}

TEST(Raster, FullRing)
{
    MemoryBackend backend(64, 64, ColorDepth::Grayscale4);
    backend.FillArc(32, 32, 20, 16, 0.0f, 360.0f, 15);
    EXPECT_EQ(backend.PixelAt(50, 32), 15);
    EXPECT_EQ(backend.PixelAt(32, 14), 15);
    EXPECT_EQ(backend.PixelAt(32, 32), 0);
    EXPECT_EQ(backend.PixelAt(32 + 21, 32), 0);
}

TEST(Raster, ArcSectorFollowsScreenAngles)
{
    MemoryBackend backend(64, 64, ColorDepth::Grayscale4);
    // 135 -> 225 degrees: lower-left through west to upper-left
    backend.FillArc(32, 32, 20, 16, 135.0f, 90.0f, 15);
    EXPECT_EQ(backend.PixelAt(32 - 18, 32), 15);
    EXPECT_EQ(backend.PixelAt(32 + 18, 32), 0);
    EXPECT_EQ(backend.PixelAt(32, 32 - 18), 0);
    EXPECT_EQ(backend.PixelAt(32, 32 + 18), 0);

    backend.ClearBuffer();
    backend.FillArc(32, 32, 20, 16, 135.0f, 0.0f, 15);
    EXPECT_EQ(backend.CountLit(), 0u);
    backend.FillArc(32, 32, 20, 16, 135.0f, std::nanf(""), 15);
    EXPECT_EQ(backend.CountLit(), 0u);
}

TEST(Raster, Triangle)
{
    MemoryBackend backend(16, 16, ColorDepth::Grayscale4);
    backend.FillTriangle(Point{0, 0}, Point{4, 0}, Point{0, 4}, 15);
    EXPECT_EQ(backend.CountLit(), 15u);
    EXPECT_EQ(backend.PixelAt(0, 4), 15);
    EXPECT_EQ(backend.PixelAt(4, 4), 0);
}

TEST(Raster, PolarPointBearings)
{
    const Point c{64, 64};
    const Point north = PolarPoint(c, 10.0f, 0.0f);
    const Point east = PolarPoint(c, 10.0f, 90.0f);
    const Point south = PolarPoint(c, 10.0f, 180.0f);
    EXPECT_EQ(north.x, 64);
    EXPECT_EQ(north.y, 54);
    EXPECT_EQ(east.x, 74);
    EXPECT_EQ(east.y, 64);
    EXPECT_EQ(south.y, 74);
}

TEST(Raster, PolarPointIgnoresNonFiniteInput)
{
    const Point c{64, 64};
    const Point nan_bearing = PolarPoint(c, 10.0f, std::nanf(""));
    EXPECT_EQ(nan_bearing.x, 64);
    EXPECT_EQ(nan_bearing.y, 64);

    const Point inf_length = PolarPoint(c, std::numeric_limits<float>::infinity(), 45.0f);
    EXPECT_EQ(inf_length.x, 64);
    EXPECT_EQ(inf_length.y, 64);
}

namespace {

/// Backend whose shape fills are native: records the call, rasterizes nothing
class NativeShapeBackend : public MemoryBackend {
public:
    NativeShapeBackend() noexcept
        : MemoryBackend(64, 64, ColorDepth::Grayscale4)
    {
    }

    void FillArc(int16_t, int16_t, int16_t, int16_t, float, float, NativeColor) noexcept override { ++arc_calls; }
    void FillTriangle(Point, Point, Point, NativeColor) noexcept override { ++triangle_calls; }

    uint32_t arc_calls = 0;
    uint32_t triangle_calls = 0;
};

} // namespace

TEST(Raster, ShapeFillsDispatchThroughTheBackend)
{
    NativeShapeBackend native;
    Backend& backend = native;
    backend.FillArc(32, 32, 20, 16, 0.0f, 360.0f, 15);
    backend.FillTriangle(Point{0, 0}, Point{4, 0}, Point{0, 4}, 15);
    EXPECT_EQ(native.arc_calls, 1u);
    EXPECT_EQ(native.triangle_calls, 1u);
    EXPECT_EQ(native.CountLit(), 0u);
}
