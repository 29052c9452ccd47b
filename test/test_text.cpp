#include <gtest/gtest.h>

#include "recording_backend.hpp"
#include "screen/text.hpp"

using namespace roundscreen;
using roundscreen::test::RecordingBackend;

TEST(Text, ValidateReportsLength)
{
    size_t len = 99;
    EXPECT_EQ(ValidateText("Hello", len), Status::Ok);
    EXPECT_EQ(len, 5u);
    EXPECT_EQ(ValidateText(nullptr, len), Status::Ok);
    EXPECT_EQ(len, 0u);
    EXPECT_EQ(ValidateText("tab\there", len), Status::UnsupportedGlyph);
    EXPECT_EQ(ValidateText("caf\xC3\xA9", len), Status::UnsupportedGlyph);
}

TEST(Text, UnsupportedGlyphDrawsNothing)
{
    MemoryBackend backend(128, 128, ColorDepth::Grayscale4);
    EXPECT_EQ(DrawText(backend, "AB\x7F", 10, 10, 15), Status::UnsupportedGlyph);
    EXPECT_EQ(backend.CountLit(), 0u);
}

TEST(Text, CellSizes)
{
    EXPECT_EQ(CellSize(FontSize::Small), 7);
    EXPECT_EQ(CellSize(FontSize::Normal), 8);
    EXPECT_EQ(CellSize(FontSize::Medium), 10);
    EXPECT_EQ(CellSize(FontSize::Double), 16);
    EXPECT_EQ(CellSize(FontSize::Triple), 24);
    EXPECT_EQ(TextWidth(5, FontSize::Small), 35);
    EXPECT_EQ(TextWidth(3, FontSize::Medium), 30);
}

TEST(Text, GlyphsAdvanceByCell)
{
    RecordingBackend backend(128, 128, ColorDepth::Grayscale4);
    ASSERT_EQ(DrawText(backend, "abc", 5, 7, 15, FontSize::Medium), Status::Ok);
    ASSERT_EQ(backend.glyphs.size(), 3u);
    EXPECT_EQ(backend.glyphs[0].x, 5);
    EXPECT_EQ(backend.glyphs[1].x, 15);
    EXPECT_EQ(backend.glyphs[2].x, 25);
    EXPECT_EQ(backend.glyphs[2].y, 7);
    EXPECT_EQ(backend.glyphs[2].cell, 10);
}

TEST(Text, CenteredText)
{
    RecordingBackend backend(128, 128, ColorDepth::Grayscale4);
    ASSERT_EQ(DrawCenteredText(backend, "AB", 64, 20, 9), Status::Ok);
    ASSERT_EQ(backend.glyphs.size(), 2u);
    EXPECT_EQ(backend.glyphs[0].x, 56);
    EXPECT_EQ(backend.glyphs[1].x, 64);
}

TEST(Text, ScaledTextAcceptsOnlyIntegerScales)
{
    RecordingBackend backend(128, 128, ColorDepth::Grayscale4);
    EXPECT_EQ(DrawScaledText(backend, "1", 0, 0, 15, 1.5f), Status::InvalidScale);
    EXPECT_EQ(DrawScaledText(backend, "1", 0, 0, 15, 4.0f), Status::InvalidScale);
    EXPECT_EQ(DrawScaledText(backend, "1", 0, 0, 15, 0.0f), Status::InvalidScale);
    EXPECT_TRUE(backend.glyphs.empty());

    EXPECT_EQ(DrawScaledText(backend, "1", 0, 0, 15, 3.0f), Status::Ok);
    ASSERT_EQ(backend.glyphs.size(), 1u);
    EXPECT_EQ(backend.glyphs[0].cell, 24);
}

TEST(Text, SmallGlyphStaysInItsCell)
{
    MemoryBackend backend(32, 32, ColorDepth::Grayscale4);
    ASSERT_EQ(DrawText(backend, "M", 4, 4, 15, FontSize::Small), Status::Ok);
    EXPECT_GT(backend.CountLit(), 0u);
    for (int16_t y = 0; y < 32; ++y) {
        for (int16_t x = 0; x < 32; ++x) {
            if (backend.PixelAt(x, y) != 0) {
                EXPECT_GE(x, 4);
                EXPECT_LT(x, 11);
                EXPECT_GE(y, 4);
                EXPECT_LT(y, 11);
            }
        }
    }
}

TEST(Text, DoubleGlyphIsExactBlowUp)
{
    MemoryBackend normal(16, 16, ColorDepth::Grayscale4);
    MemoryBackend doubled(16, 16, ColorDepth::Grayscale4);
    ASSERT_EQ(DrawText(normal, "K", 0, 0, 15), Status::Ok);
    ASSERT_EQ(DrawText(doubled, "K", 0, 0, 15, FontSize::Double), Status::Ok);
    for (int16_t y = 0; y < 16; ++y) {
        for (int16_t x = 0; x < 16; ++x) {
            EXPECT_EQ(doubled.PixelAt(x, y), normal.PixelAt(static_cast<int16_t>(x / 2), static_cast<int16_t>(y / 2)));
        }
    }
}

TEST(Text, CardinalPlacementOn128)
{
    // 4 chars: 32 px wide, fits the chord well above the 8 px edge margin
    Point n = ResolveCardinal(kRound128, Cardinal::N, 4, FontSize::Normal);
    EXPECT_EQ(n.x, 48);
    EXPECT_EQ(n.y, 8);

    Point s = ResolveCardinal(kRound128, Cardinal::S, 4, FontSize::Normal);
    EXPECT_EQ(s.y, 112);

    Point w = ResolveCardinal(kRound128, Cardinal::W, 4, FontSize::Normal);
    EXPECT_EQ(w.x, 12);
    EXPECT_EQ(w.y, 60);

    Point e = ResolveCardinal(kRound128, Cardinal::E, 4, FontSize::Normal);
    EXPECT_EQ(e.x, 84);

    Point c = ResolveCardinal(kRound128, Cardinal::Center, 4, FontSize::Normal);
    EXPECT_EQ(c.x, 48);
    EXPECT_EQ(c.y, 60);
}

TEST(Text, WideTextIsPushedInward)
{
    const Point narrow = ResolveCardinal(kRound128, Cardinal::N, 4, FontSize::Normal);
    const Point wide = ResolveCardinal(kRound128, Cardinal::N, 12, FontSize::Normal);
    EXPECT_GT(wide.y, narrow.y);

    // The row of a wide run must leave the run inside the disc
    const int16_t half = kRound128.HalfChord(wide.y);
    EXPECT_GE(2 * half, TextWidth(12, FontSize::Normal));

    // Full-width text is pushed to the center row
    const Point full = ResolveCardinal(kRound128, Cardinal::N, 16, FontSize::Normal);
    EXPECT_EQ(full.y, 64);
}

TEST(Text, ParseCardinal)
{
    Cardinal at = Cardinal::Center;
    EXPECT_TRUE(ParseCardinal("NE", at));
    EXPECT_EQ(at, Cardinal::NE);
    EXPECT_TRUE(ParseCardinal("CENTER", at));
    EXPECT_EQ(at, Cardinal::Center);
    EXPECT_FALSE(ParseCardinal("north", at));
    EXPECT_FALSE(ParseCardinal(nullptr, at));
    EXPECT_EQ(at, Cardinal::Center);
}
