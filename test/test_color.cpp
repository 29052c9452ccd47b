#include <gtest/gtest.h>

#include "screen/color.hpp"

using namespace roundscreen;

namespace {

NativeColor gray4(const Rgb& c)
{
    NativeColor out = 0xFFFF;
    EXPECT_EQ(ToNative(c, ColorDepth::Grayscale4, out), Status::Ok);
    return out;
}

NativeColor rgb565(const Rgb& c)
{
    NativeColor out = 0;
    EXPECT_EQ(ToNative(c, ColorDepth::Rgb565, out), Status::Ok);
    return out;
}

} // namespace

TEST(ColorModel, GrayRampLandsOnExactIndices)
{
    EXPECT_EQ(gray4(colors::black), 0);
    EXPECT_EQ(gray4(colors::dark), 6);
    EXPECT_EQ(gray4(colors::gray), 9);
    EXPECT_EQ(gray4(colors::light), 11);
    EXPECT_EQ(gray4(colors::white), 15);
}

TEST(ColorModel, AccentsCollapseToChannelMean)
{
    // One full channel averages to gray 85, two to 170
    EXPECT_EQ(gray4(colors::green), 5);
    EXPECT_EQ(gray4(colors::red), 5);
    EXPECT_EQ(gray4(colors::blue), 5);
    EXPECT_EQ(gray4(colors::yellow), 10);
}

TEST(ColorModel, Rgb565Packing)
{
    EXPECT_EQ(rgb565(colors::black), 0x0000);
    EXPECT_EQ(rgb565(colors::white), 0xFFFF);
    EXPECT_EQ(rgb565(colors::red), 0xF800);
    EXPECT_EQ(rgb565(colors::green), 0x07E0);
    EXPECT_EQ(rgb565(colors::blue), 0x001F);
    EXPECT_EQ(rgb565(Rgb{7, 3, 7}), 0x0000);  // truncated, not rounded
}

TEST(ColorModel, OutOfRangeChannelIsRejected)
{
    NativeColor out = 1234;
    EXPECT_EQ(ToNative(Rgb{256, 0, 0}, ColorDepth::Rgb565, out), Status::InvalidColor);
    EXPECT_EQ(ToNative(Rgb{0, -1, 0}, ColorDepth::Grayscale4, out), Status::InvalidColor);
    EXPECT_EQ(ToNative(Rgb{0, 0, 300}, ColorDepth::Grayscale4, out), Status::InvalidColor);
    EXPECT_EQ(out, 1234) << "output must be untouched on failure";
}

TEST(ColorModel, NativeToRgbExpandsBack)
{
    EXPECT_EQ(NativeToRgb(9, ColorDepth::Grayscale4), colors::gray);
    EXPECT_EQ(NativeToRgb(15, ColorDepth::Grayscale4), colors::white);
    EXPECT_EQ(NativeToRgb(0xFFFF, ColorDepth::Rgb565), colors::white);
    EXPECT_EQ(NativeToRgb(0xF800, ColorDepth::Rgb565), colors::red);
}

TEST(Status, EveryCodeHasAName)
{
    EXPECT_STREQ(StatusToName(Status::Ok), "Ok");
    EXPECT_STREQ(StatusToName(Status::TextTooLong), "TextTooLong");
    EXPECT_STREQ(StatusToName(Status::TooManyLines), "TooManyLines");
    EXPECT_STREQ(StatusToName(static_cast<Status>(200)), "Unknown");
}
