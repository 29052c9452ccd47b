#include <gtest/gtest.h>

#include "recording_backend.hpp"
#include "screen/frame_controller.hpp"

#include <memory>

using namespace roundscreen;
using roundscreen::test::RecordingBackend;

namespace {

class FrameControllerTest : public ::testing::Test {
protected:
    void SetUp() override { make(kRound128, ColorDepth::Grayscale4); }

    void make(const GeometryProfile& geo, ColorDepth depth)
    {
        auto backend = std::make_unique<RecordingBackend>(geo.width, geo.height, depth);
        backend_ = backend.get();
        frame_ = std::make_unique<FrameController>(geo, std::move(backend));
    }

    RecordingBackend* backend_ = nullptr;
    std::unique_ptr<FrameController> frame_;
};

} // namespace

TEST_F(FrameControllerTest, StateFollowsClearDrawPresent)
{
    EXPECT_EQ(frame_->State(), FrameState::Idle);
    frame_->Clear();
    EXPECT_EQ(frame_->State(), FrameState::Cleared);
    EXPECT_EQ(backend_->clears, 1u);

    ASSERT_EQ(frame_->Title("Hi"), Status::Ok);
    EXPECT_EQ(frame_->State(), FrameState::Drawing);
    frame_->Present();
    EXPECT_EQ(frame_->State(), FrameState::Idle);
    EXPECT_EQ(backend_->PresentCount(), 1u);
}

TEST_F(FrameControllerTest, PresentTwiceSendsTheSameFrame)
{
    frame_->Clear();
    ASSERT_EQ(frame_->Title("Same"), Status::Ok);
    frame_->Present();
    const auto first = backend_->PresentedFrame();
    frame_->Present();
    EXPECT_EQ(backend_->PresentCount(), 2u);
    EXPECT_EQ(backend_->PresentedFrame(), first);
}

TEST_F(FrameControllerTest, DrawingWithoutClearAccumulates)
{
    frame_->Clear();
    ASSERT_EQ(frame_->Pixel(10, 64), Status::Ok);
    frame_->Present();

    ASSERT_EQ(frame_->Pixel(20, 64), Status::Ok);
    EXPECT_EQ(frame_->State(), FrameState::Drawing);
    EXPECT_EQ(backend_->PixelAt(10, 64), 15);
    EXPECT_EQ(backend_->PixelAt(20, 64), 15);

    frame_->Clear();
    EXPECT_EQ(backend_->CountLit(), 0u);
}

TEST_F(FrameControllerTest, ImmersiveAfterContentIsWarned)
{
    frame_->Clear();
    ASSERT_EQ(frame_->Title("Heading"), Status::Ok);
    CompassSpec compass{};
    ASSERT_EQ(frame_->Compass(compass), Status::Ok);
    EXPECT_EQ(frame_->FrameWarnings(), 1u);

    WatchSpec watch{};
    ASSERT_EQ(frame_->Watch(watch), Status::Ok);
    EXPECT_EQ(frame_->FrameWarnings(), 2u);
    EXPECT_EQ(frame_->LayoutWarnings(), 2u);

    frame_->Clear();
    EXPECT_EQ(frame_->FrameWarnings(), 0u);
    EXPECT_EQ(frame_->LayoutWarnings(), 2u);
}

TEST_F(FrameControllerTest, ContentAfterImmersiveIsAllowed)
{
    frame_->Clear();
    CompassSpec compass{};
    ASSERT_EQ(frame_->Compass(compass), Status::Ok);
    ASSERT_EQ(frame_->Text("42", Cardinal::S), Status::Ok);
    EXPECT_EQ(frame_->FrameWarnings(), 0u);
}

TEST_F(FrameControllerTest, CompactFaceSharesTheScreen)
{
    frame_->Clear();
    ASSERT_EQ(frame_->Title("Mood"), Status::Ok);
    ASSERT_EQ(frame_->Face("happy", colors::green, true), Status::Ok);
    EXPECT_EQ(frame_->FrameWarnings(), 0u);

    ASSERT_EQ(frame_->Face("happy"), Status::Ok);
    EXPECT_EQ(frame_->FrameWarnings(), 1u);
}

TEST_F(FrameControllerTest, UnknownExpressionDrawsNothing)
{
    frame_->Clear();
    EXPECT_EQ(frame_->Face("grumpy"), Status::UnknownExpression);
    EXPECT_EQ(frame_->State(), FrameState::Cleared);
    EXPECT_TRUE(backend_->blits.empty());
}

TEST_F(FrameControllerTest, RejectedWidgetsLeaveTheBufferAlone)
{
    frame_->Clear();
    EXPECT_EQ(frame_->Title("THIS TITLE IS WAY TOO LONG TO FIT"), Status::TextTooLong);

    const char* items[] = {"A", "B"};
    MenuSpec menu{};
    menu.items = items;
    menu.count = 2;
    menu.selected = 5;
    EXPECT_EQ(frame_->Menu(menu), Status::IndexOutOfRange);

    GaugeSpec gauge{};
    gauge.value = 10.0f;
    gauge.min_value = 50.0f;
    gauge.max_value = 50.0f;
    gauge.unit = "mm";
    EXPECT_EQ(frame_->Gauge(gauge), Status::InvalidRange);

    EXPECT_EQ(frame_->Subtitle("a", "b"), Status::Ok);
    const char* three[] = {"a", "b", "c"};
    backend_->Forget();
    EXPECT_EQ(frame_->Subtitle(three, 3), Status::TooManyLines);
    EXPECT_TRUE(backend_->glyphs.empty());
}

TEST_F(FrameControllerTest, PrimitivesRejectInvalidColor)
{
    frame_->Clear();
    const Rgb bad{0, 256, 0};
    EXPECT_EQ(frame_->Line(0, 0, 10, 10, bad), Status::InvalidColor);
    EXPECT_EQ(frame_->Circle(64, 64, 10, bad, true), Status::InvalidColor);
    EXPECT_EQ(frame_->Rect(10, 10, 5, 5, bad), Status::InvalidColor);
    EXPECT_EQ(frame_->Pixel(64, 64, bad), Status::InvalidColor);
    EXPECT_EQ(frame_->Text("x", Cardinal::N, bad), Status::InvalidColor);
    EXPECT_EQ(backend_->CountLit(), 0u);
}

TEST_F(FrameControllerTest, Primitives)
{
    frame_->Clear();
    ASSERT_EQ(frame_->Rect(10, 10, 4, 3, colors::white, true), Status::Ok);
    EXPECT_EQ(backend_->CountLit(), 12u);

    frame_->Clear();
    ASSERT_EQ(frame_->Rect(10, 10, 4, 3, colors::white), Status::Ok);
    EXPECT_EQ(backend_->CountLit(), 10u);
    EXPECT_EQ(backend_->PixelAt(11, 11), 0);

    frame_->Clear();
    ASSERT_EQ(frame_->Circle(64, 64, 3, colors::gray, true), Status::Ok);
    EXPECT_EQ(backend_->CountLit(), 29u);
    EXPECT_EQ(backend_->PixelAt(64, 64), 9);

    frame_->Clear();
    ASSERT_EQ(frame_->Line(0, 5, 9, 5, colors::light), Status::Ok);
    EXPECT_EQ(backend_->CountLit(), 10u);
}

TEST_F(FrameControllerTest, CardinalText)
{
    frame_->Clear();
    ASSERT_EQ(frame_->Text("ABCD", Cardinal::N), Status::Ok);
    ASSERT_EQ(backend_->glyphs.size(), 4u);
    EXPECT_EQ(backend_->glyphs[0].x, 48);
    EXPECT_EQ(backend_->glyphs[0].y, 8);

    EXPECT_EQ(frame_->Text("\x01", Cardinal::N), Status::UnsupportedGlyph);
    EXPECT_EQ(frame_->TextAt("ok", 3, 4, colors::white, FontSize::Small), Status::Ok);
    EXPECT_EQ(backend_->glyphs.back().cell, 7);
}

TEST_F(FrameControllerTest, ColorScreenEncodesRgb565)
{
    make(kRound240, ColorDepth::Rgb565);
    frame_->Clear();
    ASSERT_EQ(frame_->Pixel(120, 120, colors::red), Status::Ok);
    EXPECT_EQ(backend_->PixelAt(120, 120), 0xF800);
    EXPECT_EQ(frame_->Geometry().width, 240);
    EXPECT_EQ(frame_->GetBackend().GetColorDepth(), ColorDepth::Rgb565);
}
