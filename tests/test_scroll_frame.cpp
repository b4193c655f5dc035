#include <limits>
#include <random>
#include <string>

#include <gtest/gtest.h>

#include "framekit/ui/ScrollFrame.hpp"
#include "tests/RecordingDelegate.hpp"

using namespace framekit::ui;
using framekit::tests::RecordingDelegate;
using Kind = RecordingDelegate::Command::Kind;

namespace
{
std::unique_ptr<ScrollFrame> MakeFrame(RecordingDelegate& delegate, float contentW, float contentH)
{
    ScrollFrameSettings settings;
    settings.initialContentSize = glm::vec2{contentW, contentH};
    return ScrollFrame::Create(delegate, settings);
}
} // namespace

TEST(ScrollFrame, TallContentScenario)
{
    RecordingDelegate delegate;
    auto frame = MakeFrame(delegate, 1000.0F, 2000.0F);
    ASSERT_NE(frame, nullptr);

    frame->OnResize(500.0F, 500.0F);
    EXPECT_FLOAT_EQ(delegate.horizontal.extent, 0.5F);
    EXPECT_FLOAT_EQ(delegate.vertical.extent, 0.25F);

    frame->OnScroll(0.0F, 3000.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 1500.0F);
    EXPECT_FLOAT_EQ(delegate.visibleY, 1500.0F);
    EXPECT_FLOAT_EQ(delegate.vertical.position, 1.0F);
}

TEST(ScrollFrame, EveryOperationEmitsRegionThenBothScrollbars)
{
    RecordingDelegate delegate;
    auto frame = MakeFrame(delegate, 800.0F, 800.0F);
    ASSERT_NE(frame, nullptr);

    frame->OnResize(200.0F, 200.0F);
    frame->OnScroll(10.0F, 10.0F);
    frame->OnContentResize(900.0F, 900.0F);

    ASSERT_EQ(delegate.commands.size(), 9U);
    for (std::size_t i = 0; i < delegate.commands.size(); i += 3)
    {
        EXPECT_EQ(delegate.commands[i].kind, Kind::SetVisibleRegion);
        EXPECT_EQ(delegate.commands[i + 1].kind, Kind::SetScrollbar);
        EXPECT_EQ(delegate.commands[i + 1].axis, ScrollAxis::Horizontal);
        EXPECT_EQ(delegate.commands[i + 2].kind, Kind::SetScrollbar);
        EXPECT_EQ(delegate.commands[i + 2].axis, ScrollAxis::Vertical);
    }
}

TEST(ScrollFrame, FittingContentHidesScrollbarsAndPinsOffset)
{
    RecordingDelegate delegate;
    auto frame = MakeFrame(delegate, 300.0F, 200.0F);
    ASSERT_NE(frame, nullptr);

    frame->OnResize(500.0F, 500.0F);
    frame->OnScroll(100.0F, 100.0F);

    EXPECT_FLOAT_EQ(frame->GetContent().offsetX, 0.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 0.0F);
    EXPECT_FALSE(delegate.horizontal.visible);
    EXPECT_FALSE(delegate.vertical.visible);
    EXPECT_FALSE(delegate.vertical.enabled);
    EXPECT_FLOAT_EQ(delegate.vertical.extent, 1.0F);
}

TEST(ScrollFrame, ShrinkingContentReclampsOffset)
{
    RecordingDelegate delegate;
    auto frame = MakeFrame(delegate, 500.0F, 2000.0F);
    ASSERT_NE(frame, nullptr);
    frame->OnResize(500.0F, 500.0F);
    frame->OnScroll(0.0F, 1400.0F);

    frame->OnContentResize(500.0F, 800.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 300.0F);
    EXPECT_FLOAT_EQ(delegate.visibleY, 300.0F);
}

TEST(ScrollFrame, PoliciesControlVisibilityOnly)
{
    RecordingDelegate delegate;
    ScrollFrameSettings settings;
    settings.initialContentSize = glm::vec2{100.0F, 2000.0F};
    settings.horizontalPolicy = ScrollbarPolicy::Always;
    settings.verticalPolicy = ScrollbarPolicy::Never;
    auto frame = ScrollFrame::Create(delegate, settings);
    ASSERT_NE(frame, nullptr);

    frame->OnResize(500.0F, 500.0F);
    EXPECT_TRUE(delegate.horizontal.visible);
    EXPECT_FALSE(delegate.horizontal.enabled);
    EXPECT_FALSE(delegate.vertical.visible);
    EXPECT_TRUE(delegate.vertical.enabled);

    frame->OnScroll(0.0F, 250.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 250.0F);
}

TEST(ScrollFrame, InvalidInputIsClampedToZero)
{
    RecordingDelegate delegate;
    auto frame = MakeFrame(delegate, 1000.0F, 1000.0F);
    ASSERT_NE(frame, nullptr);

    frame->OnResize(-10.0F, std::numeric_limits<float>::quiet_NaN());
    EXPECT_FLOAT_EQ(frame->GetViewport().width, 0.0F);
    EXPECT_FLOAT_EQ(frame->GetViewport().height, 0.0F);

    frame->OnResize(200.0F, 200.0F);
    frame->OnScroll(std::numeric_limits<float>::infinity(), std::numeric_limits<float>::quiet_NaN());
    EXPECT_FLOAT_EQ(frame->GetContent().offsetX, 0.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 0.0F);

    frame->OnContentResize(std::numeric_limits<float>::quiet_NaN(), -5.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().width, 0.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().height, 0.0F);
}

TEST(ScrollFrame, RejectsInvalidSettings)
{
    RecordingDelegate delegate;
    ScrollFrameSettings settings;
    std::string error;

    settings.initialContentSize = glm::vec2{-1.0F, 10.0F};
    EXPECT_EQ(ScrollFrame::Create(delegate, settings, &error), nullptr);
    EXPECT_FALSE(error.empty());

    settings = ScrollFrameSettings{};
    settings.maxHeight = 0.0F;
    EXPECT_EQ(ScrollFrame::Create(delegate, settings), nullptr);

    settings = ScrollFrameSettings{};
    settings.wheelStep = 0.0F;
    EXPECT_EQ(ScrollFrame::Create(delegate, settings), nullptr);
}

TEST(ScrollFrame, OffsetStaysInRangeForRandomSequences)
{
    std::mt19937 rng(1234U);
    std::uniform_real_distribution<float> sizeDist(0.0F, 3000.0F);
    std::uniform_real_distribution<float> deltaDist(-4000.0F, 4000.0F);
    std::uniform_int_distribution<int> opDist(0, 3);

    for (int run = 0; run < 50; ++run)
    {
        RecordingDelegate delegate;
        auto frame = MakeFrame(delegate, sizeDist(rng), sizeDist(rng));
        ASSERT_NE(frame, nullptr);

        for (int step = 0; step < 200; ++step)
        {
            switch (opDist(rng))
            {
                case 0:
                    frame->OnResize(sizeDist(rng), sizeDist(rng));
                    break;
                case 1:
                    frame->OnContentResize(sizeDist(rng), sizeDist(rng));
                    break;
                case 2:
                    frame->ScrollTo(deltaDist(rng), deltaDist(rng));
                    break;
                default:
                    frame->OnScroll(deltaDist(rng), deltaDist(rng));
                    break;
            }

            const ContentBox& content = frame->GetContent();
            const Viewport& viewport = frame->GetViewport();
            ASSERT_GE(content.offsetX, 0.0F);
            ASSERT_GE(content.offsetY, 0.0F);
            ASSERT_LE(content.offsetX, MaxScrollOffset(content.width, viewport.width));
            ASSERT_LE(content.offsetY, MaxScrollOffset(content.height, viewport.height));
            ASSERT_GE(delegate.vertical.position, 0.0F);
            ASSERT_LE(delegate.vertical.position, 1.0F);
            ASSERT_LE(delegate.horizontal.extent, 1.0F);
        }
    }
}

TEST(ScrollFrame, ViewportRoundTripRestoresOffset)
{
    std::mt19937 rng(99U);
    std::uniform_real_distribution<float> sizeDist(1.0F, 2000.0F);

    for (int run = 0; run < 200; ++run)
    {
        RecordingDelegate delegate;
        auto frame = MakeFrame(delegate, sizeDist(rng), sizeDist(rng));
        ASSERT_NE(frame, nullptr);

        const float viewW = sizeDist(rng);
        const float viewH = sizeDist(rng);
        frame->OnResize(viewW, viewH);
        frame->OnScroll(sizeDist(rng), sizeDist(rng));
        const ContentBox before = frame->GetContent();

        frame->OnResize(viewW * 0.5F, viewH * 0.5F);
        frame->OnResize(viewW, viewH);

        EXPECT_FLOAT_EQ(frame->GetContent().offsetX, before.offsetX);
        EXPECT_FLOAT_EQ(frame->GetContent().offsetY, before.offsetY);
    }
}

TEST(ScrollFrame, WheelScrollsEnabledAxesOnly)
{
    RecordingDelegate delegate;
    ScrollFrameSettings settings;
    settings.initialContentSize = glm::vec2{300.0F, 2000.0F};
    settings.wheelStep = 25.0F;
    auto frame = ScrollFrame::Create(delegate, settings);
    ASSERT_NE(frame, nullptr);
    frame->OnResize(500.0F, 500.0F);

    // Wheel down reports negative notches.
    EXPECT_TRUE(frame->OnWheel(0.0F, -2.0F));
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 50.0F);

    EXPECT_FALSE(frame->OnWheel(3.0F, 0.0F));
    EXPECT_FLOAT_EQ(frame->GetContent().offsetX, 0.0F);
}

TEST(ScrollFrame, ScrollToFractionMapsThumbToOffset)
{
    RecordingDelegate delegate;
    auto frame = MakeFrame(delegate, 1000.0F, 2000.0F);
    ASSERT_NE(frame, nullptr);
    frame->OnResize(500.0F, 500.0F);

    frame->ScrollToFraction(ScrollAxis::Vertical, 0.5F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetY, 750.0F);
    EXPECT_FLOAT_EQ(delegate.vertical.position, 0.5F);

    frame->ScrollToFraction(ScrollAxis::Horizontal, 2.0F);
    EXPECT_FLOAT_EQ(frame->GetContent().offsetX, 500.0F);
}

TEST(ScrollFrame, PreferredSizeIsCappedByMaximum)
{
    RecordingDelegate delegate;
    ScrollFrameSettings settings;
    settings.initialContentSize = glm::vec2{800.0F, 100.0F};
    settings.maxWidth = 500.0F;
    settings.maxHeight = 150.0F;
    auto frame = ScrollFrame::Create(delegate, settings);
    ASSERT_NE(frame, nullptr);

    EXPECT_FLOAT_EQ(frame->PreferredSize().x, 500.0F);
    EXPECT_FLOAT_EQ(frame->PreferredSize().y, 100.0F);

    frame->OnContentResize(200.0F, 400.0F);
    EXPECT_FLOAT_EQ(frame->PreferredSize().x, 200.0F);
    EXPECT_FLOAT_EQ(frame->PreferredSize().y, 150.0F);
}
