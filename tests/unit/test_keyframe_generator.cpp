#include <algorithm>
#include <cursorfx/keyframe_generator.hpp>
#include <gtest/gtest.h>

using namespace cursorfx;

namespace
{

ClickEvent down(TimeMs t, double x, double y)
{
    ClickEvent c;
    c.timestamp = t;
    c.x         = x;
    c.y         = y;
    c.action    = MouseAction::Down;
    return c;
}

ClickEvent up(TimeMs t, double x, double y)
{
    ClickEvent c = down(t, x, y);
    c.action     = MouseAction::Up;
    return c;
}

const VideoSize HD{1920.0, 1080.0};

constexpr double LEAD_30FPS = 7.0 / 30.0 * 1000.0;

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Cursor: No-ops
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CursorGenerator, NoClicksReturnsInput)
{
    std::vector<CursorKeyframe> existing{CursorKeyframe(100.0, 5.0, 6.0)};
    auto                        out = generate_cursor_keyframes(existing, {}, 10000.0, 30.0);
    EXPECT_EQ(out, existing);
}

TEST(CursorGenerator, OnlyUpEventsReturnsInput)
{
    std::vector<CursorKeyframe> existing;
    std::vector<ClickEvent>     clicks{up(500.0, 1, 1), up(900.0, 2, 2)};
    auto                        out = generate_cursor_keyframes(existing, clicks, 10000.0, 30.0);
    EXPECT_TRUE(out.empty());
}

TEST(CursorGenerator, DenseManualKeyframesReturnInput)
{
    std::vector<CursorKeyframe> existing{CursorKeyframe(0.0, 0, 0), CursorKeyframe(100.0, 1, 1)};
    std::vector<ClickEvent>     clicks{down(1000, 1, 1), down(2000, 2, 2), down(3000, 3, 3),
                                       down(4000, 4, 4)};
    // 2 existing keyframes for 4 clicks is not below half.
    auto out = generate_cursor_keyframes(existing, clicks, 10000.0, 30.0);
    EXPECT_EQ(out, existing);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cursor: Synthesis
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CursorGenerator, SingleClickLeadAndClickKeyframes)
{
    std::vector<ClickEvent> clicks{down(2000.0, 300.0, 400.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 0.0, 30.0);

    ASSERT_EQ(out.size(), 3u);
    // Initial keyframe at the first click position.
    EXPECT_DOUBLE_EQ(out[0].timestamp, 0.0);
    EXPECT_DOUBLE_EQ(out[0].x, 300.0);
    // Lead keyframe 7 frames earlier at the previous (initial) position.
    EXPECT_NEAR(out[1].timestamp, 1766.67, 0.01);
    EXPECT_DOUBLE_EQ(out[1].timestamp, 2000.0 - LEAD_30FPS);
    EXPECT_DOUBLE_EQ(out[1].x, 300.0);
    EXPECT_DOUBLE_EQ(out[1].y, 400.0);
    // Click keyframe.
    EXPECT_DOUBLE_EQ(out[2].timestamp, 2000.0);
    EXPECT_DOUBLE_EQ(out[2].x, 300.0);
    EXPECT_DOUBLE_EQ(out[2].y, 400.0);
}

TEST(CursorGenerator, LeadUsesPreviousClickPosition)
{
    std::vector<ClickEvent> clicks{down(1000.0, 10.0, 10.0), down(3000.0, 90.0, 50.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 0.0, 30.0);

    ASSERT_EQ(out.size(), 5u);
    EXPECT_DOUBLE_EQ(out[3].timestamp, 3000.0 - LEAD_30FPS);
    EXPECT_DOUBLE_EQ(out[3].x, 10.0);
    EXPECT_DOUBLE_EQ(out[4].x, 90.0);
    EXPECT_DOUBLE_EQ(out[4].y, 50.0);
}

TEST(CursorGenerator, ClickNearStartDropsLead)
{
    // The lead clamps to 0 and merges into the initial keyframe.
    std::vector<ClickEvent> clicks{down(100.0, 50.0, 60.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 0.0, 30.0);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].timestamp, 0.0);
    EXPECT_DOUBLE_EQ(out[1].timestamp, 100.0);
}

TEST(CursorGenerator, ClickAtZeroEmitsNoLead)
{
    std::vector<ClickEvent> clicks{down(0.0, 50.0, 60.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 0.0, 30.0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].x, 50.0);
}

TEST(CursorGenerator, UnsortedClicksProcessedChronologically)
{
    std::vector<ClickEvent> clicks{down(3000.0, 90.0, 50.0), down(1000.0, 10.0, 10.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 0.0, 30.0);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_DOUBLE_EQ(out[3].x, 10.0);
    EXPECT_DOUBLE_EQ(out[4].x, 90.0);
}

TEST(CursorGenerator, TrailingKeyframeAtDuration)
{
    std::vector<ClickEvent> clicks{down(1000.0, 10.0, 20.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 5000.0, 30.0);
    ASSERT_FALSE(out.empty());
    EXPECT_DOUBLE_EQ(out.back().timestamp, 5000.0);
    EXPECT_DOUBLE_EQ(out.back().x, 10.0);
    EXPECT_DOUBLE_EQ(out.back().y, 20.0);
}

TEST(CursorGenerator, NoTrailingKeyframeWhenCloseToEnd)
{
    std::vector<ClickEvent> clicks{down(4950.0, 10.0, 20.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 5000.0, 30.0);
    EXPECT_DOUBLE_EQ(out.back().timestamp, 4950.0);
}

TEST(CursorGenerator, MergesWithSparseExisting)
{
    std::vector<CursorKeyframe> existing{CursorKeyframe(500.0, 7.0, 8.0)};
    std::vector<ClickEvent>     clicks{down(1000, 1, 1), down(2000, 2, 2), down(3000, 3, 3)};
    auto                        out = generate_cursor_keyframes(existing, clicks, 0.0, 30.0);

    // No initial keyframe; the first lead keyframe starts from the existing one.
    EXPECT_DOUBLE_EQ(out.front().timestamp, 500.0);
    EXPECT_DOUBLE_EQ(out[1].x, 7.0);
    EXPECT_DOUBLE_EQ(out[1].timestamp, 1000.0 - LEAD_30FPS);
    EXPECT_EQ(out.size(), 7u);
}

TEST(CursorGenerator, ZeroFrameRateUsesDefault)
{
    std::vector<ClickEvent> clicks{down(2000.0, 1.0, 1.0)};
    auto                    a = generate_cursor_keyframes({}, clicks, 0.0, 0.0);
    auto                    b = generate_cursor_keyframes({}, clicks, 0.0, 30.0);
    EXPECT_EQ(a, b);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cursor: Properties
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CursorGenerator, IdempotentOnOwnOutput)
{
    std::vector<ClickEvent> clicks;
    for (int i = 0; i < 20; ++i)
        clicks.push_back(down(300.0 + i * 411.0, i * 17.0, i * 9.0));

    auto once  = generate_cursor_keyframes({}, clicks, 12000.0, 30.0);
    auto twice = generate_cursor_keyframes(once, clicks, 12000.0, 30.0);
    EXPECT_EQ(once, twice);
}

TEST(CursorGenerator, MinimumSpacingHolds)
{
    std::vector<ClickEvent> clicks;
    for (int i = 0; i < 50; ++i)
        clicks.push_back(down(i * 6.0, i, i));   // faster than the spacing

    auto out = generate_cursor_keyframes({}, clicks, 1000.0, 60.0);
    ASSERT_GE(out.size(), 2u);
    for (size_t i = 1; i < out.size(); ++i)
        EXPECT_GE(out[i].timestamp - out[i - 1].timestamp, MIN_KEYFRAME_SPACING_MS) << i;
}

TEST(CursorGenerator, CustomLeadFrames)
{
    EngineConfig cfg;
    cfg.lead_frames = 3;
    std::vector<ClickEvent> clicks{down(1000.0, 1.0, 1.0)};
    auto                    out = generate_cursor_keyframes({}, clicks, 0.0, 60.0, cfg);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[1].timestamp, 950.0);
}

TEST(FramesToMs, Conversion)
{
    EXPECT_DOUBLE_EQ(frames_to_ms(7.0, 30.0), LEAD_30FPS);
    EXPECT_DOUBLE_EQ(frames_to_ms(6.0, 60.0), 100.0);
    EXPECT_DOUBLE_EQ(frames_to_ms(6.0, 0.0), 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Zoom
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ZoomGenerator, StartsFromIdentityAndZoomsOnClick)
{
    ZoomConfig              zoom;
    std::vector<ClickEvent> clicks{down(2000.0, 900.0, 500.0)};
    auto                    out = generate_zoom_keyframes({}, clicks, HD, 0.0, 30.0, zoom);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[0].level, 1.0);
    EXPECT_DOUBLE_EQ(out[0].center_x, 960.0);
    EXPECT_DOUBLE_EQ(out[1].level, 1.0);
    EXPECT_DOUBLE_EQ(out[2].timestamp, 2000.0);
    EXPECT_DOUBLE_EQ(out[2].level, 2.0);
    EXPECT_DOUBLE_EQ(out[2].center_x, 900.0);
    EXPECT_DOUBLE_EQ(out[2].center_y, 500.0);
}

TEST(ZoomGenerator, ClickCenterClampedIntoFrame)
{
    ZoomConfig              zoom;
    std::vector<ClickEvent> clicks{down(2000.0, 10.0, 1070.0)};
    auto                    out = generate_zoom_keyframes({}, clicks, HD, 0.0, 30.0, zoom);
    ASSERT_FALSE(out.empty());
    EXPECT_DOUBLE_EQ(out.back().center_x, 480.0);
    EXPECT_DOUBLE_EQ(out.back().center_y, 810.0);
}

TEST(ZoomGenerator, MergeKeepsManualKeyframes)
{
    ZoomConfig                zoom;
    std::vector<ZoomKeyframe> existing{{6000.0, 100.0, 100.0, 3.0}};
    std::vector<ClickEvent>   clicks{down(1000, 1, 1), down(2000, 2, 2), down(3000, 3, 3)};

    auto out = generate_zoom_keyframes(existing, clicks, HD, 0.0, 30.0, zoom);
    auto it  = std::find_if(out.begin(),
                           out.end(),
                           [](const ZoomKeyframe& kf) { return kf.timestamp == 6000.0; });
    ASSERT_NE(it, out.end());
    EXPECT_DOUBLE_EQ(it->level, 3.0);
}

TEST(ZoomGenerator, ReplaceDiscardsExisting)
{
    ZoomConfig   zoom;
    EngineConfig cfg;
    cfg.zoom_generation = ZoomGenerationMode::Replace;

    std::vector<ZoomKeyframe> existing{{0.0, 1.0, 1.0, 4.0},
                                       {100.0, 1.0, 1.0, 4.0},
                                       {6000.0, 100.0, 100.0, 3.0}};
    std::vector<ClickEvent>   clicks{down(1000, 900, 500)};

    auto out = generate_zoom_keyframes(existing, clicks, HD, 0.0, 30.0, zoom, cfg);
    for (const auto& kf : out)
        EXPECT_NE(kf.level, 4.0);
    EXPECT_DOUBLE_EQ(out.front().level, 1.0);
    EXPECT_DOUBLE_EQ(out.back().timestamp, 1000.0);
}

TEST(ZoomGenerator, MergeRespectsDensity)
{
    ZoomConfig                zoom;
    std::vector<ZoomKeyframe> existing{{0.0, 1.0, 1.0, 4.0}};
    std::vector<ClickEvent>   clicks{down(1000, 900, 500)};
    auto                      out = generate_zoom_keyframes(existing, clicks, HD, 0.0, 30.0, zoom);
    EXPECT_EQ(out, existing);
}

TEST(ZoomGenerator, TrailingKeyframeHoldsLastZoom)
{
    ZoomConfig              zoom;
    std::vector<ClickEvent> clicks{down(1000.0, 900.0, 500.0)};
    auto                    out = generate_zoom_keyframes({}, clicks, HD, 4000.0, 30.0, zoom);
    EXPECT_DOUBLE_EQ(out.back().timestamp, 4000.0);
    EXPECT_DOUBLE_EQ(out.back().level, 2.0);
}
