#include <cursorfx/timeline.hpp>
#include <gtest/gtest.h>

using namespace cursorfx;

using CursorKfs = std::vector<CursorKeyframe>;
using ZoomKfs   = std::vector<ZoomKeyframe>;

// ═══════════════════════════════════════════════════════════════════════════════
// normalize_keyframes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(NormalizeKeyframes, SortsAscending)
{
    std::vector<CursorKeyframe> kfs{{300.0, 3, 0}, {100.0, 1, 0}, {200.0, 2, 0}};
    normalize_keyframes(kfs);
    ASSERT_EQ(kfs.size(), 3u);
    EXPECT_DOUBLE_EQ(kfs[0].timestamp, 100.0);
    EXPECT_DOUBLE_EQ(kfs[1].timestamp, 200.0);
    EXPECT_DOUBLE_EQ(kfs[2].timestamp, 300.0);
}

TEST(NormalizeKeyframes, CloseNeighboursKeepLater)
{
    std::vector<CursorKeyframe> kfs{{100.0, 1, 0}, {105.0, 2, 0}, {500.0, 3, 0}};
    normalize_keyframes(kfs);
    ASSERT_EQ(kfs.size(), 2u);
    EXPECT_DOUBLE_EQ(kfs[0].timestamp, 105.0);
    EXPECT_DOUBLE_EQ(kfs[0].x, 2.0);
}

TEST(NormalizeKeyframes, EqualTimestampsKeepLastInserted)
{
    std::vector<CursorKeyframe> kfs{{100.0, 1, 0}, {100.0, 2, 0}};
    normalize_keyframes(kfs);
    ASSERT_EQ(kfs.size(), 1u);
    EXPECT_DOUBLE_EQ(kfs[0].x, 2.0);
}

TEST(NormalizeKeyframes, Idempotent)
{
    std::vector<CursorKeyframe> kfs{{0.0, 0, 0}, {4.0, 1, 0}, {9.0, 2, 0}, {30.0, 3, 0}, {35.0, 4, 0}};
    normalize_keyframes(kfs);
    auto once = kfs;
    normalize_keyframes(kfs);
    EXPECT_EQ(kfs, once);
}

TEST(NormalizeKeyframes, SpacingHolds)
{
    std::vector<CursorKeyframe> kfs;
    for (int i = 0; i < 100; ++i)
        kfs.emplace_back(i * 3.7, i, 0);
    normalize_keyframes(kfs);
    for (size_t i = 1; i < kfs.size(); ++i)
        EXPECT_GE(kfs[i].timestamp - kfs[i - 1].timestamp, MIN_KEYFRAME_SPACING_MS);
}

// ═══════════════════════════════════════════════════════════════════════════════
// KeyframeTrack: Editing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(KeyframeTrack, DefaultEmpty)
{
    CursorTimeline tl;
    EXPECT_TRUE(tl.empty());
    EXPECT_EQ(tl.size(), 0u);
    EXPECT_DOUBLE_EQ(tl.start_time(), 0.0);
    EXPECT_DOUBLE_EQ(tl.end_time(), 0.0);
}

TEST(KeyframeTrack, AddKeepsOrder)
{
    CursorTimeline tl;
    tl.add_keyframe({200.0, 2, 0});
    tl.add_keyframe({0.0, 0, 0});
    tl.add_keyframe({100.0, 1, 0});
    ASSERT_EQ(tl.size(), 3u);
    EXPECT_DOUBLE_EQ(tl.keyframes()[0].timestamp, 0.0);
    EXPECT_DOUBLE_EQ(tl.keyframes()[1].timestamp, 100.0);
    EXPECT_DOUBLE_EQ(tl.keyframes()[2].timestamp, 200.0);
    EXPECT_DOUBLE_EQ(tl.start_time(), 0.0);
    EXPECT_DOUBLE_EQ(tl.end_time(), 200.0);
}

TEST(KeyframeTrack, AddReplacesWithinSpacing)
{
    CursorTimeline tl;
    tl.add_keyframe({100.0, 1, 0});
    tl.add_keyframe({104.0, 9, 0});
    ASSERT_EQ(tl.size(), 1u);
    EXPECT_DOUBLE_EQ(tl.keyframes()[0].timestamp, 104.0);
    EXPECT_DOUBLE_EQ(tl.keyframes()[0].x, 9.0);
}

TEST(KeyframeTrack, Remove)
{
    CursorTimeline tl(CursorKfs{{0.0, 0, 0}, {100.0, 1, 0}, {200.0, 2, 0}});
    EXPECT_TRUE(tl.remove_keyframe(101.0));
    EXPECT_EQ(tl.size(), 2u);
    EXPECT_FALSE(tl.remove_keyframe(150.0));
    EXPECT_EQ(tl.size(), 2u);
}

TEST(KeyframeTrack, UpdateInPlace)
{
    CursorTimeline tl(CursorKfs{{0.0, 0, 0}, {100.0, 1, 0}});
    EXPECT_TRUE(tl.update_keyframe(100.0, [](CursorKeyframe& kf) { kf.x = 42.0; }));
    EXPECT_DOUBLE_EQ(tl.keyframes()[1].x, 42.0);
}

TEST(KeyframeTrack, UpdateMovingTimestampResorts)
{
    CursorTimeline tl(CursorKfs{{0.0, 0, 0}, {100.0, 1, 0}, {200.0, 2, 0}});
    EXPECT_TRUE(tl.update_keyframe(0.0, [](CursorKeyframe& kf) { kf.timestamp = 300.0; }));
    ASSERT_EQ(tl.size(), 3u);
    EXPECT_DOUBLE_EQ(tl.keyframes()[0].timestamp, 100.0);
    EXPECT_DOUBLE_EQ(tl.keyframes()[2].timestamp, 300.0);
    EXPECT_DOUBLE_EQ(tl.keyframes()[2].x, 0.0);
}

TEST(KeyframeTrack, UpdateMissingReturnsFalse)
{
    CursorTimeline tl(CursorKfs{{0.0, 0, 0}});
    bool called = false;
    EXPECT_FALSE(tl.update_keyframe(500.0, [&](CursorKeyframe&) { called = true; }));
    EXPECT_FALSE(called);
}

TEST(KeyframeTrack, FindNearest)
{
    ZoomTimeline tl(ZoomKfs{{0.0, 0, 0, 1}, {100.0, 0, 0, 2}, {108.0, 0, 0, 3}}, 5.0);
    const auto*  kf = tl.find_keyframe(106.0);
    ASSERT_NE(kf, nullptr);
    EXPECT_DOUBLE_EQ(kf->level, 3.0);
    EXPECT_EQ(tl.find_keyframe(50.0), nullptr);
}

TEST(KeyframeTrack, SetKeyframesNormalizes)
{
    CursorTimeline tl;
    tl.set_keyframes(CursorKfs{{50.0, 5, 0}, {0.0, 0, 0}, {52.0, 6, 0}});
    ASSERT_EQ(tl.size(), 2u);
    EXPECT_DOUBLE_EQ(tl.keyframes()[1].x, 6.0);
}

TEST(KeyframeTrack, Clear)
{
    CursorTimeline tl(CursorKfs{{0.0, 0, 0}, {100.0, 1, 0}});
    tl.clear();
    EXPECT_TRUE(tl.empty());
}
