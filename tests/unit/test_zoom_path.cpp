#include <cursorfx/zoom_path.hpp>
#include <gtest/gtest.h>

using namespace cursorfx;

namespace
{

const VideoSize HD{1920.0, 1080.0};

ZoomSection section(TimeMs start, TimeMs end, double scale, double cx, double cy)
{
    ZoomSection s;
    s.start_time = start;
    s.end_time   = end;
    s.scale      = scale;
    s.center_x   = cx;
    s.center_y   = cy;
    return s;
}

bool is_identity(const ZoomRegion& r)
{
    return r.level == 1.0 && r.center_x == 960.0 && r.center_y == 540.0
           && r.crop_width == 1920.0 && r.crop_height == 1080.0;
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Geometry
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ZoomGeometry, CropFromLevel)
{
    auto r = compute_zoom_region(960.0, 540.0, HD, 2.0);
    EXPECT_DOUBLE_EQ(r.crop_width, 960.0);
    EXPECT_DOUBLE_EQ(r.crop_height, 540.0);
    EXPECT_DOUBLE_EQ(r.center_x, 960.0);
    EXPECT_DOUBLE_EQ(r.center_y, 540.0);
}

TEST(ZoomGeometry, CenterClampedInsideFrame)
{
    auto r = compute_zoom_region(0.0, 5000.0, HD, 2.0, 123.0);
    EXPECT_DOUBLE_EQ(r.center_x, 480.0);
    EXPECT_DOUBLE_EQ(r.center_y, 810.0);
    EXPECT_DOUBLE_EQ(r.timestamp, 123.0);
}

TEST(ZoomGeometry, LevelBelowOneTreatedAsOne)
{
    auto r = compute_zoom_region(100.0, 100.0, HD, 0.5);
    EXPECT_DOUBLE_EQ(r.level, 1.0);
    EXPECT_DOUBLE_EQ(r.crop_width, 1920.0);
    EXPECT_DOUBLE_EQ(r.center_x, 960.0);
}

TEST(ZoomGeometry, FrameCount)
{
    EXPECT_EQ(frame_count_for(1000.0, 25.0), 25u);
    EXPECT_EQ(frame_count_for(1010.0, 25.0), 26u);
    EXPECT_EQ(frame_count_for(0.0, 30.0), 0u);
    EXPECT_EQ(frame_count_for(-100.0, 30.0), 0u);
    EXPECT_EQ(frame_count_for(1000.0, 0.0), 0u);
    EXPECT_EQ(frame_count_for(1000.0, -30.0), 0u);
}

TEST(ZoomGeometry, RegionLookupByFrameIndex)
{
    std::vector<ZoomRegion> regions;
    for (int i = 0; i < 10; ++i)
        regions.push_back(compute_zoom_region(960.0, 540.0, HD, 1.0 + i * 0.1, i * 40.0));

    EXPECT_DOUBLE_EQ(zoom_region_at(regions, 0.0, 25.0)->timestamp, 0.0);
    EXPECT_DOUBLE_EQ(zoom_region_at(regions, 79.9, 25.0)->timestamp, 40.0);
    EXPECT_DOUBLE_EQ(zoom_region_at(regions, 80.0, 25.0)->timestamp, 80.0);
    EXPECT_DOUBLE_EQ(zoom_region_at(regions, -50.0, 25.0)->timestamp, 0.0);
    EXPECT_DOUBLE_EQ(zoom_region_at(regions, 99999.0, 25.0)->timestamp, 360.0);
    EXPECT_FALSE(zoom_region_at({}, 10.0, 25.0).has_value());
    EXPECT_FALSE(zoom_region_at(regions, 10.0, 0.0).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Generation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ZoomPath, DegenerateInputsGiveEmptyArray)
{
    std::vector<ZoomSection> sections{section(0.0, 1000.0, 2.0, 500.0, 500.0)};
    ZoomConfig               cfg;
    EXPECT_TRUE(ZoomPathGenerator::build(sections, HD, cfg, 30.0, 0.0).empty());
    EXPECT_TRUE(ZoomPathGenerator::build(sections, HD, cfg, 30.0, -10.0).empty());
    EXPECT_TRUE(ZoomPathGenerator::build(sections, HD, cfg, 0.0, 5000.0).empty());
}

TEST(ZoomPath, DisabledIsIdentityPerFrame)
{
    std::vector<ZoomSection> sections{section(0.0, 1000.0, 2.0, 500.0, 500.0)};
    ZoomConfig               cfg;
    cfg.enabled = false;

    auto regions = ZoomPathGenerator::build(sections, HD, cfg, 25.0, 1000.0);
    ASSERT_EQ(regions.size(), 25u);
    for (const auto& r : regions)
        EXPECT_TRUE(is_identity(r));
    EXPECT_DOUBLE_EQ(regions[3].timestamp, 120.0);
}

TEST(ZoomPath, NoSectionsIsIdentity)
{
    auto regions = ZoomPathGenerator::build({}, HD, ZoomConfig{}, 25.0, 400.0);
    ASSERT_EQ(regions.size(), 10u);
    for (const auto& r : regions)
        EXPECT_TRUE(is_identity(r));
}

TEST(ZoomPath, EasedTransitionIntoAndOutOfSection)
{
    std::vector<ZoomSection> sections{section(1000.0, 3000.0, 2.0, 500.0, 300.0)};
    ZoomConfig               cfg;   // 300 ms transitions

    // 50 fps: frame i sits at i * 20 ms.
    auto regions = ZoomPathGenerator::build(sections, HD, cfg, 50.0, 5000.0);
    ASSERT_EQ(regions.size(), 250u);

    EXPECT_TRUE(is_identity(regions[0]));
    EXPECT_TRUE(is_identity(regions[50]));   // 1000 ms: transition starts

    const auto& ramping = regions[57];       // 1140 ms
    EXPECT_GT(ramping.level, 1.0);
    EXPECT_LT(ramping.level, 2.0);

    const auto& held = regions[100];         // 2000 ms
    EXPECT_DOUBLE_EQ(held.level, 2.0);
    EXPECT_DOUBLE_EQ(held.center_x, 500.0);
    EXPECT_DOUBLE_EQ(held.center_y, 300.0);
    EXPECT_DOUBLE_EQ(held.crop_width, 960.0);

    EXPECT_DOUBLE_EQ(regions[150].level, 2.0);   // 3000 ms: section end
    EXPECT_GT(regions[155].level, 1.0);          // zooming out
    EXPECT_TRUE(is_identity(regions[165]));      // 3300 ms
    EXPECT_TRUE(is_identity(regions[249]));
}

TEST(ZoomPath, LevelChangesMonotonicallyDuringTransition)
{
    std::vector<ZoomSection> sections{section(1000.0, 3000.0, 2.0, 960.0, 540.0)};
    auto regions = ZoomPathGenerator::build(sections, HD, ZoomConfig{}, 50.0, 4000.0);
    for (size_t i = 51; i <= 65; ++i)
        EXPECT_GE(regions[i].level, regions[i - 1].level) << i;
    for (size_t i = 151; i <= 165; ++i)
        EXPECT_LE(regions[i].level, regions[i - 1].level) << i;
}

TEST(ZoomPath, ClampsSectionCenter)
{
    std::vector<ZoomSection> sections{section(0.0, 2000.0, 2.0, 0.0, 0.0)};
    auto regions = ZoomPathGenerator::build(sections, HD, ZoomConfig{}, 50.0, 2000.0);
    const auto& r = regions[50];
    EXPECT_DOUBLE_EQ(r.center_x, 480.0);
    EXPECT_DOUBLE_EQ(r.center_y, 270.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cache
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ZoomPathCache, IdenticalInputsReuseResult)
{
    std::vector<ZoomSection> a{section(1000.0, 3000.0, 2.0, 500.0, 300.0)};
    std::vector<ZoomSection> b = a;   // different identity, same content
    ZoomConfig               cfg;

    ZoomPathGenerator gen;
    const auto&       first  = gen.generate(a, HD, cfg, 30.0, 5000.0);
    const auto*       data   = first.data();
    const auto&       second = gen.generate(b, HD, ZoomConfig(cfg), 30.0, 5000.0);

    EXPECT_EQ(gen.computation_count(), 1u);
    EXPECT_EQ(second.data(), data);
    EXPECT_TRUE(gen.has_cache());
}

TEST(ZoomPathCache, ChangedLevelRecomputes)
{
    std::vector<ZoomSection> sections{section(1000.0, 3000.0, 2.0, 500.0, 300.0)};
    ZoomConfig               cfg;
    ZoomPathGenerator        gen;

    gen.generate(sections, HD, cfg, 30.0, 5000.0);
    cfg.level = 3.0;
    gen.generate(sections, HD, cfg, 30.0, 5000.0);
    EXPECT_EQ(gen.computation_count(), 2u);

    cfg.enabled = false;
    gen.generate(sections, HD, cfg, 30.0, 5000.0);
    EXPECT_EQ(gen.computation_count(), 3u);
}

TEST(ZoomPathCache, ChangedSectionsRecompute)
{
    std::vector<ZoomSection> sections{section(1000.0, 3000.0, 2.0, 500.0, 300.0)};
    ZoomPathGenerator        gen;
    gen.generate(sections, HD, ZoomConfig{}, 30.0, 5000.0);

    sections[0].end_time = 3500.0;
    gen.generate(sections, HD, ZoomConfig{}, 30.0, 5000.0);
    EXPECT_EQ(gen.computation_count(), 2u);

    gen.generate(sections, HD, ZoomConfig{}, 30.0, 5000.0);
    EXPECT_EQ(gen.computation_count(), 2u);
}

TEST(ZoomPathCache, InvalidateForcesRebuild)
{
    std::vector<ZoomSection> sections{section(1000.0, 3000.0, 2.0, 500.0, 300.0)};
    ZoomPathGenerator        gen;
    gen.generate(sections, HD, ZoomConfig{}, 30.0, 5000.0);
    gen.invalidate();
    EXPECT_FALSE(gen.has_cache());
    EXPECT_TRUE(gen.regions().empty());
    gen.generate(sections, HD, ZoomConfig{}, 30.0, 5000.0);
    EXPECT_EQ(gen.computation_count(), 2u);
}

TEST(ZoomPathCache, HashIsStructural)
{
    std::vector<ZoomSection> a{section(0.0, 100.0, 2.0, 1.0, 2.0)};
    std::vector<ZoomSection> b{section(0.0, 100.0, 2.0, 1.0, 2.0)};
    std::vector<ZoomSection> c{section(0.0, 100.0, 2.0, 2.0, 1.0)};
    ZoomConfig               cfg;
    EXPECT_EQ(ZoomPathGenerator::structural_hash(a, HD, cfg, 30.0, 1000.0),
              ZoomPathGenerator::structural_hash(b, HD, cfg, 30.0, 1000.0));
    EXPECT_NE(ZoomPathGenerator::structural_hash(a, HD, cfg, 30.0, 1000.0),
              ZoomPathGenerator::structural_hash(c, HD, cfg, 30.0, 1000.0));
}
