#include <cmath>
#include <cursorfx/motion_smoother.hpp>
#include <gtest/gtest.h>

using namespace cursorfx;

TEST(MotionSmoother, StartsAtInitialPosition)
{
    MotionSmoother s(10.0, 20.0);
    EXPECT_EQ(s.position().x, 10.0);
    EXPECT_EQ(s.position().y, 20.0);
    EXPECT_EQ(s.target().x, 10.0);
    EXPECT_DOUBLE_EQ(s.smooth_time(), MotionSmoother::DEFAULT_SMOOTH_TIME);
}

TEST(MotionSmoother, AtRestStaysPut)
{
    MotionSmoother s(5.0, 5.0);
    for (int i = 0; i < 10; ++i)
    {
        auto p = s.update(1.0 / 60.0);
        EXPECT_EQ(p.x, 5.0);
        EXPECT_EQ(p.y, 5.0);
    }
}

TEST(MotionSmoother, ConvergesToTarget)
{
    MotionSmoother s(0.0, 0.0, 0.2);
    s.set_target(100.0, -50.0);
    Vec2 p;
    for (int i = 0; i < 300; ++i)
        p = s.update(1.0 / 60.0);
    EXPECT_NEAR(p.x, 100.0, 1e-3);
    EXPECT_NEAR(p.y, -50.0, 1e-3);
}

TEST(MotionSmoother, ApproachesWithoutJumping)
{
    MotionSmoother s(0.0, 0.0, 0.2);
    s.set_target(100.0, 0.0);
    auto first = s.update(1.0 / 60.0);
    EXPECT_GT(first.x, 0.0);
    EXPECT_LT(first.x, 50.0);

    double prev = first.x;
    for (int i = 0; i < 30; ++i)
    {
        auto p = s.update(1.0 / 60.0);
        EXPECT_GE(p.x, prev);
        prev = p.x;
    }
}

TEST(MotionSmoother, LargeDeltaIsCapped)
{
    MotionSmoother a(0.0, 0.0, 0.2, 0.1);
    MotionSmoother b(0.0, 0.0, 0.2, 0.1);
    a.set_target(100.0, 100.0);
    b.set_target(100.0, 100.0);

    auto pa = a.update(5.0);   // a hitch
    auto pb = b.update(0.1);
    EXPECT_DOUBLE_EQ(pa.x, pb.x);
    EXPECT_DOUBLE_EQ(pa.y, pb.y);
}

TEST(MotionSmoother, ZeroOrNegativeDeltaHolds)
{
    MotionSmoother s(0.0, 0.0);
    s.set_target(10.0, 10.0);
    EXPECT_EQ(s.update(0.0).x, 0.0);
    EXPECT_EQ(s.update(-1.0).x, 0.0);
}

TEST(MotionSmoother, SetTargetKeepsVelocity)
{
    MotionSmoother s(0.0, 0.0);
    s.set_target(100.0, 0.0);
    s.update(1.0 / 60.0);
    const double v = s.velocity().x;
    EXPECT_GT(v, 0.0);

    s.set_target(200.0, 0.0);
    EXPECT_EQ(s.velocity().x, v);
}

TEST(MotionSmoother, ResetClearsMotion)
{
    MotionSmoother s(0.0, 0.0);
    s.set_target(100.0, 100.0);
    s.update(1.0 / 60.0);
    s.reset(42.0, 7.0);
    EXPECT_EQ(s.position().x, 42.0);
    EXPECT_EQ(s.position().y, 7.0);
    EXPECT_EQ(s.target().x, 42.0);
    EXPECT_EQ(s.velocity().x, 0.0);
    EXPECT_EQ(s.velocity().y, 0.0);
}

TEST(MotionSmoother, InvalidParametersUseDefaults)
{
    MotionSmoother s(0.0, 0.0, -1.0, 0.0);
    EXPECT_DOUBLE_EQ(s.smooth_time(), MotionSmoother::DEFAULT_SMOOTH_TIME);
    EXPECT_DOUBLE_EQ(s.max_delta_seconds(), MotionSmoother::MAX_DELTA_SECONDS);
}
