#include <gtest/gtest.h>
#include "nwss-tess/flattener.h"

#include <cmath>

using namespace nwss::tess;

namespace {

// Largest distance from the midpoint of any segment to a circle
double maxChordDeviation(const Loop& loop, const Point2D& center, double radius) {
    double deviation = 0.0;
    const auto& points = loop.getPoints();
    for (size_t i = 1; i < points.size(); ++i) {
        Point2D mid = (points[i - 1] + points[i]) * 0.5;
        deviation = std::max(deviation, std::fabs(radius - mid.distanceTo(center)));
    }
    return deviation;
}

} // namespace

TEST(FlattenerTest, DefaultConfig) {
    CurveFlattener flattener;
    EXPECT_EQ(flattener.getConfig().bezierPoints, 20);
    EXPECT_EQ(flattener.getConfig().circlePoints, 24);
    EXPECT_EQ(flattener.bezierSegments(), 20);
    EXPECT_EQ(flattener.circleSegments(), 24);
}

TEST(FlattenerTest, SegmentCountsAreClamped) {
    FlattenerConfig config;
    config.bezierPoints = 0;
    config.circlePoints = 1;
    CurveFlattener flattener(config);
    EXPECT_EQ(flattener.bezierSegments(), 1);
    EXPECT_EQ(flattener.circleSegments(), 3);

    config.bezierPoints = 500;
    config.circlePoints = 500;
    config.maxSegments = 64;
    flattener.setConfig(config);
    EXPECT_EQ(flattener.bezierSegments(), 64);
    EXPECT_EQ(flattener.circleSegments(), 64);
}

TEST(FlattenerTest, CubicEndpointsAndSampleCount) {
    CurveFlattener flattener;
    Loop loop;
    Point2D p0(0, 0), p1(0, 10), p2(10, 10), p3(10, 0);
    flattener.cubicTo(p0, p1, p2, p3, loop);

    ASSERT_EQ(loop.size(), 21u);
    EXPECT_EQ(loop.getPoint(0), p0);
    EXPECT_EQ(loop.getPoint(20), p3);

    // Sample 10 is the curve at t = 0.5: (p0 + 3 p1 + 3 p2 + p3) / 8
    EXPECT_NEAR(loop.getPoint(10).x, 5.0, 1e-12);
    EXPECT_NEAR(loop.getPoint(10).y, 7.5, 1e-12);
}

TEST(FlattenerTest, DegenerateCubicIsCollinear) {
    CurveFlattener flattener;
    Loop loop;
    flattener.cubicTo(Point2D(0, 0), Point2D(2, 1), Point2D(6, 3), Point2D(10, 5), loop);

    for (const auto& point : loop.getPoints()) {
        EXPECT_NEAR(point.y, point.x * 0.5, 1e-9);
    }
}

TEST(FlattenerTest, BezierResolutionFollowsConfig) {
    FlattenerConfig config;
    config.bezierPoints = 4;
    CurveFlattener flattener(config);

    Loop loop;
    flattener.cubicTo(Point2D(0, 0), Point2D(1, 2), Point2D(3, 2), Point2D(4, 0), loop);
    EXPECT_EQ(loop.size(), 5u);
}

TEST(FlattenerTest, QuadraticMatchesClosedForm) {
    CurveFlattener flattener;
    Loop loop;
    flattener.quadraticTo(Point2D(0, 0), Point2D(5, 10), Point2D(10, 0), loop);

    ASSERT_EQ(loop.size(), 21u);
    // B(0.5) = 0.25 p0 + 0.5 c + 0.25 p1
    EXPECT_NEAR(loop.getPoint(10).x, 5.0, 1e-9);
    EXPECT_NEAR(loop.getPoint(10).y, 5.0, 1e-9);
    EXPECT_EQ(loop.getPoint(20), Point2D(10, 0));
}

TEST(FlattenerTest, HalfCircleArc) {
    CurveFlattener flattener;
    Loop loop;
    Point2D start(0, 0), end(10, 0), center(5, 0);
    flattener.arcTo(start, 5, 5, 0, false, true, end, loop);

    // 24 segments per circle, half of them for a half circle
    ASSERT_EQ(loop.size(), 13u);
    EXPECT_EQ(loop.getPoint(0), start);
    EXPECT_EQ(loop.getPoint(12), end);

    for (const auto& point : loop.getPoints()) {
        EXPECT_NEAR(point.distanceTo(center), 5.0, 1e-9);
        EXPECT_LE(point.y, 1e-9);
    }
    EXPECT_NEAR(loop.getPoint(6).y, -5.0, 1e-9);
}

TEST(FlattenerTest, SweepFlagPicksSide) {
    CurveFlattener flattener;
    Loop loop;
    flattener.arcTo(Point2D(0, 0), 5, 5, 0, false, false, Point2D(10, 0), loop);

    ASSERT_EQ(loop.size(), 13u);
    EXPECT_NEAR(loop.getPoint(6).y, 5.0, 1e-9);
}

TEST(FlattenerTest, ArcDeviationShrinksWithResolution) {
    Point2D start(0, 0), end(10, 0), center(5, 0);

    FlattenerConfig coarse;
    coarse.circlePoints = 12;
    Loop coarseLoop;
    CurveFlattener(coarse).arcTo(start, 5, 5, 0, false, true, end, coarseLoop);

    FlattenerConfig fine;
    fine.circlePoints = 96;
    Loop fineLoop;
    CurveFlattener(fine).arcTo(start, 5, 5, 0, false, true, end, fineLoop);

    EXPECT_GT(fineLoop.size(), coarseLoop.size());
    EXPECT_LT(maxChordDeviation(fineLoop, center, 5.0), maxChordDeviation(coarseLoop, center, 5.0));
}

TEST(FlattenerTest, DegenerateArcs) {
    CurveFlattener flattener;

    Loop same;
    flattener.arcTo(Point2D(3, 3), 5, 5, 0, false, true, Point2D(3, 3), same);
    EXPECT_TRUE(same.empty());

    Loop zeroRadius;
    flattener.arcTo(Point2D(0, 0), 0, 5, 0, false, true, Point2D(4, 4), zeroRadius);
    ASSERT_EQ(zeroRadius.size(), 1u);
    EXPECT_EQ(zeroRadius.getPoint(0), Point2D(4, 4));
}

TEST(FlattenerTest, RotatedEllipticalArcHitsEndpoints) {
    CurveFlattener flattener;
    Loop loop;
    Point2D start(1, 2), end(7, 9);
    flattener.arcTo(start, 6, 3, 30, true, false, end, loop);

    ASSERT_GE(loop.size(), 2u);
    EXPECT_EQ(loop.getPoint(0), start);
    EXPECT_EQ(loop.getPoint(loop.size() - 1), end);
}
