#include <gtest/gtest.h>
#include "nwss-tess/tessellator.h"

#include <algorithm>

using namespace nwss::tess;

namespace {

Loop makeLoop(const std::vector<Point2D>& points) {
    Loop loop(points);
    loop.close();
    return loop;
}

Loop square(double x, double y, double size, bool counterClockwise = true) {
    std::vector<Point2D> points = {
        Point2D(x, y), Point2D(x + size, y), Point2D(x + size, y + size), Point2D(x, y + size)
    };
    if (!counterClockwise) {
        std::reverse(points.begin(), points.end());
    }
    return makeLoop(points);
}

// Every emitted triangle must wind counter-clockwise with non-zero area
void expectCounterClockwise(const TessellationResult& result) {
    const auto& t = result.triangles;
    ASSERT_EQ(t.size() % 3, 0u);
    for (size_t i = 0; i < t.size(); i += 3) {
        double twiceArea = (t[i + 1].x - t[i].x) * (t[i + 2].y - t[i].y) -
                           (t[i + 2].x - t[i].x) * (t[i + 1].y - t[i].y);
        EXPECT_GT(twiceArea, 0.0) << "triangle " << i / 3;
    }
}

// Strictly inside a counter-clockwise triangle
bool triangleCovers(const Point2D& a, const Point2D& b, const Point2D& c, const Point2D& p) {
    auto side = [](const Point2D& from, const Point2D& to, const Point2D& q) {
        return (to.x - from.x) * (q.y - from.y) - (to.y - from.y) * (q.x - from.x);
    };
    return side(a, b, p) > 0 && side(b, c, p) > 0 && side(c, a, p) > 0;
}

} // namespace

TEST(TessellatorTest, SquareIsTwoTriangles) {
    TessellationResult result = Tessellator::triangulate({square(0, 0, 10)});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.triangleCount(), 2u);
    EXPECT_NEAR(result.area(), 100.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, ClockwiseInputGivesSameArea) {
    TessellationResult result = Tessellator::triangulate({square(0, 0, 10, false)});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.triangleCount(), 2u);
    EXPECT_NEAR(result.area(), 100.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, OppositeWoundInnerContourIsAHole) {
    TessellationResult result = Tessellator::triangulate({
        square(0, 0, 10),
        square(3, 3, 4, false)
    });

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.area(), 100.0 - 16.0, 1e-9);
    expectCounterClockwise(result);

    // Nothing covers the hole center
    for (size_t i = 0; i < result.triangles.size(); i += 3) {
        EXPECT_FALSE(triangleCovers(result.triangles[i], result.triangles[i + 1],
                                    result.triangles[i + 2], Point2D(5, 5)));
    }
}

TEST(TessellatorTest, SameWoundInnerContourIsFilled) {
    // Winding number 2 is still inside under the non-zero rule
    TessellationResult result = Tessellator::triangulate({
        square(0, 0, 10),
        square(3, 3, 4)
    });

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.area(), 100.0, 1e-9);
}

TEST(TessellatorTest, IslandInsideHole) {
    TessellationResult result = Tessellator::triangulate({
        square(0, 0, 20),
        square(5, 5, 10, false),
        square(8, 8, 4)
    });

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.area(), 400.0 - 100.0 + 16.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, TwoHoles) {
    TessellationResult result = Tessellator::triangulate({
        square(0, 0, 30),
        square(5, 5, 5, false),
        square(18, 12, 6, false)
    });

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.area(), 900.0 - 25.0 - 36.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, SelfIntersectingBowTie) {
    TessellationResult result = Tessellator::triangulate({
        makeLoop({Point2D(0, 0), Point2D(10, 10), Point2D(10, 0), Point2D(0, 10)})
    });

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.triangleCount(), 2u);
    EXPECT_NEAR(result.area(), 50.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, OverlappingContoursAreMerged) {
    TessellationResult result = Tessellator::triangulate({
        square(0, 0, 10),
        square(5, 5, 10)
    });

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.area(), 175.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, NonConvexPolygon) {
    // L shape
    TessellationResult result = Tessellator::triangulate({
        makeLoop({Point2D(0, 0), Point2D(10, 0), Point2D(10, 4), Point2D(4, 4),
                  Point2D(4, 10), Point2D(0, 10)})
    });

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.triangleCount(), 4u);
    EXPECT_NEAR(result.area(), 64.0, 1e-9);
    expectCounterClockwise(result);
}

TEST(TessellatorTest, OpenLoopIsClosedImplicitly) {
    Loop open(std::vector<Point2D>{Point2D(0, 0), Point2D(4, 0), Point2D(0, 3)});
    TessellationResult result = Tessellator::triangulate({open});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.triangleCount(), 1u);
    EXPECT_NEAR(result.area(), 6.0, 1e-9);
}

TEST(TessellatorTest, DegenerateInputGivesNoTriangles) {
    TessellationResult empty = Tessellator::triangulate({});
    EXPECT_TRUE(empty.success);
    EXPECT_TRUE(empty.triangles.empty());

    Loop line(std::vector<Point2D>{Point2D(0, 0), Point2D(10, 10)});
    TessellationResult tooShort = Tessellator::triangulate({line});
    EXPECT_TRUE(tooShort.success);
    EXPECT_TRUE(tooShort.triangles.empty());

    TessellationResult collinear = Tessellator::triangulate({
        makeLoop({Point2D(0, 0), Point2D(5, 5), Point2D(10, 10)})
    });
    EXPECT_TRUE(collinear.success);
    EXPECT_TRUE(collinear.triangles.empty());
}

TEST(TessellatorTest, InvalidScaleFactorIsAnError) {
    TessellatorOptions options;
    options.scaleFactor = 0;
    TessellationResult result = Tessellator::triangulate({square(0, 0, 10)}, options);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errors.empty());
    EXPECT_TRUE(result.triangles.empty());
}

TEST(TessellatorTest, SubUnitGeometryKeepsItsShape) {
    // A 0.0016 unit triangle, well below the 0.001 grid of scaleFactor alone
    std::vector<Loop> loops = {
        makeLoop({Point2D(0, 0), Point2D(0.0016, 0), Point2D(0, 0.0016)})
    };

    TessellationResult result = Tessellator::triangulate(loops);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.triangleCount(), 1u);
    EXPECT_NEAR(result.area(), 1.28e-6, 1e-10);
    expectCounterClockwise(result);

    // Without the grid floor the vertices snap to (0, 0), (0.002, 0), (0, 0.002)
    TessellatorOptions coarse;
    coarse.minGridSteps = 0;
    TessellationResult snapped = Tessellator::triangulate(loops, coarse);
    ASSERT_TRUE(snapped.success);
    EXPECT_NEAR(snapped.area(), 2e-6, 1e-12);
}
