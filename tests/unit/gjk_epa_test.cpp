#include <gtest/gtest.h>

#include "playfield/algo/epa.hpp"
#include "playfield/algo/gjk.hpp"
#include "playfield/math/polygon.hpp"

class GjkEpaTest : public ::testing::Test {
protected:
    ConvexPolygonShape box = makeBoxShape(1.0, 1.0);

    ShapeData placed(double x, double y, Vector sweep = Vector()) const {
        return ShapeData{&box, Transform2D{Position(x, y), 0.0}, sweep};
    }
};

TEST_F(GjkEpaTest, SeparatedBoxesDoNotIntersect) {
    Simplex simplex;
    EXPECT_FALSE(GJKIntersect(placed(0.0, 0.0), placed(5.0, 0.3), simplex));
    EXPECT_FALSE(GJKIntersect(placed(0.0, 0.0), placed(0.2, -3.0), simplex));
}

TEST_F(GjkEpaTest, OverlappingBoxesIntersect) {
    Simplex simplex;
    EXPECT_TRUE(GJKIntersect(placed(0.0, 0.0), placed(1.5, 0.3), simplex));
    EXPECT_TRUE(GJKIntersect(placed(0.0, 0.0), placed(0.0, 0.0), simplex));
}

TEST_F(GjkEpaTest, SweptShapeHitsWhatLiesAhead) {
    Simplex simplex;
    EXPECT_TRUE(GJKIntersect(placed(0.0, 0.0, Vector(10.0, 0.0)), placed(6.0, 0.5), simplex));
    EXPECT_FALSE(GJKIntersect(placed(0.0, 0.0, Vector(0.0, 10.0)), placed(6.0, 0.5), simplex));
    EXPECT_FALSE(GJKIntersect(placed(0.0, 0.0, Vector(-10.0, 0.0)), placed(6.0, 0.5), simplex));
}

TEST_F(GjkEpaTest, NullOrEmptyPolygonNeverIntersects) {
    Simplex simplex;
    ShapeData none{nullptr, Transform2D{}, Vector()};
    EXPECT_FALSE(GJKIntersect(none, placed(0.0, 0.0), simplex));

    ConvexPolygonShape empty;
    ShapeData emptyShape{&empty, Transform2D{}, Vector()};
    EXPECT_FALSE(GJKIntersect(placed(0.0, 0.0), emptyShape, simplex));
}

TEST_F(GjkEpaTest, EpaFindsMinimumTranslation) {
    Simplex simplex;
    ShapeData const a = placed(0.0, 0.0);
    ShapeData const b = placed(1.5, 0.3);
    ASSERT_TRUE(GJKIntersect(a, b, simplex));

    auto result = EPA(a, b, simplex);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->normal.x, 1.0, 1e-6);
    EXPECT_NEAR(result->normal.y, 0.0, 1e-6);
    EXPECT_NEAR(result->penetration, 0.5, 1e-6);
}

TEST_F(GjkEpaTest, EpaVerticalOverlap) {
    // Screen axes: a sits above b, so it separates by moving up (-y)
    Simplex simplex;
    ShapeData const a = placed(0.2, 0.0);
    ShapeData const b = placed(0.0, 1.9);
    ASSERT_TRUE(GJKIntersect(a, b, simplex));

    auto result = EPA(a, b, simplex);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->normal.x, 0.0, 1e-6);
    EXPECT_NEAR(result->normal.y, 1.0, 1e-6);
    EXPECT_NEAR(result->penetration, 0.1, 1e-6);
}

TEST_F(GjkEpaTest, EpaRejectsIncompleteSimplex) {
    Simplex simplex;
    simplex.points = {Vector(1.0, 0.0), Vector(-1.0, 0.0)};
    EXPECT_FALSE(EPA(placed(0.0, 0.0), placed(0.5, 0.0), simplex).has_value());
}
