#include <gtest/gtest.h>
#include <cmath>
#include "playfield/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector left_mult = 2.0 * v;
    EXPECT_DOUBLE_EQ(left_mult.x, 4.0);
    EXPECT_DOUBLE_EQ(left_mult.y, 6.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    v *= -1.0;
    EXPECT_DOUBLE_EQ(v.x, -2.0);
    EXPECT_DOUBLE_EQ(v.y, -3.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    Vector v4(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v4.normalized().length(), 1.0);

    Vector v5(1.0, 0.0);
    Vector v6(0.0, 1.0);
    EXPECT_DOUBLE_EQ(v5.cross(v6), 1.0);

    Vector perp_v5 = v5.perp();
    EXPECT_DOUBLE_EQ(perp_v5.x, 0.0);
    EXPECT_DOUBLE_EQ(perp_v5.y, 1.0);

    Vector rotated = v5.rotateByAngle(M_PI / 2);
    EXPECT_NEAR(rotated.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated.y, 1.0, EPSILON);

    Vector projected = v.projectOnto(Vector(2.0, 0.0));
    EXPECT_DOUBLE_EQ(projected.x, 3.0);
    EXPECT_DOUBLE_EQ(projected.y, 0.0);
}

TEST(VectorMathTest, ZeroVectorHasNoDirection) {
    Vector zero;
    EXPECT_TRUE(zero.isZero());

    Vector n = zero.normalized();
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);

    Vector p = Vector(1.0, 1.0).projectOnto(zero);
    EXPECT_TRUE(p.isZero());
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position p3 = p1 + p2;
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    p1 += Vector(0.5, -1.0);
    EXPECT_DOUBLE_EQ(p1.x, 1.5);
    EXPECT_DOUBLE_EQ(p1.y, 1.0);

    EXPECT_DOUBLE_EQ(Position(0.0, 0.0).dist(Position(3.0, 4.0)), 5.0);
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v = static_cast<Vector>(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2 = static_cast<Position>(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}
