/**
 * @file polygon.cpp
 * @brief Convex hull construction and shape factories
 */

#include "playfield/math/polygon.hpp"

#include <algorithm>
#include <cmath>

#include "playfield/core/constants.hpp"

namespace {

/**
 * @brief Orientation of o->a->b; positive for a counter-clockwise turn
 */
double turn(const Vector& o, const Vector& a, const Vector& b) {
    return (a - o).cross(b - o);
}

}  // namespace

std::optional<ConvexPolygonShape> buildConvexHull(const std::vector<Vector>& points) {
    if (points.size() < 3) {
        return std::nullopt;
    }

    std::vector<Vector> sorted = points;
    std::sort(sorted.begin(), sorted.end(), [](const Vector& a, const Vector& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });

    // Lower hull then upper hull; collinear points are dropped (turn <= 0)
    std::vector<Vector> hull(sorted.size() * 2);
    size_t k = 0;
    for (const auto& p : sorted) {
        while (k >= 2 && turn(hull[k - 2], hull[k - 1], p) <= EPSILON) {
            --k;
        }
        hull[k++] = p;
    }
    size_t const lowerSize = k + 1;
    for (size_t i = sorted.size() - 1; i-- > 0;) {
        const Vector& p = sorted[i];
        while (k >= lowerSize && turn(hull[k - 2], hull[k - 1], p) <= EPSILON) {
            --k;
        }
        hull[k++] = p;
    }
    // Last point repeats the first
    hull.resize(k - 1);

    if (hull.size() < 3) {
        return std::nullopt;
    }

    ConvexPolygonShape shape;
    shape.vertices = std::move(hull);
    return shape;
}

ConvexPolygonShape makeBoxShape(double halfWidth, double halfHeight) {
    ConvexPolygonShape box;
    box.vertices.emplace_back(-halfWidth, -halfHeight);
    box.vertices.emplace_back(halfWidth, -halfHeight);
    box.vertices.emplace_back(halfWidth, halfHeight);
    box.vertices.emplace_back(-halfWidth, halfHeight);
    return box;
}

ConvexPolygonShape makeRegularPolygonShape(int sides, double radius) {
    sides = std::max(3, sides);
    ConvexPolygonShape poly;
    poly.vertices.reserve(static_cast<size_t>(sides));
    double const step = 2.0 * PlayfieldConstants::Pi / sides;
    for (int i = 0; i < sides; ++i) {
        double const a = step * i;
        poly.vertices.emplace_back(radius * std::cos(a), radius * std::sin(a));
    }
    return poly;
}
