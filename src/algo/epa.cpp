#include "playfield/algo/epa.hpp"
#include "playfield/math/vector_math.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace {

constexpr int kMaxEpaIterations = 64;
constexpr double kEpaTolerance = 1e-6;

/**
 * @brief Distance from the origin to edge ab of a counter-clockwise polygon
 *
 * The normal is taken from the winding rather than from the origin side, so
 * it stays outward even when the origin lies on the edge.
 */
double edgeDistance(const Vector &a, const Vector &b, Vector &normal) {
    Vector const e = b - a;
    normal = Vector(e.y, -e.x).normalized();
    return normal.dotProduct(a);
}

}  // namespace

std::optional<EPAResult> EPA(const ShapeData &A, const ShapeData &B, const Simplex &simplex) {
    if (simplex.points.size() != 3) {
        return std::nullopt;
    }

    std::vector<Vector> poly = simplex.points;

    double const area = (poly[1] - poly[0]).cross(poly[2] - poly[0]);
    if (std::fabs(area) < 1e-12) {
        // Collinear simplex: shapes only touch along a line
        return std::nullopt;
    }
    if (area < 0) {
        std::reverse(poly.begin(), poly.end());
    }

    for (int iter = 0; iter < kMaxEpaIterations; ++iter) {
        double closestDist = std::numeric_limits<double>::max();
        size_t closestEdge = 0;
        Vector edgeNormal;

        for (size_t i = 0; i < poly.size(); ++i) {
            size_t const j = (i + 1) % poly.size();
            Vector normal;
            double const dist = edgeDistance(poly[i], poly[j], normal);
            if (dist < closestDist) {
                closestDist = dist;
                closestEdge = i;
                edgeNormal = normal;
            }
        }

        if (edgeNormal.isZero()) {
            return std::nullopt;
        }

        Vector const p = supportMinkowski(A, B, edgeNormal);
        double const d = p.dotProduct(edgeNormal);

        if (d - closestDist < kEpaTolerance) {
            return EPAResult{edgeNormal, d};
        }

        poly.insert(poly.begin() + static_cast<std::ptrdiff_t>(closestEdge + 1), p);
    }

    std::cerr << "Warning: EPA exceeded max iterations. Returning no penetration." << std::endl;
    return std::nullopt;
}
