#include "playfield/algo/gjk.hpp"
#include "playfield/core/debug.hpp"

#include <cmath>

namespace {

constexpr int kMaxGjkIterations = 64;

/**
 * @brief Perpendicular of edge pointing away from a reference vector
 */
Vector perpAwayFrom(const Vector &edge, const Vector &reference) {
    Vector p(-edge.y, edge.x);
    if (p.dotProduct(reference) > 0) {
        p = -p;
    }
    return p;
}

/**
 * @brief Reduces the simplex towards the origin and picks the next direction
 * @return true when the simplex encloses (or touches) the origin
 */
bool handleSimplex(Simplex &simplex, Vector &direction) {
    if (simplex.points.size() == 2) {
        Vector const a = simplex.points[1];
        Vector const b = simplex.points[0];
        Vector const ab = b - a;
        Vector const ao = -a;

        if (ab.dotProduct(ao) > 0) {
            Vector const perp = perpAwayFrom(ab, a);
            if (std::fabs(perp.dotProduct(ao)) < EPSILON * (1.0 + ab.length())) {
                // Origin lies on segment AB
                return true;
            }
            direction = perp;
        } else {
            simplex.points = {a};
            direction = ao;
        }
        return false;
    }

    Vector const a = simplex.points[2];
    Vector const b = simplex.points[1];
    Vector const c = simplex.points[0];

    Vector const ab = b - a;
    Vector const ac = c - a;
    Vector const ao = -a;

    Vector const abPerp = perpAwayFrom(ab, ac);
    if (abPerp.dotProduct(ao) > 0) {
        simplex.points = {b, a};
        direction = abPerp;
        return false;
    }

    Vector const acPerp = perpAwayFrom(ac, ab);
    if (acPerp.dotProduct(ao) > 0) {
        simplex.points = {c, a};
        direction = acPerp;
        return false;
    }

    return true;
}

}  // namespace

bool GJKIntersect(const ShapeData &a, const ShapeData &b, Simplex &simplex) {
    simplex.points.clear();
    if (a.poly == nullptr || b.poly == nullptr || a.poly->vertices.empty() || b.poly->vertices.empty()) {
        return false;
    }

    Vector direction(1, 0);
    simplex.points.push_back(supportMinkowski(a, b, direction));
    direction = -simplex.points[0];

    for (int iteration = 0; iteration < kMaxGjkIterations; ++iteration) {
        if (direction.isZero()) {
            // Origin coincides with a support point
            return true;
        }

        Vector const newPoint = supportMinkowski(a, b, direction);
        if (newPoint.dotProduct(direction) < 0) {
            return false;
        }

        simplex.points.push_back(newPoint);
        if (handleSimplex(simplex, direction)) {
            return true;
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "GJK exceeded " << kMaxGjkIterations << " iterations, assuming no collision\n");
    return false;
}
