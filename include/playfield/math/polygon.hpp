/**
 * @file polygon.hpp
 * @brief Convex polygon shapes, transforms and support functions
 *
 * Provides the geometry consumed by the collision queries (GJK/EPA):
 * - Transform2D mapping local shape space into world space
 * - ConvexPolygonShape stored counter-clockwise in local space
 * - Convex hull construction from an arbitrary point sequence
 * - Support functions for transformed and swept shapes
 *
 * A swept shape is the convex hull of the shape at its transform and the same
 * shape translated by the sweep vector. Its support point is the ordinary
 * support point plus the sweep vector whenever the sweep points along the
 * query direction.
 */

#ifndef PLAYFIELD_POLYGON_HPP
#define PLAYFIELD_POLYGON_HPP

#include <cmath>
#include <optional>
#include <vector>

#include "playfield/math/vector_math.hpp"

/**
 * @brief Position and rotation of a shape in world space
 */
struct Transform2D {
    Position origin;        ///< World position of the local origin
    double rotation = 0.0;  ///< Rotation in radians

    /** @brief Maps a local-space point into world space */
    Position apply(const Vector& local) const {
        Vector const r = local.rotateByAngle(rotation);
        return {origin.x + r.x, origin.y + r.y};
    }

    /** @brief Same rotation, origin moved by a displacement */
    Transform2D translated(const Vector& offset) const {
        Transform2D t = *this;
        t.origin += offset;
        return t;
    }
};

/**
 * @brief Convex polygon in local space
 *
 * Vertices are ordered counter-clockwise (in y-up math axes) and contain no
 * duplicate or collinear points. Instances built through buildConvexHull()
 * always hold at least 3 vertices.
 */
struct ConvexPolygonShape {
    std::vector<Vector> vertices;
};

/**
 * @brief Builds the convex hull of a point cloud (Andrew's monotone chain)
 *
 * @param points Arbitrary local-space points, any order
 * @return The hull, or std::nullopt when fewer than 3 non-collinear points exist
 */
std::optional<ConvexPolygonShape> buildConvexHull(const std::vector<Vector>& points);

/**
 * @brief Axis-aligned box centred on the local origin
 */
ConvexPolygonShape makeBoxShape(double halfWidth, double halfHeight);

/**
 * @brief Regular polygon centred on the local origin
 * @param sides Number of sides (clamped to at least 3)
 * @param radius Circumradius
 */
ConvexPolygonShape makeRegularPolygonShape(int sides, double radius);

/**
 * @brief Finds the furthest world-space vertex of a polygon along a direction
 *
 * @param poly The polygon to query
 * @param direction Direction to project along
 * @param xform World transform of the polygon
 * @return Vector World-space vertex with the largest projection
 */
inline Vector supportPolygon(const ConvexPolygonShape& poly,
                             const Vector& direction,
                             const Transform2D& xform)
{
    double const c = std::cos(xform.rotation);
    double const s = std::sin(xform.rotation);

    double bestProj = -1e300;
    Vector best;
    for (const auto& lv : poly.vertices) {
        double const wx = xform.origin.x + (lv.x * c - lv.y * s);
        double const wy = xform.origin.y + (lv.x * s + lv.y * c);
        double const proj = wx * direction.x + wy * direction.y;
        if (proj > bestProj) {
            bestProj = proj;
            best.x = wx;
            best.y = wy;
        }
    }
    return best;
}

/**
 * @brief A shape placed in the world, optionally swept along a vector
 *
 * The polygon is referenced, not owned; it must outlive the ShapeData.
 */
struct ShapeData {
    const ConvexPolygonShape* poly = nullptr;  ///< Local-space polygon
    Transform2D xform;                         ///< World placement at the start of the sweep
    Vector sweep;                              ///< Sweep vector, (0,0) for a static placement
};

/**
 * @brief Support point of a possibly swept shape
 */
inline Vector supportShape(const ShapeData& shape, const Vector& direction) {
    Vector p = supportPolygon(*shape.poly, direction, shape.xform);
    if (shape.sweep.dotProduct(direction) > 0.0) {
        p += shape.sweep;
    }
    return p;
}

/**
 * @brief Support point of the Minkowski difference A - B
 *
 * @param A First shape
 * @param B Second shape
 * @param d Direction for the support calculation
 * @return Vector Support point in Minkowski difference space
 */
inline Vector supportMinkowski(const ShapeData& A, const ShapeData& B, const Vector& d) {
    return supportShape(A, d) - supportShape(B, -d);
}

#endif // PLAYFIELD_POLYGON_HPP
