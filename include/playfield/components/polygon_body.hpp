/**
 * @file polygon_body.hpp
 * @brief Manually integrated rigid polygon body
 *
 * The body owns an ordered point sequence in local coordinates and derives a
 * convex collision shape from it. Edits go through setPoints()/setPoint(),
 * which regenerate the shape before returning, so the shape always matches
 * the points by the next physics step.
 *
 * Required companion components for PolygonBodySystem:
 * - Position (origin of the local frame)
 * - Velocity
 *
 * Optional:
 * - AngularPosition (rotates the local frame)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "playfield/components/basic.hpp"
#include "playfield/math/polygon.hpp"

namespace Components {

/**
 * @struct PolygonBodyConfig
 * @brief Tunables of a polygon body
 */
struct PolygonBodyConfig {
    Color color{200, 120, 60};
    double gravityScale = 1.0;
    double bounce = 0.3;    ///< Restitution in [0,1]
    double friction = 0.2;  ///< Tangential damping per contact in [0,1]
    uint32_t collisionMask = DefaultCollisionLayer;
};

class PolygonBody {
public:
    explicit PolygonBody(PolygonBodyConfig config = PolygonBodyConfig(),
                         std::vector<Vector> points = {});

    /**
     * @brief Replaces the whole point sequence and regenerates the shape.
     *
     * With fewer than 3 usable points the shape becomes absent and a warning
     * is printed; the points are stored regardless.
     */
    void setPoints(std::vector<Vector> points);

    /**
     * @brief Moves a single vertex and regenerates the shape.
     * @return false (with a warning, nothing changed) if index is out of range
     */
    bool setPoint(std::size_t index, const Vector& point);

    const std::vector<Vector>& getPoints() const { return points; }

    /**
     * @brief Collision shape, created on first use.
     * @return nullptr while the point sequence cannot form a convex polygon
     */
    const ConvexPolygonShape* getShape();

    /** @brief True if a valid shape exists (builds it if never built) */
    bool hasShape() { return getShape() != nullptr; }

    /** @brief Number of times the shape has been (re)generated */
    std::size_t getShapeRevision() const { return shapeRevision; }

    PolygonBodyConfig config;

private:
    void regenerateShape();

    std::vector<Vector> points;
    std::optional<ConvexPolygonShape> shape;
    bool shapeBuilt = false;
    std::size_t shapeRevision = 0;
};

} // namespace Components
