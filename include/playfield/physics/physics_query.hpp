/**
 * @file physics_query.hpp
 * @brief Interface to the world's shape-cast queries
 *
 * Bodies that integrate their own motion only need two questions answered:
 * how far can this shape travel along a motion vector, and what surface is it
 * resting against afterwards. Keeping those behind an interface lets the
 * integrators run against CollisionWorld or a scripted fake.
 */

#pragma once

#include <cstdint>
#include <optional>

#include "playfield/math/polygon.hpp"
#include "playfield/math/vector_math.hpp"

namespace Physics {

class IPhysicsQuery {
public:
    virtual ~IPhysicsQuery() = default;

    /**
     * @brief Casts a shape along a motion vector
     *
     * @param xform Shape transform at the start of the motion
     * @param motion Intended displacement
     * @param shape Convex shape in local space
     * @param mask Collision layers to test against
     * @return std::nullopt if the full motion is free, otherwise the safe
     *         fraction in [0,1] (0 when the shape already overlaps something)
     */
    virtual std::optional<double> sweep(const Transform2D& xform,
                                        const Vector& motion,
                                        const ConvexPolygonShape& shape,
                                        uint32_t mask) const = 0;

    /**
     * @brief Rest info at a transform reached by a clamped sweep
     *
     * @param xform Shape transform after the safe part of the motion
     * @param motion The motion that was swept (its direction selects the contact)
     * @param shape Convex shape in local space
     * @param mask Collision layers to test against
     * @return Unit surface normal pointing from the touched collider towards
     *         the shape, or std::nullopt if no contact can be resolved
     */
    virtual std::optional<Vector> contactNormal(const Transform2D& xform,
                                                const Vector& motion,
                                                const ConvexPolygonShape& shape,
                                                uint32_t mask) const = 0;
};

} // namespace Physics
