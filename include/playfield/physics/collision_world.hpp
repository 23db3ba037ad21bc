/**
 * @file collision_world.hpp
 * @brief Static convex colliders answering sweep and rest-info queries
 *
 * The world is a flat list of static polygons; every query walks all of them
 * that match the layer mask. Narrow phase is GJK on swept hulls, with EPA for
 * contact normals.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "playfield/physics/physics_query.hpp"

namespace Physics {

/**
 * @struct CollisionWorldConfig
 * @brief Query tuning
 */
struct CollisionWorldConfig {
    // Bisection steps when narrowing down the safe fraction
    int sweepIterations = 16;

    // Probe distance for rest-info queries, in px
    double contactMargin = 0.08;
};

struct StaticCollider {
    ConvexPolygonShape shape;
    Transform2D xform;
    uint32_t layer = 1u;
};

class CollisionWorld : public IPhysicsQuery {
public:
    explicit CollisionWorld(const CollisionWorldConfig& config = CollisionWorldConfig());

    /**
     * @brief Adds a collider
     * @return Index of the collider
     */
    std::size_t addCollider(StaticCollider collider);

    void clear();

    /**
     * @brief Rebuilds the collider list from StaticBody entities
     *
     * Picks up every entity with StaticBody, Position and ConvexPolygonShape;
     * colliders added directly are discarded.
     */
    void syncFromRegistry(const entt::registry& registry);

    std::size_t colliderCount() const { return colliders.size(); }
    const std::vector<StaticCollider>& getColliders() const { return colliders; }

    /**
     * @brief True if the shape at xform overlaps or touches any collider in mask
     */
    bool intersects(const Transform2D& xform, const ConvexPolygonShape& shape, uint32_t mask) const;

    std::optional<double> sweep(const Transform2D& xform,
                                const Vector& motion,
                                const ConvexPolygonShape& shape,
                                uint32_t mask) const override;

    std::optional<Vector> contactNormal(const Transform2D& xform,
                                        const Vector& motion,
                                        const ConvexPolygonShape& shape,
                                        uint32_t mask) const override;

    const CollisionWorldConfig& getConfig() const { return config; }

private:
    /**
     * @brief Safe fraction against a single collider, nullopt if untouched
     */
    std::optional<double> sweepAgainst(const StaticCollider& collider,
                                       const Transform2D& xform,
                                       const Vector& motion,
                                       const ConvexPolygonShape& shape) const;

    CollisionWorldConfig config;
    std::vector<StaticCollider> colliders;
};

} // namespace Physics
