/**
 * @file collision_world.cpp
 * @brief Sweep (bisection over swept-hull GJK) and rest-info (EPA) queries
 */

#include "playfield/physics/collision_world.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include "playfield/algo/epa.hpp"
#include "playfield/algo/gjk.hpp"
#include "playfield/components/basic.hpp"
#include "playfield/core/debug.hpp"
#include "playfield/core/profile.hpp"

namespace Physics {

CollisionWorld::CollisionWorld(const CollisionWorldConfig& config)
    : config(config)
{
}

std::size_t CollisionWorld::addCollider(StaticCollider collider) {
    colliders.push_back(std::move(collider));
    return colliders.size() - 1;
}

void CollisionWorld::clear() {
    colliders.clear();
}

void CollisionWorld::syncFromRegistry(const entt::registry& registry) {
    PROFILE_SCOPE("CollisionWorld::sync");

    colliders.clear();
    auto view = registry.view<const Components::StaticBody, const Components::Position, const ConvexPolygonShape>();
    for (auto [entity, body, pos, shape] : view.each()) {
        StaticCollider collider;
        collider.shape = shape;
        collider.xform.origin = pos;
        if (const auto* angle = registry.try_get<Components::AngularPosition>(entity)) {
            collider.xform.rotation = angle->angle;
        }
        collider.layer = body.layer;
        colliders.push_back(std::move(collider));
    }
}

bool CollisionWorld::intersects(const Transform2D& xform, const ConvexPolygonShape& shape, uint32_t mask) const {
    ShapeData const probe{&shape, xform, Vector()};
    Simplex simplex;
    for (const auto& collider : colliders) {
        if ((collider.layer & mask) == 0) {
            continue;
        }
        ShapeData const other{&collider.shape, collider.xform, Vector()};
        if (GJKIntersect(probe, other, simplex)) {
            return true;
        }
    }
    return false;
}

std::optional<double> CollisionWorld::sweepAgainst(const StaticCollider& collider,
                                                   const Transform2D& xform,
                                                   const Vector& motion,
                                                   const ConvexPolygonShape& shape) const
{
    ShapeData body{&shape, xform, Vector()};
    ShapeData const other{&collider.shape, collider.xform, Vector()};
    Simplex simplex;

    // Already overlapping: no part of the motion is safe
    if (GJKIntersect(body, other, simplex)) {
        return 0.0;
    }

    body.sweep = motion;
    if (!GJKIntersect(body, other, simplex)) {
        return std::nullopt;
    }

    // The swept hull over [0, t] grows with t, so overlap is monotonic in t
    double low = 0.0;
    double hi = 1.0;
    for (int i = 0; i < config.sweepIterations; ++i) {
        double const mid = 0.5 * (low + hi);
        body.sweep = motion * mid;
        if (GJKIntersect(body, other, simplex)) {
            hi = mid;
        } else {
            low = mid;
        }
    }
    return low;
}

std::optional<double> CollisionWorld::sweep(const Transform2D& xform,
                                            const Vector& motion,
                                            const ConvexPolygonShape& shape,
                                            uint32_t mask) const
{
    std::optional<double> best;
    for (const auto& collider : colliders) {
        if ((collider.layer & mask) == 0) {
            continue;
        }
        auto const fraction = sweepAgainst(collider, xform, motion, shape);
        if (fraction && (!best || *fraction < *best)) {
            best = fraction;
        }
    }

    DebugStats::recordSweep(best.has_value());
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "sweep (" << motion.x << ", " << motion.y << ") -> "
              << (best ? *best : 1.0) << "\n");
    return best;
}

std::optional<Vector> CollisionWorld::contactNormal(const Transform2D& xform,
                                                    const Vector& motion,
                                                    const ConvexPolygonShape& shape,
                                                    uint32_t mask) const
{
    // Bridge the bisection gap left by sweep() plus the contact margin
    double const gap = motion.length() * std::ldexp(1.0, -config.sweepIterations);
    Vector const offset = motion.normalized() * (config.contactMargin + gap);
    ShapeData const probe{&shape, xform.translated(offset), Vector()};

    std::optional<Vector> normal;
    double deepest = -std::numeric_limits<double>::max();
    Simplex simplex;
    for (const auto& collider : colliders) {
        if ((collider.layer & mask) == 0) {
            continue;
        }
        ShapeData const other{&collider.shape, collider.xform, Vector()};
        if (!GJKIntersect(probe, other, simplex)) {
            continue;
        }
        auto const result = EPA(probe, other, simplex);
        if (!result) {
            continue;
        }
        if (result->penetration > deepest) {
            deepest = result->penetration;
            normal = -result->normal;
        }
    }

    DebugStats::recordRestQuery(normal.has_value());
    return normal;
}

} // namespace Physics
