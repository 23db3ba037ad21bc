#include "playfield/systems/polygon_body_system.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "playfield/components/basic.hpp"
#include "playfield/core/debug.hpp"
#include "playfield/core/profile.hpp"

namespace Systems {

PolygonBodySystem::PolygonBodySystem(const Physics::IPhysicsQuery* query)
    : physicsQuery(query)
{
}

void PolygonBodySystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("PolygonBodySystem");

    Vector const gravity = sysConfig.gravity();

    auto view = registry.view<Components::Position, Components::Velocity, Components::PolygonBody>();
    for (auto [entity, pos, vel, body] : view.each()) {
        double rotation = 0.0;
        if (const auto* angle = registry.try_get<Components::AngularPosition>(entity)) {
            rotation = angle->angle;
        }
        stepBody(body, pos, rotation, vel, gravity, physicsQuery, dt, specificConfig);
    }
}

StepOutcome PolygonBodySystem::stepBody(Components::PolygonBody& body,
                                        Position& position,
                                        double rotation,
                                        Vector& velocity,
                                        const Vector& gravity,
                                        const Physics::IPhysicsQuery* query,
                                        double dt,
                                        const CollisionResponseConfig& response)
{
    if (query == nullptr) {
        std::cerr << "Warning: PolygonBody step skipped, no physics query service." << std::endl;
        DebugStats::recordSkippedStep();
        return StepOutcome::Skipped;
    }
    const ConvexPolygonShape* shape = body.getShape();
    if (shape == nullptr) {
        std::cerr << "Warning: PolygonBody step skipped, no collision shape." << std::endl;
        DebugStats::recordSkippedStep();
        return StepOutcome::Skipped;
    }

    velocity += gravity * body.config.gravityScale * dt;
    Vector const motion = velocity * dt;

    Transform2D const xform{position, rotation};
    auto const safeFraction = query->sweep(xform, motion, *shape, body.config.collisionMask);
    if (!safeFraction) {
        position += motion;
        return StepOutcome::Moved;
    }

    double const fraction = std::clamp(*safeFraction, 0.0, 1.0);
    position += motion * fraction;

    auto const normal = query->contactNormal(Transform2D{position, rotation}, motion, *shape,
                                             body.config.collisionMask);
    if (normal) {
        velocity = respondToContact(velocity, *normal, body.config.bounce, body.config.friction);
    } else {
        velocity = respondWithoutNormal(velocity, motion, response);
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "PolygonBody hit at fraction " << fraction
              << ", velocity now (" << velocity.x << ", " << velocity.y << ")\n");
    return StepOutcome::Collided;
}

Vector PolygonBodySystem::respondToContact(const Vector& velocity, const Vector& normal,
                                           double bounce, double friction)
{
    Vector const n = normal.normalized();
    Vector const vn = n * velocity.dotProduct(n);
    Vector const vt = velocity - vn;

    // v - (1 + bounce) * vn, with the tangential part damped by friction
    return vt * (1.0 - std::clamp(friction, 0.0, 1.0)) - vn * std::clamp(bounce, 0.0, 1.0);
}

Vector PolygonBodySystem::respondWithoutNormal(const Vector& velocity, const Vector& motion,
                                               const CollisionResponseConfig& response)
{
    Vector const vertical(0.0, 1.0);
    if (std::fabs(motion.normalized().dotProduct(vertical)) > response.verticalThreshold) {
        return {velocity.x * response.fallbackHorizontalDamping, 0.0};
    }
    return {};
}

} // namespace Systems
