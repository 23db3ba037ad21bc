#include "playfield/systems/soft_body_system.hpp"

#include "playfield/bodies/soft_body.hpp"
#include "playfield/core/profile.hpp"

namespace Systems {

SoftBodySystem::SoftBodySystem(const Physics::IPhysicsQuery* query)
    : physicsQuery(query)
{
}

void SoftBodySystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("SoftBodySystem");

    Vector const gravity = sysConfig.gravity();
    auto view = registry.view<Bodies::SoftBody>();
    for (auto [entity, body] : view.each()) {
        body.step(dt, gravity, physicsQuery);
    }
}

} // namespace Systems
