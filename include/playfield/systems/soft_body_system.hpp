/**
 * @file soft_body_system.hpp
 * @brief Steps every SoftBody in the registry against the collision world
 */

#pragma once

#include <entt/entt.hpp>

#include "playfield/physics/physics_query.hpp"
#include "playfield/systems/i_system.hpp"

namespace Systems {

class SoftBodySystem : public ISystem {
public:
    explicit SoftBodySystem(const Physics::IPhysicsQuery* query = nullptr);
    ~SoftBodySystem() override = default;

    void setPhysicsQuery(const Physics::IPhysicsQuery* query) { physicsQuery = query; }

    void update(entt::registry& registry, double dt) override;

private:
    const Physics::IPhysicsQuery* physicsQuery;
};

} // namespace Systems
