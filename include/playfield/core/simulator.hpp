/**
 * @file simulator.hpp
 * @brief Owns the ECS registry, the collision world and the per-tick systems.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "playfield/core/system_config.hpp"
#include "playfield/input/input_state.hpp"
#include "playfield/physics/collision_world.hpp"
#include "playfield/scenarios/i_scenario.hpp"
#include "playfield/systems/i_system.hpp"

namespace Systems {
class ForceApplicatorSystem;
}

/**
 * @class Simulator
 * @brief Steps a scene with a fixed system order.
 *
 * Each tick:
 * 1. the collision world is rebuilt from StaticBody entities
 * 2. ForceApplicatorSystem turns input into soft body force
 * 3. SoftBodySystem
 * 4. PolygonBodySystem
 */
class Simulator {
public:
    Simulator();
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    /**
     * @brief Takes ownership of a scenario; call reset() to build it.
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Clears the registry and recreates the current scenario's entities.
     */
    void reset();

    /**
     * @brief Input service for the force applicator; may be nullptr.
     */
    void setInput(const Input::IInputState* input);

    /**
     * @brief Advances every system by one step of SecondsPerTick.
     */
    void tick();

    /**
     * @brief Advances every system by one step of the given length.
     */
    void tick(double dt);

    void applyConfig(const SystemConfig& cfg);
    const SystemConfig& getConfig() const { return currentConfig; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    const Physics::CollisionWorld& getCollisionWorld() const { return collisionWorld; }

    /** @brief Current scenario, or nullptr if none was loaded */
    const IScenario* getCurrentScenario() const { return scenarioPtr.get(); }

    std::size_t getTickCount() const { return tickCount; }

private:
    void createSystems();

    entt::registry registry;
    Physics::CollisionWorld collisionWorld;
    std::unique_ptr<IScenario> scenarioPtr;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::ForceApplicatorSystem* forceApplicator = nullptr;
    const Input::IInputState* inputState = nullptr;
    SystemConfig currentConfig;
    std::size_t tickCount = 0;
};
