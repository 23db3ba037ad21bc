#ifndef PLAYFIELD_I_SCENARIO_HPP
#define PLAYFIELD_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "playfield/core/system_config.hpp"

/**
 * @brief Abstract base class for any playfield scene
 *
 * Each scenario must provide:
 *  - getConfig() returning the SystemConfig its systems run with
 *  - createEntities() that spawns colliders and bodies
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual SystemConfig getConfig() const = 0;

    /**
     * @brief Creates scenario-specific entities in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;
};

#endif // PLAYFIELD_I_SCENARIO_HPP
