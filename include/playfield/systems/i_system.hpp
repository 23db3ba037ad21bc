/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the playfield scene
 */

#pragma once

#include <entt/entt.hpp>
#include "playfield/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Systems are stepped explicitly by the simulator's fixed-timestep loop, in a
 * fixed order, once per tick.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Advances the system by one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     * @param dt Step length in seconds
     */
    virtual void update(entt::registry& registry, double dt) = 0;

    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems that carry extra configuration of their own
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
