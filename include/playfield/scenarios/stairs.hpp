/**
 * @file stairs.hpp
 * @brief A staircase descending left to right, with bodies tumbling down it
 */

#pragma once

#include <entt/entt.hpp>
#include "playfield/scenarios/i_scenario.hpp"

/**
 * @struct StairsConfig
 * @brief Staircase dimensions and body placement
 */
struct StairsConfig {
    int stepCount = 6;
    double stepWidth = 130.0;
    double stepHeight = 55.0;
    double topY = 200.0;          // Top surface of the first step
    double wallThickness = 20.0;

    double boxHalfSize = 18.0;
    double boxBounce = 0.45;
    double boxFriction = 0.1;
    double boxSpeed = 140.0;      // Initial rightward speed
    double softBodyRadius = 26.0;
};

class StairsScenario : public IScenario {
public:
    StairsScenario() = default;
    ~StairsScenario() override = default;

    SystemConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

private:
    StairsConfig scenarioConfig;
};
