/**
 * @file playground.hpp
 * @brief Walled room with a ramp, a falling polygon body and a player-driven soft body
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "playfield/bodies/soft_body.hpp"
#include "playfield/components/polygon_body.hpp"
#include "playfield/core/constants.hpp"
#include "playfield/scenarios/i_scenario.hpp"

/**
 * @struct PlaygroundConfig
 * @brief Layout of the playground room
 */
struct PlaygroundConfig {
    double wallThickness = 20.0;

    // Ramp
    Position rampCenter{330.0, 430.0};
    double rampHalfLength = 180.0;
    double rampHalfThickness = 10.0;
    double rampAngle = 0.35;            // radians, clockwise on screen

    // Polygon body
    Position polygonStart{260.0, 120.0};
    Vector polygonVelocity{60.0, 0.0};
    std::vector<Vector> polygonPoints{
        {-24.0, -18.0}, {22.0, -26.0}, {30.0, 12.0}, {0.0, 28.0}, {-28.0, 14.0}
    };
    Components::PolygonBodyConfig polygonBody;

    // Soft body
    Position softBodyStart{720.0, 200.0};
    Bodies::SoftBodyConfig softBody;
    double directionalPower = PlayfieldConstants::DefaultDirectionalPower;
};

class PlaygroundScenario : public IScenario {
public:
    PlaygroundScenario() = default;
    explicit PlaygroundScenario(const PlaygroundConfig& config) : scenarioConfig(config) {}
    ~PlaygroundScenario() override = default;

    SystemConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

    const PlaygroundConfig& getScenarioConfig() const { return scenarioConfig; }

private:
    PlaygroundConfig scenarioConfig;
};
