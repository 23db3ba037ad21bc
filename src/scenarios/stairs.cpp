/**
 * @file stairs.cpp
 * @brief Implementation of the staircase scene.
 */

#include "playfield/scenarios/stairs.hpp"

#include "playfield/bodies/soft_body.hpp"
#include "playfield/components/basic.hpp"
#include "playfield/components/polygon_body.hpp"
#include "playfield/core/constants.hpp"
#include "playfield/math/polygon.hpp"
#include "playfield/scenarios/static_geometry.hpp"

SystemConfig StairsScenario::getConfig() const {
    SystemConfig cfg;
    cfg.SecondsPerTick = 1.0 / PlayfieldConstants::StepsPerSecond;
    cfg.GravityMagnitude = PlayfieldConstants::DefaultGravityMagnitude;
    return cfg;
}

/**
 * @brief Builds the room, one box per step reaching down to the floor, then
 *        a bouncy box and a soft body on the top step.
 */
void StairsScenario::createEntities(entt::registry& registry) const {
    SystemConfig const cfg = getConfig();
    double const width = cfg.ScreenWidth;
    double const height = cfg.ScreenHeight;
    double const floorTop = height - scenarioConfig.wallThickness;

    Scenarios::makeRoom(registry, width, height, scenarioConfig.wallThickness);

    for (int i = 0; i < scenarioConfig.stepCount; ++i) {
        double const top = scenarioConfig.topY + i * scenarioConfig.stepHeight;
        if (top >= floorTop) {
            break;
        }
        double const halfW = scenarioConfig.stepWidth * 0.5;
        double const halfH = (floorTop - top) * 0.5;
        double const cx = scenarioConfig.wallThickness + halfW + i * scenarioConfig.stepWidth;
        Components::Color const shade(70 + 10 * i, 70 + 10 * i, 80 + 10 * i);
        Scenarios::makeWall(registry, cx, top + halfH, halfW, halfH, 0.0, shade);
    }

    double const startX = scenarioConfig.wallThickness + scenarioConfig.stepWidth * 0.5;

    Components::PolygonBodyConfig boxConfig;
    boxConfig.color = Components::Color(230, 200, 70);
    boxConfig.bounce = scenarioConfig.boxBounce;
    boxConfig.friction = scenarioConfig.boxFriction;

    auto box = registry.create();
    registry.emplace<Components::Position>(box, startX, scenarioConfig.topY - 60.0);
    registry.emplace<Components::Velocity>(box, scenarioConfig.boxSpeed, 0.0);
    registry.emplace<Components::AngularPosition>(box, 0.0);
    registry.emplace<Components::PolygonBody>(box, boxConfig,
        makeBoxShape(scenarioConfig.boxHalfSize, scenarioConfig.boxHalfSize).vertices);

    Bodies::SoftBodyConfig softConfig;
    softConfig.radius = scenarioConfig.softBodyRadius;
    softConfig.segments = 10;

    auto soft = registry.create();
    registry.emplace<Bodies::SoftBody>(soft,
        Bodies::SoftBody::makeCircle(Position(startX - 20.0, scenarioConfig.topY - 160.0), softConfig));
    registry.emplace<Components::DirectionalForce>(soft, PlayfieldConstants::DefaultDirectionalPower);
}
