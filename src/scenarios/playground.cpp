/**
 * @file playground.cpp
 * @brief Implementation of the playground scene.
 *
 * A closed room with a ramp tilted down to the right. A convex polygon body
 * drops onto the ramp and slides off it, while a soft body sitting on the
 * floor is pushed around with the directional keys.
 */

#include "playfield/scenarios/playground.hpp"

#include "playfield/components/basic.hpp"
#include "playfield/core/constants.hpp"
#include "playfield/scenarios/static_geometry.hpp"

SystemConfig PlaygroundScenario::getConfig() const {
    SystemConfig cfg;
    cfg.SecondsPerTick = 1.0 / PlayfieldConstants::StepsPerSecond;
    cfg.GravityDirection = Vector(0.0, 1.0);
    cfg.GravityMagnitude = PlayfieldConstants::DefaultGravityMagnitude;
    cfg.ScreenWidth = PlayfieldConstants::ScreenWidth;
    cfg.ScreenHeight = PlayfieldConstants::ScreenHeight;
    return cfg;
}

void PlaygroundScenario::createEntities(entt::registry& registry) const {
    SystemConfig const cfg = getConfig();
    double const width = cfg.ScreenWidth;
    double const height = cfg.ScreenHeight;

    Scenarios::makeRoom(registry, width, height, scenarioConfig.wallThickness);

    Scenarios::makeWall(registry,
                        scenarioConfig.rampCenter.x, scenarioConfig.rampCenter.y,
                        scenarioConfig.rampHalfLength, scenarioConfig.rampHalfThickness,
                        scenarioConfig.rampAngle, Components::Color(90, 90, 100));

    // Polygon body
    auto poly = registry.create();
    registry.emplace<Components::Position>(poly, scenarioConfig.polygonStart);
    registry.emplace<Components::Velocity>(poly, scenarioConfig.polygonVelocity);
    registry.emplace<Components::AngularPosition>(poly, 0.0);
    registry.emplace<Components::PolygonBody>(poly, scenarioConfig.polygonBody, scenarioConfig.polygonPoints);

    // Player-driven soft body
    auto soft = registry.create();
    registry.emplace<Bodies::SoftBody>(soft,
        Bodies::SoftBody::makeCircle(scenarioConfig.softBodyStart, scenarioConfig.softBody));
    registry.emplace<Components::DirectionalForce>(soft, scenarioConfig.directionalPower);
}
