/**
 * @fileoverview simulator.cpp
 * @brief Implementation of Simulator.
 */

#include "playfield/core/simulator.hpp"

#include "playfield/core/profile.hpp"
#include "playfield/systems/force_applicator_system.hpp"
#include "playfield/systems/polygon_body_system.hpp"
#include "playfield/systems/soft_body_system.hpp"

Simulator::Simulator() {
  createSystems();
}

Simulator::~Simulator() = default;

void Simulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  scenarioPtr = std::move(scenario);
}

void Simulator::applyConfig(const SystemConfig& cfg) {
  currentConfig = cfg;

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void Simulator::reset() {
  registry.clear();
  collisionWorld.clear();
  tickCount = 0;

  if (scenarioPtr) {
    applyConfig(scenarioPtr->getConfig());
    scenarioPtr->createEntities(registry);
  }

  collisionWorld.syncFromRegistry(registry);
}

void Simulator::setInput(const Input::IInputState* input) {
  inputState = input;
  if (forceApplicator != nullptr) {
    forceApplicator->setInput(input);
  }
}

void Simulator::createSystems() {
  systems.clear();

  auto force = std::make_unique<Systems::ForceApplicatorSystem>(inputState);
  forceApplicator = force.get();

  // Order matters: force is accumulated before the soft body consumes it
  systems.push_back(std::move(force));
  systems.push_back(std::make_unique<Systems::SoftBodySystem>(&collisionWorld));
  systems.push_back(std::make_unique<Systems::PolygonBodySystem>(&collisionWorld));

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void Simulator::tick() {
  tick(currentConfig.SecondsPerTick);
}

void Simulator::tick(double dt) {
  PROFILE_SCOPE("Simulator::tick");

  collisionWorld.syncFromRegistry(registry);

  for (auto& system : systems) {
    system->update(registry, dt);
  }
  ++tickCount;
}
