/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include "playfield/core/scenario_manager.hpp"

#include "playfield/scenarios/playground.hpp"
#include "playfield/scenarios/stairs.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : PlayfieldConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, PlayfieldConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<PlayfieldConstants::ScenarioType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setCurrentScenario(PlayfieldConstants::ScenarioType scenario) {
  currentScenario = scenario;
}

PlayfieldConstants::ScenarioType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    PlayfieldConstants::ScenarioType scenarioType) const {
  switch (scenarioType) {
    case PlayfieldConstants::ScenarioType::PLAYGROUND:
      return std::make_unique<PlaygroundScenario>();

    case PlayfieldConstants::ScenarioType::STAIRS:
      return std::make_unique<StairsScenario>();

    default:
      return std::make_unique<PlaygroundScenario>();
  }
}
