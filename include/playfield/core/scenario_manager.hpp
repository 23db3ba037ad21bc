/**
 * @fileoverview scenario_manager.hpp
 * @brief Catalog of available scenes and a factory to create them.
 */

#ifndef PLAYFIELD_SCENARIO_MANAGER_HPP
#define PLAYFIELD_SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "playfield/core/constants.hpp"
#include "playfield/scenarios/i_scenario.hpp"

class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  const std::vector<std::pair<PlayfieldConstants::ScenarioType, std::string>>&
  getScenarioList() const;

  /**
   * @brief Sets the scenario that is considered current.
   */
  void setCurrentScenario(PlayfieldConstants::ScenarioType scenario);

  PlayfieldConstants::ScenarioType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   * @param scenarioType The chosen scenario type.
   * @return A unique_ptr to a newly constructed scenario.
   */
  std::unique_ptr<IScenario> createScenario(
      PlayfieldConstants::ScenarioType scenarioType) const;

 private:
  std::vector<std::pair<PlayfieldConstants::ScenarioType, std::string>> scenarioList;
  PlayfieldConstants::ScenarioType currentScenario =
      PlayfieldConstants::ScenarioType::PLAYGROUND;
};

#endif  // PLAYFIELD_SCENARIO_MANAGER_HPP
