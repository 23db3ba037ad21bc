/**
 * @fileoverview sim_manager.hpp
 * @brief Window loop: events, fixed-timestep stepping and drawing.
 */

#pragma once

#include "playfield/core/scenario_manager.hpp"
#include "playfield/core/simulator.hpp"
#include "playfield/input/keyboard_input.hpp"
#include "playfield/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Owns the renderer, simulator and keyboard input, and runs the main loop.
 *
 * Hotkeys:
 * - Esc quit, P pause, Space single step while paused, R reset
 * - 1/2 switch scene
 */
class SimManager {
 public:
  SimManager();

  /**
   * @brief Opens the window and builds the initial scene.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the simulator for the elapsed frame time, unless paused.
   * @param frameSeconds Wall-clock time since the previous frame.
   */
  void tick(double frameSeconds);

  void render(float fps);

  void togglePause();
  void resetSimulator();
  void stepOnce();
  void selectScenario(PlayfieldConstants::ScenarioType scenario);

 private:
  Rendering::Renderer renderer;
  Simulator simulator;
  ScenarioManager scenarioManager;
  Input::KeyboardInput keyboard;

  bool running;
  bool paused;
  bool stepFrame;
  double accumulator;
};
