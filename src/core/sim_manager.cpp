/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager.
 */

#include "playfield/core/sim_manager.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "playfield/core/constants.hpp"
#include "playfield/core/profile.hpp"

namespace {

// Longest frame the accumulator will catch up on
constexpr double kMaxFrameSeconds = 0.25;

}  // namespace

SimManager::SimManager()
    : renderer(PlayfieldConstants::ScreenWidth, PlayfieldConstants::ScreenHeight)
    , simulator()
    , scenarioManager()
    , keyboard()
    , running(true)
    , paused(false)
    , stepFrame(false)
    , accumulator(0.0)
{
}

bool SimManager::init()
{
    if (!renderer.init("Playfield"))
    {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    scenarioManager.buildScenarioList();
    simulator.setInput(&keyboard);
    selectScenario(PlayfieldConstants::ScenarioType::PLAYGROUND);

    return true;
}

void SimManager::run()
{
    sf::Clock clock;
    float fps = 0.0f;

    while (running && renderer.getWindow().isOpen())
    {
        double const frameSeconds = clock.restart().asSeconds();
        if (frameSeconds > 0.0)
        {
            // Exponential smoothing keeps the HUD readable
            fps = 0.9f * fps + 0.1f * static_cast<float>(1.0 / frameSeconds);
        }

        if (!handleEvents())
        {
            break;
        }
        tick(frameSeconds);
        render(fps);
    }

    renderer.getWindow().close();
}

bool SimManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::LostFocus)
        {
            keyboard.setFocused(false);
        }
        else if (event.type == sf::Event::GainedFocus)
        {
            keyboard.setFocused(true);
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P:
                    togglePause();
                    break;
                case sf::Keyboard::Space: // Advance one step if paused
                    if (paused)
                    {
                        stepOnce();
                    }
                    break;
                case sf::Keyboard::R:
                    resetSimulator();
                    break;
                case sf::Keyboard::Num1:
                    selectScenario(PlayfieldConstants::ScenarioType::PLAYGROUND);
                    break;
                case sf::Keyboard::Num2:
                    selectScenario(PlayfieldConstants::ScenarioType::STAIRS);
                    break;
                default:
                    break;
            }
        }
    }

    return running;
}

void SimManager::tick(double frameSeconds)
{
    double const dt = simulator.getConfig().SecondsPerTick;

    if (paused)
    {
        accumulator = 0.0;
        if (stepFrame)
        {
            simulator.tick(dt);
            stepFrame = false;
        }
        return;
    }

    accumulator += std::min(frameSeconds, kMaxFrameSeconds);
    while (accumulator >= dt)
    {
        simulator.tick(dt);
        accumulator -= dt;
    }
}

void SimManager::render(float fps)
{
    PROFILE_SCOPE("SimManager::render");

    renderer.clear();
    renderer.renderScene(simulator.getRegistry());

    std::ostringstream hud;
    hud << std::fixed << std::setprecision(0) << fps << " FPS  |  "
        << PlayfieldConstants::getScenarioName(scenarioManager.getCurrentScenario())
        << (paused ? "  |  PAUSED" : "")
        << "  |  arrows/WASD move, P pause, Space step, R reset, 1-2 scene";
    renderer.renderHud(hud.str());

    renderer.present();
}

void SimManager::togglePause()
{
    paused = !paused;
}

void SimManager::resetSimulator()
{
    simulator.reset();
    accumulator = 0.0;
    paused = false;
}

void SimManager::stepOnce()
{
    stepFrame = true;
}

void SimManager::selectScenario(PlayfieldConstants::ScenarioType scenario)
{
    scenarioManager.setCurrentScenario(scenario);
    simulator.loadScenario(scenarioManager.createScenario(scenario));
    resetSimulator();
}
