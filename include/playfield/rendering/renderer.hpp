/**
 * @file renderer.hpp
 * @brief SFML drawing of the playfield scene
 *
 * Draws, back to front:
 * - static colliders (grey polygons)
 * - soft bodies (ring outline and node dots)
 * - polygon bodies (PolygonVisual: filled + outline, or point markers)
 * - a HUD line of text, when a font could be loaded
 *
 * World units are pixels, so no coordinate conversion is applied.
 */

#pragma once

#include <string>

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "playfield/rendering/polygon_visual.hpp"

namespace Rendering {

class Renderer {
public:
    Renderer(unsigned int screenWidth, unsigned int screenHeight);
    ~Renderer() = default;

    /**
     * @brief Creates the window and tries to load a HUD font
     * @return false if the window could not be opened
     */
    bool init(const std::string& title);

    void clear();
    void present();

    /**
     * @brief Draws every static collider, soft body and polygon body
     */
    void renderScene(entt::registry& registry);

    /**
     * @brief Draws one polygon visual
     */
    void drawPolygonVisual(const PolygonVisual& visual);

    /**
     * @brief Text in the top-left corner; no-op without a font
     */
    void renderHud(const std::string& text);

    sf::RenderWindow& getWindow() { return window; }
    bool isInitialized() const { return initialized; }

private:
    void renderStaticBodies(const entt::registry& registry);
    void renderSoftBodies(const entt::registry& registry);
    void renderPolygonBodies(entt::registry& registry);

    sf::RenderWindow window;
    sf::Font font;
    bool hasFont = false;
    bool initialized = false;
    unsigned int screenWidth;
    unsigned int screenHeight;
};

} // namespace Rendering
