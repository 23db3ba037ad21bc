#include "playfield/rendering/renderer.hpp"

#include <array>
#include <iostream>

#include "playfield/bodies/soft_body.hpp"
#include "playfield/components/basic.hpp"
#include "playfield/components/polygon_body.hpp"
#include "playfield/core/profile.hpp"
#include "playfield/math/polygon.hpp"

namespace Rendering {

namespace {

sf::Color toSfColor(const Components::Color& c) {
    return {c.r, c.g, c.b};
}

sf::Vector2f toSfVector(const Position& p) {
    return {static_cast<float>(p.x), static_cast<float>(p.y)};
}

const std::array<const char*, 3> kFontCandidates = {
    "assets/fonts/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf"
};

}  // namespace

Renderer::Renderer(unsigned int screenWidth, unsigned int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

bool Renderer::init(const std::string& title) {
    window.create(sf::VideoMode(screenWidth, screenHeight), title);
    if (!window.isOpen()) {
        std::cerr << "Failed to open a " << screenWidth << "x" << screenHeight << " window." << std::endl;
        return false;
    }
    window.setVerticalSyncEnabled(true);

    for (const char* path : kFontCandidates) {
        if (font.loadFromFile(path)) {
            hasFont = true;
            break;
        }
    }
    if (!hasFont) {
        std::cerr << "Warning: no HUD font found, text disabled." << std::endl;
    }

    initialized = true;
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(20, 22, 28));
}

void Renderer::present() {
    window.display();
}

void Renderer::renderScene(entt::registry& registry) {
    PROFILE_SCOPE("Renderer::renderScene");

    renderStaticBodies(registry);
    renderSoftBodies(registry);
    renderPolygonBodies(registry);
}

void Renderer::renderStaticBodies(const entt::registry& registry) {
    auto view = registry.view<const Components::StaticBody, const Components::Position, const ConvexPolygonShape>();
    for (auto [entity, body, pos, shape] : view.each()) {
        Transform2D xform{pos, 0.0};
        if (const auto* angle = registry.try_get<Components::AngularPosition>(entity)) {
            xform.rotation = angle->angle;
        }

        sf::ConvexShape convex(shape.vertices.size());
        for (size_t i = 0; i < shape.vertices.size(); ++i) {
            convex.setPoint(i, toSfVector(xform.apply(shape.vertices[i])));
        }
        Components::Color color(60, 60, 60);
        if (const auto* c = registry.try_get<Components::Color>(entity)) {
            color = *c;
        }
        convex.setFillColor(toSfColor(color));
        window.draw(convex);
    }
}

void Renderer::renderSoftBodies(const entt::registry& registry) {
    auto view = registry.view<const Bodies::SoftBody>();
    for (auto [entity, body] : view.each()) {
        const auto& nodes = body.getNodes();
        sf::Color const color = toSfColor(body.getConfig().color);

        // Ring nodes form a closed outline
        sf::VertexArray ring(sf::LineStrip, body.getRingSize() + 1);
        for (size_t i = 0; i <= body.getRingSize(); ++i) {
            ring[i].position = toSfVector(nodes[i % body.getRingSize()]);
            ring[i].color = color;
        }
        window.draw(ring);

        for (const auto& node : nodes) {
            float const r = static_cast<float>(body.getConfig().nodeHalfSize);
            sf::CircleShape dot(r);
            dot.setOrigin(r, r);
            dot.setPosition(toSfVector(node));
            dot.setFillColor(color);
            window.draw(dot);
        }
    }
}

void Renderer::renderPolygonBodies(entt::registry& registry) {
    auto view = registry.view<const Components::Position, const Components::PolygonBody>();
    for (auto [entity, pos, body] : view.each()) {
        Transform2D xform{pos, 0.0};
        if (const auto* angle = registry.try_get<Components::AngularPosition>(entity)) {
            xform.rotation = angle->angle;
        }
        drawPolygonVisual(buildPolygonVisual(body.getPoints(), xform, body.config.color));
    }
}

void Renderer::drawPolygonVisual(const PolygonVisual& visual) {
    if (visual.filled) {
        sf::ConvexShape convex(visual.outline.size());
        for (size_t i = 0; i < visual.outline.size(); ++i) {
            convex.setPoint(i, toSfVector(visual.outline[i]));
        }
        convex.setFillColor(toSfColor(visual.fillColor));
        convex.setOutlineColor(toSfColor(visual.outlineColor));
        convex.setOutlineThickness(2.0f);
        window.draw(convex);
        return;
    }

    for (const auto& marker : visual.markers) {
        sf::CircleShape dot(visual.markerRadius);
        dot.setOrigin(visual.markerRadius, visual.markerRadius);
        dot.setPosition(toSfVector(marker));
        dot.setFillColor(toSfColor(visual.fillColor));
        dot.setOutlineColor(toSfColor(visual.outlineColor));
        dot.setOutlineThickness(1.0f);
        window.draw(dot);
    }
}

void Renderer::renderHud(const std::string& text) {
    if (!hasFont) {
        return;
    }
    sf::Text hud(text, font, 14);
    hud.setFillColor(sf::Color(220, 220, 220));
    hud.setPosition(8.0f, 6.0f);
    window.draw(hud);
}

} // namespace Rendering
