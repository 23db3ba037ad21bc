#include "playfield/scenarios/static_geometry.hpp"

#include "playfield/math/polygon.hpp"

namespace Scenarios {

entt::entity makeWall(entt::registry& registry,
                      double cx,
                      double cy,
                      double halfW,
                      double halfH,
                      double angle,
                      const Components::Color& color,
                      uint32_t layer)
{
    auto wallEnt = registry.create();

    registry.emplace<Components::Position>(wallEnt, cx, cy);
    registry.emplace<Components::StaticBody>(wallEnt, layer);
    registry.emplace<ConvexPolygonShape>(wallEnt, makeBoxShape(halfW, halfH));
    registry.emplace<Components::AngularPosition>(wallEnt, angle);
    registry.emplace<Components::Color>(wallEnt, color);

    return wallEnt;
}

void makeRoom(entt::registry& registry, double width, double height, double thickness) {
    double const half = thickness * 0.5;

    // Left, right, ceiling, floor; each sits just inside the screen edge
    makeWall(registry, half, height * 0.5, half, height * 0.5);
    makeWall(registry, width - half, height * 0.5, half, height * 0.5);
    makeWall(registry, width * 0.5, half, width * 0.5, half);
    makeWall(registry, width * 0.5, height - half, width * 0.5, half);
}

} // namespace Scenarios
