/**
 * @file static_geometry.hpp
 * @brief Helpers that spawn StaticBody collider entities
 */

#pragma once

#include <cstdint>

#include <entt/entt.hpp>

#include "playfield/components/basic.hpp"

namespace Scenarios {

/**
 * @brief Creates a static box collider
 * @param registry The ECS registry where the entity is created.
 * @param cx Center X coordinate of the box.
 * @param cy Center Y coordinate of the box.
 * @param halfW Half the box's width.
 * @param halfH Half the box's height.
 * @param angle Rotation in radians.
 * @return The created entity.
 */
entt::entity makeWall(entt::registry& registry,
                      double cx,
                      double cy,
                      double halfW,
                      double halfH,
                      double angle = 0.0,
                      const Components::Color& color = Components::Color(60, 60, 60),
                      uint32_t layer = Components::DefaultCollisionLayer);

/**
 * @brief Four walls enclosing a width x height screen area
 */
void makeRoom(entt::registry& registry, double width, double height, double thickness);

} // namespace Scenarios
