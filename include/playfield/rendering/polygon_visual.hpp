/**
 * @file polygon_visual.hpp
 * @brief Window-independent description of how a polygon body is drawn
 */

#pragma once

#include <vector>

#include "playfield/components/basic.hpp"
#include "playfield/math/polygon.hpp"

namespace Rendering {

/**
 * @brief What to paint for one polygon body
 *
 * Either a filled polygon with an outline (3+ points) or one marker per
 * point. All coordinates are in world space.
 */
struct PolygonVisual {
    bool filled = false;
    std::vector<Position> outline;   ///< Polygon corners in point order, when filled
    std::vector<Position> markers;   ///< Marker centres, when not filled
    Components::Color fillColor;
    Components::Color outlineColor;
    float markerRadius = 3.0f;
};

/**
 * @brief Builds the visual for a point sequence placed at a transform
 *
 * The points are drawn as given, not as their convex hull.
 */
PolygonVisual buildPolygonVisual(const std::vector<Vector>& points,
                                 const Transform2D& xform,
                                 const Components::Color& color);

/**
 * @brief Colour darkened by a fixed amount per channel, clamped at 0
 */
Components::Color darken(const Components::Color& color, int amount = 50);

} // namespace Rendering
