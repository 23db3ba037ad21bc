#include "playfield/rendering/polygon_visual.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace Rendering {

Components::Color darken(const Components::Color& color, int amount) {
    auto channel = [amount](uint8_t c) {
        return static_cast<uint8_t>(std::max(0, static_cast<int>(c) - amount));
    };
    return {channel(color.r), channel(color.g), channel(color.b)};
}

PolygonVisual buildPolygonVisual(const std::vector<Vector>& points,
                                 const Transform2D& xform,
                                 const Components::Color& color)
{
    PolygonVisual visual;
    visual.fillColor = color;
    visual.outlineColor = darken(color);

    std::vector<Position> world;
    world.reserve(points.size());
    for (const auto& p : points) {
        world.push_back(xform.apply(p));
    }

    if (points.size() >= 3) {
        visual.filled = true;
        visual.outline = std::move(world);
    } else {
        visual.markers = std::move(world);
    }
    return visual;
}

} // namespace Rendering
