#include "playfield/components/polygon_body.hpp"

#include <iostream>
#include <utility>

namespace Components {

PolygonBody::PolygonBody(PolygonBodyConfig config, std::vector<Vector> points)
    : config(config)
    , points(std::move(points))
{
}

void PolygonBody::setPoints(std::vector<Vector> newPoints) {
    points = std::move(newPoints);
    regenerateShape();
}

bool PolygonBody::setPoint(std::size_t index, const Vector& point) {
    if (index >= points.size()) {
        std::cerr << "Warning: PolygonBody::setPoint index " << index
                  << " out of range (" << points.size() << " points), ignoring edit." << std::endl;
        return false;
    }
    points[index] = point;
    regenerateShape();
    return true;
}

const ConvexPolygonShape* PolygonBody::getShape() {
    if (!shapeBuilt) {
        regenerateShape();
    }
    return shape ? &*shape : nullptr;
}

void PolygonBody::regenerateShape() {
    shapeBuilt = true;
    ++shapeRevision;

    if (points.size() < 3) {
        std::cerr << "Warning: PolygonBody needs at least 3 points for a collision shape, has "
                  << points.size() << "." << std::endl;
        shape.reset();
        return;
    }

    // Regenerated in place so the shape object keeps its address across edits
    auto hull = buildConvexHull(points);
    if (!hull) {
        std::cerr << "Warning: PolygonBody points are collinear, no collision shape." << std::endl;
        shape.reset();
        return;
    }
    if (shape) {
        shape->vertices = std::move(hull->vertices);
    } else {
        shape = std::move(hull);
    }
}

} // namespace Components
