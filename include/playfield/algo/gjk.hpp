#ifndef PLAYFIELD_GJK_HPP
#define PLAYFIELD_GJK_HPP

#include <vector>
#include "playfield/math/vector_math.hpp"
#include "playfield/math/polygon.hpp"

struct Simplex {
    std::vector<Vector> points;
};

/**
 * @brief Boolean overlap test of two convex (possibly swept) shapes
 *
 * Touching shapes count as intersecting. On intersection the simplex holds a
 * triangle enclosing the origin when one could be built, which EPA can expand.
 */
bool GJKIntersect(const ShapeData &A, const ShapeData &B, Simplex &simplex);

#endif // PLAYFIELD_GJK_HPP
