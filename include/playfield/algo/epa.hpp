#ifndef PLAYFIELD_EPA_HPP
#define PLAYFIELD_EPA_HPP

#include <optional>
#include "playfield/algo/gjk.hpp"

/** EPA result with normal and penetration depth */
struct EPAResult {
    Vector normal;       ///< Unit normal of the Minkowski boundary; moving A by -normal*penetration separates A from B
    double penetration;  ///< Penetration depth along normal
};

/**
 * @brief Expands a GJK triangle to the closest Minkowski-difference edge
 *
 * @return std::nullopt if the simplex is not a proper triangle or EPA fails to converge
 */
std::optional<EPAResult> EPA(const ShapeData &A, const ShapeData &B, const Simplex &simplex);

#endif // PLAYFIELD_EPA_HPP
