#ifndef PLAYFIELD_COMPONENTS_BASIC_HPP
#define PLAYFIELD_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "playfield/core/constants.hpp"
#include "playfield/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct AngularPosition {
        double angle = 0.0; // radians

        explicit AngularPosition(double a = 0.0) : angle(a) {}
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

    // Collision layer bit 0 is the default world layer
    constexpr uint32_t DefaultCollisionLayer = 1u;

    /**
     * @brief Marks an entity as an immovable world collider.
     *
     * The entity also needs a Position and a ConvexPolygonShape; an
     * AngularPosition rotates it. It is hit by any query whose mask shares a
     * bit with layer.
     */
    struct StaticBody {
        uint32_t layer = DefaultCollisionLayer;

        explicit StaticBody(uint32_t l = DefaultCollisionLayer) : layer(l) {}
    };

    /**
     * @brief Attaches player-driven directional force to a soft body.
     */
    struct DirectionalForce {
        double power;

        explicit DirectionalForce(double p = PlayfieldConstants::DefaultDirectionalPower) : power(p) {}
    };

} // namespace Components

#endif // PLAYFIELD_COMPONENTS_BASIC_HPP
