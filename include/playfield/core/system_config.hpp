#pragma once

#include "playfield/core/constants.hpp"
#include "playfield/math/vector_math.hpp"

/**
 * @struct SystemConfig
 * @brief Project-wide settings shared by every system.
 *
 * Gravity is stored as a direction plus a magnitude, the way a 2D engine's
 * project settings expose it; use gravity() for the combined vector.
 */
struct SystemConfig {
    double SecondsPerTick = 1.0 / PlayfieldConstants::StepsPerSecond;

    Vector GravityDirection{0.0, 1.0};
    double GravityMagnitude = PlayfieldConstants::DefaultGravityMagnitude;

    unsigned int ScreenWidth = PlayfieldConstants::ScreenWidth;
    unsigned int ScreenHeight = PlayfieldConstants::ScreenHeight;

    /** @brief World gravity acceleration in px/s^2 */
    Vector gravity() const {
        return GravityDirection.normalized() * GravityMagnitude;
    }
};
