/**
 * @file vector_math.hpp
 * @brief 2D vector and position types used by every playfield module
 *
 * Screen coordinates are used throughout: +x points right, +y points down.
 * - Vector for displacements, velocities, forces and normals
 * - Position for absolute locations (body origins, world-space vertices)
 */

#ifndef PLAYFIELD_VECTOR_MATH_HPP
#define PLAYFIELD_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Threshold for floating point comparisons
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Absolute location in 2D space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    Position();
    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;

    /**
     * @brief Offsets this position by a displacement
     * @param v Displacement to add
     * @return Reference to this position
     */
    Position& operator+=(const Vector& v);

    /**
     * @brief Euclidean distance to another position
     */
    double dist(const Position& p) const;
};

/**
 * @brief 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    Vector();
    Vector(double x, double y);

    /** @brief Position vector of a point (implicit, the only Position->Vector conversion) */
    Vector(const Position& p);

    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;
    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    double length() const;
    double lengthSquared() const;

    /** @brief True when both components are within EPSILON of zero */
    bool isZero() const;

    double dotProduct(const Vector& v) const;

    /**
     * @brief 2D cross product (z-component of the 3D cross product)
     */
    double cross(const Vector& other) const;

    /** @brief Perpendicular vector, rotated 90 degrees counter-clockwise in math axes */
    Vector perp() const;

    /**
     * @brief Unit vector in the same direction
     *
     * A zero-length vector has no direction and normalizes to (0,0).
     */
    Vector normalized() const;

    /**
     * @brief Rotates vector by an angle
     * @param angle Rotation angle in radians
     */
    Vector rotateByAngle(double angle) const;

    /**
     * @brief Projects this vector onto another
     * @param onto Vector to project onto (need not be unit length)
     * @return Component of this vector along onto, (0,0) if onto is zero
     */
    Vector projectOnto(const Vector& onto) const;
};

Vector operator*(double scalar, const Vector& v);

#endif // PLAYFIELD_VECTOR_MATH_HPP
