#include "playfield/math/vector_math.hpp"

#include <cmath>

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Position& b) const {
    return {x + b.x, y + b.y};
}

Position Position::operator-(const Position& b) const {
    return {x - b.x, y - b.y};
}

Position& Position::operator+=(const Vector& v) {
    x += v.x;
    y += v.y;
    return *this;
}

double Position::dist(const Position& p) const {
    return std::hypot(x - p.x, y - p.y);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
    return {x, y};
}

Vector Vector::operator-() const {
    return {-x, -y};
}

Vector Vector::operator+(const Vector& b) const {
    return {x + b.x, y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
    return {x - b.x, y - b.y};
}

Vector Vector::operator*(double scalar) const {
    return {x * scalar, y * scalar};
}

Vector Vector::operator/(double scalar) const {
    return {x / scalar, y / scalar};
}

Vector& Vector::operator+=(const Vector& v) {
    x += v.x;
    y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    x -= v.x;
    y -= v.y;
    return *this;
}

Vector& Vector::operator*=(double scalar) {
    x *= scalar;
    y *= scalar;
    return *this;
}

double Vector::length() const {
    return std::sqrt(lengthSquared());
}

double Vector::lengthSquared() const {
    return x * x + y * y;
}

bool Vector::isZero() const {
    return std::fabs(x) < EPSILON && std::fabs(y) < EPSILON;
}

double Vector::dotProduct(const Vector& v) const {
    return x * v.x + y * v.y;
}

double Vector::cross(const Vector& other) const {
    return x * other.y - y * other.x;
}

Vector Vector::perp() const {
    return {-y, x};
}

Vector Vector::normalized() const {
    double const len = length();
    if (len < EPSILON) {
        return {0.0, 0.0};
    }
    return {x / len, y / len};
}

Vector Vector::rotateByAngle(double angle) const {
    double const c = std::cos(angle);
    double const s = std::sin(angle);
    return {x * c - y * s, x * s + y * c};
}

Vector Vector::projectOnto(const Vector& onto) const {
    double const denom = onto.lengthSquared();
    if (denom < EPSILON) {
        return {0.0, 0.0};
    }
    return onto * (dotProduct(onto) / denom);
}

Vector operator*(double scalar, const Vector& v) {
    return v * scalar;
}
