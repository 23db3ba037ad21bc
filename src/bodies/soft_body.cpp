/**
 * @file soft_body.cpp
 * @brief XPBD step of the soft body: predict, project, collide, update
 */

#include "playfield/bodies/soft_body.hpp"

#include <algorithm>
#include <cmath>

#include "playfield/core/constants.hpp"

namespace Bodies {

SoftBody::SoftBody(const SoftBodyConfig& config)
    : config(config)
    , nodeShape(makeBoxShape(config.nodeHalfSize, config.nodeHalfSize))
{
}

SoftBody SoftBody::makeCircle(const Position& center, const SoftBodyConfig& config) {
    SoftBody body(config);
    int const segments = std::max(3, config.segments);
    body.ringSize = static_cast<std::size_t>(segments);

    double const step = 2.0 * PlayfieldConstants::Pi / segments;
    for (int i = 0; i < segments; ++i) {
        double const a = step * i;
        body.nodes.emplace_back(center.x + config.radius * std::cos(a),
                                center.y + config.radius * std::sin(a));
    }
    body.nodes.push_back(center);
    body.velocities.assign(body.nodes.size(), Vector());

    std::size_t const hub = body.nodes.size() - 1;
    for (std::size_t i = 0; i < body.ringSize; ++i) {
        std::size_t const next = (i + 1) % body.ringSize;
        body.constraints.push_back({i, next, body.nodes[i].dist(body.nodes[next])});
        body.constraints.push_back({i, hub, body.nodes[i].dist(body.nodes[hub])});
    }
    // Cross braces resist shearing of the ring
    for (std::size_t i = 0; i < body.ringSize; ++i) {
        std::size_t const across = (i + body.ringSize / 2) % body.ringSize;
        if (i < across) {
            body.constraints.push_back({i, across, body.nodes[i].dist(body.nodes[across])});
        }
    }
    return body;
}

void SoftBody::applyCentralForce(const Vector& force) {
    accumulatedForce += force;
}

double SoftBody::getTotalMass() const {
    return config.nodeMass * static_cast<double>(nodes.size());
}

Position SoftBody::getCenter() const {
    Position c;
    if (nodes.empty()) {
        return c;
    }
    for (const auto& n : nodes) {
        c += Vector(n);
    }
    return {c.x / static_cast<double>(nodes.size()), c.y / static_cast<double>(nodes.size())};
}

Vector SoftBody::getAverageVelocity() const {
    Vector v;
    if (velocities.empty()) {
        return v;
    }
    for (const auto& vel : velocities) {
        v += vel;
    }
    return v / static_cast<double>(velocities.size());
}

void SoftBody::projectConstraints(std::vector<Position>& predicted, double dt) const {
    double const w = config.nodeMass > 0.0 ? 1.0 / config.nodeMass : 0.0;
    double const alpha = config.compliance / (dt * dt);
    if (w <= 0.0) {
        return;
    }

    // Jacobi passes: every constraint reads the same positions, so the
    // result does not depend on constraint order
    std::vector<double> lambda(constraints.size(), 0.0);
    std::vector<Vector> delta(predicted.size());
    std::vector<int> count(predicted.size());
    for (int it = 0; it < config.iterations; ++it) {
        std::fill(delta.begin(), delta.end(), Vector());
        std::fill(count.begin(), count.end(), 0);

        for (std::size_t k = 0; k < constraints.size(); ++k) {
            const auto& c = constraints[k];
            Vector const d = Vector(predicted[c.b]) - Vector(predicted[c.a]);
            double const len = d.length();
            if (len <= 1e-8) {
                continue;
            }
            double const C = len - c.rest;
            double const dlambda = -(C + alpha * lambda[k]) / (w + w + alpha);
            lambda[k] += dlambda;

            Vector const corr = d * (dlambda / len);
            delta[c.a] -= corr * w;
            delta[c.b] += corr * w;
            ++count[c.a];
            ++count[c.b];
        }

        for (std::size_t i = 0; i < predicted.size(); ++i) {
            if (count[i] > 0) {
                predicted[i] += delta[i] * (config.relaxFactor / count[i]);
            }
        }
    }
}

Vector SoftBody::collideNode(std::size_t index, Position& predicted, double dt,
                             const Physics::IPhysicsQuery& query) const
{
    Transform2D const start{nodes[index], 0.0};
    Vector const motion = Vector(predicted) - Vector(nodes[index]);
    Vector velocity = motion / dt;

    auto const fraction = query.sweep(start, motion, nodeShape, config.collisionMask);
    if (!fraction) {
        return velocity;
    }

    Vector const safeMotion = motion * *fraction;
    predicted = nodes[index];
    predicted += safeMotion;

    auto const normal = query.contactNormal(start.translated(safeMotion), motion, nodeShape, config.collisionMask);
    if (!normal) {
        return Vector();
    }

    // The rest of the motion slides along the surface
    Vector remaining = motion - safeMotion;
    double const into = remaining.dotProduct(*normal);
    if (into < 0.0) {
        remaining -= *normal * into;
    }
    if (!remaining.isZero()) {
        Transform2D const contact{predicted, 0.0};
        auto const slideFraction = query.sweep(contact, remaining, nodeShape, config.collisionMask);
        predicted += remaining * slideFraction.value_or(1.0);
    }

    double const vDotN = velocity.dotProduct(*normal);
    if (vDotN < 0.0) {
        Vector const vn = *normal * vDotN;
        Vector const vt = velocity - vn;
        velocity = vt * (1.0 - std::clamp(config.friction, 0.0, 1.0)) - vn * std::clamp(config.bounce, 0.0, 1.0);
    }
    return velocity;
}

void SoftBody::step(double dt, const Vector& gravity, const Physics::IPhysicsQuery* query) {
    if (dt <= 0.0 || nodes.empty()) {
        return;
    }

    Vector const acceleration = gravity * config.gravityScale + accumulatedForce / getTotalMass();
    accumulatedForce = Vector();

    std::vector<Position> predicted(nodes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        velocities[i] += acceleration * dt;
        predicted[i] = nodes[i];
        predicted[i] += velocities[i] * dt;
    }

    projectConstraints(predicted, dt);

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (query != nullptr) {
            velocities[i] = collideNode(i, predicted[i], dt, *query);
        } else {
            velocities[i] = (Vector(predicted[i]) - Vector(nodes[i])) / dt;
        }
        nodes[i] = predicted[i];
    }
}

} // namespace Bodies
