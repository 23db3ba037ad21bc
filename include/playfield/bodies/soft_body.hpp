/**
 * @file soft_body.hpp
 * @brief Deformable body made of point nodes joined by XPBD distance constraints
 *
 * The body is a ring of nodes around a centre node. Ring edges keep the
 * outline, spokes keep the volume; all constraints share one compliance.
 * Constraints are projected in Jacobi passes, averaging the corrections each
 * node receives. Node collisions go through the same IPhysicsQuery as the
 * polygon body, each node being a small square that slides along whatever
 * it hits.
 *
 * Forces applied through IForceReceiver accumulate until the next step(),
 * act through the centre of mass (F / total mass on every node), and are
 * then cleared.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "playfield/components/basic.hpp"
#include "playfield/math/polygon.hpp"
#include "playfield/math/vector_math.hpp"
#include "playfield/physics/physics_query.hpp"

namespace Bodies {

/**
 * @class IForceReceiver
 * @brief Anything that accepts an applied force for the next step
 */
class IForceReceiver {
public:
    virtual ~IForceReceiver() = default;

    /**
     * @brief Accumulates a force acting through the centre of mass
     */
    virtual void applyCentralForce(const Vector& force) = 0;
};

/**
 * @struct SoftBodyConfig
 * @brief Construction and material parameters of a soft body
 */
struct SoftBodyConfig {
    int segments = 12;          // Ring nodes
    double radius = 32.0;       // Ring radius in px
    double nodeMass = 0.01;     // 13 default nodes weigh 0.13
    double compliance = 1e-5;   // Inverse stiffness of every constraint
    int iterations = 12;        // Constraint projection passes per step
    double relaxFactor = 1.5;   // Scales each node's averaged correction
    double gravityScale = 1.0;
    double nodeHalfSize = 2.0;  // Half extent of a node's collision square
    double bounce = 0.0;
    double friction = 0.3;
    uint32_t collisionMask = Components::DefaultCollisionLayer;
    Components::Color color{90, 170, 230};
};

class SoftBody : public IForceReceiver {
public:
    /**
     * @brief Builds a circular body; ring nodes first, centre node last
     */
    static SoftBody makeCircle(const Position& center, const SoftBodyConfig& config = SoftBodyConfig());

    void applyCentralForce(const Vector& force) override;

    const Vector& getAccumulatedForce() const { return accumulatedForce; }

    /**
     * @brief Advances the body by one fixed step
     *
     * @param dt Step length in seconds, ignored if not positive
     * @param gravity World gravity acceleration (scaled by gravityScale)
     * @param query Collision service; nodes move unconstrained if nullptr
     */
    void step(double dt, const Vector& gravity, const Physics::IPhysicsQuery* query);

    /** @brief Mean node position */
    Position getCenter() const;

    /** @brief Mean node velocity */
    Vector getAverageVelocity() const;

    const std::vector<Position>& getNodes() const { return nodes; }
    const std::vector<Vector>& getVelocities() const { return velocities; }
    std::size_t getRingSize() const { return ringSize; }
    double getTotalMass() const;
    const SoftBodyConfig& getConfig() const { return config; }

private:
    struct DistanceConstraint {
        std::size_t a;
        std::size_t b;
        double rest;
    };

    explicit SoftBody(const SoftBodyConfig& config);

    void projectConstraints(std::vector<Position>& predicted, double dt) const;
    Vector collideNode(std::size_t index, Position& predicted, double dt,
                       const Physics::IPhysicsQuery& query) const;

    SoftBodyConfig config;
    std::vector<Position> nodes;
    std::vector<Vector> velocities;
    std::vector<DistanceConstraint> constraints;
    std::size_t ringSize = 0;
    ConvexPolygonShape nodeShape;
    Vector accumulatedForce;
};

} // namespace Bodies
