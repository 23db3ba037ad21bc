/**
 * @file polygon_body_system.hpp
 * @brief Manual motion integration and collision response for polygon bodies
 *
 * Per body and per step:
 * 1. velocity += gravity * gravityScale * dt
 * 2. motion = velocity * dt, swept through the physics query service
 * 3. no hit: position += motion
 * 4. hit: position += motion * safeFraction, then the contact normal decides
 *    the bounce/friction response (or a fallback without a normal)
 *
 * A body is skipped, untouched and with a warning, when there is no query
 * service or its shape is unavailable.
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to modify)
 * - PolygonBody (shape and tunables)
 *
 * Optional components:
 * - AngularPosition (rotation of the swept shape)
 */

#ifndef PLAYFIELD_POLYGON_BODY_SYSTEM_HPP
#define PLAYFIELD_POLYGON_BODY_SYSTEM_HPP

#include <entt/entt.hpp>

#include "playfield/components/polygon_body.hpp"
#include "playfield/physics/physics_query.hpp"
#include "playfield/systems/i_system.hpp"

namespace Systems {

enum class StepOutcome {
    Skipped,   ///< Nothing changed (missing service or shape)
    Moved,     ///< Full motion committed
    Collided   ///< Partial motion committed and velocity responded to a contact
};

/**
 * @struct CollisionResponseConfig
 * @brief Fallback used when a sweep hits but no contact normal is found
 */
struct CollisionResponseConfig {
    // |motion direction . vertical| above this counts as a vertical hit
    double verticalThreshold = 0.5;

    // Horizontal velocity factor after a vertical hit without a normal
    double fallbackHorizontalDamping = 0.5;
};

class PolygonBodySystem : public ConfigurableSystem<CollisionResponseConfig> {
public:
    explicit PolygonBodySystem(const Physics::IPhysicsQuery* query = nullptr);
    ~PolygonBodySystem() override = default;

    void setPhysicsQuery(const Physics::IPhysicsQuery* query) { physicsQuery = query; }

    /**
     * @brief Steps every polygon body with the configured world gravity
     */
    void update(entt::registry& registry, double dt) override;

    /**
     * @brief Steps a single body
     *
     * @param body Body whose shape is swept (built on demand)
     * @param position Body origin, advanced by the committed motion
     * @param rotation Body rotation in radians
     * @param velocity Body velocity, integrated and responded to
     * @param gravity World gravity acceleration (before gravityScale)
     * @param query Physics query service, may be nullptr
     * @param dt Step length in seconds
     * @param response Fallback response tuning
     */
    static StepOutcome stepBody(Components::PolygonBody& body,
                                Position& position,
                                double rotation,
                                Vector& velocity,
                                const Vector& gravity,
                                const Physics::IPhysicsQuery* query,
                                double dt,
                                const CollisionResponseConfig& response = CollisionResponseConfig());

    /**
     * @brief Bounce and friction against a surface normal
     *
     * The normal part of the velocity is reflected and scaled by bounce, the
     * tangential part is scaled by (1 - friction). Coefficients are clamped
     * to [0,1].
     */
    static Vector respondToContact(const Vector& velocity, const Vector& normal,
                                   double bounce, double friction);

    /**
     * @brief Response when the contact normal is unknown
     */
    static Vector respondWithoutNormal(const Vector& velocity, const Vector& motion,
                                       const CollisionResponseConfig& response);

private:
    const Physics::IPhysicsQuery* physicsQuery;
};

} // namespace Systems

#endif // PLAYFIELD_POLYGON_BODY_SYSTEM_HPP
