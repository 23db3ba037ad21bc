#include <gtest/gtest.h>
#include <cmath>

#include <entt/entt.hpp>

#include "playfield/bodies/soft_body.hpp"
#include "playfield/core/constants.hpp"
#include "playfield/input/input_state.hpp"
#include "playfield/physics/collision_world.hpp"
#include "playfield/systems/force_applicator_system.hpp"
#include "playfield/systems/soft_body_system.hpp"

using Bodies::SoftBody;
using Bodies::SoftBodyConfig;

namespace {

constexpr double kDt = 1.0 / 60.0;
const Vector kGravity(0.0, 980.0);

class HoldRight : public Input::IInputState {
public:
    bool isActionPressed(Input::Action action) const override {
        return action == Input::Action::MoveRight;
    }
};

// Wide floor whose top surface is at y = 500
Physics::CollisionWorld makeFloorWorld() {
    Physics::CollisionWorld world;
    Physics::StaticCollider floor;
    floor.shape = makeBoxShape(2000.0, 10.0);
    floor.xform.origin = Position(300.0, 510.0);
    world.addCollider(floor);
    return world;
}

}  // namespace

TEST(SoftBodyTest, CircleLayout) {
    SoftBodyConfig config;
    config.segments = 8;
    config.radius = 20.0;
    SoftBody body = SoftBody::makeCircle(Position(50.0, 60.0), config);

    ASSERT_EQ(body.getNodes().size(), 9u);
    EXPECT_EQ(body.getRingSize(), 8u);

    // Hub last, at the centre
    EXPECT_DOUBLE_EQ(body.getNodes().back().x, 50.0);
    EXPECT_DOUBLE_EQ(body.getNodes().back().y, 60.0);
    for (std::size_t i = 0; i < body.getRingSize(); ++i) {
        EXPECT_NEAR(body.getNodes()[i].dist(Position(50.0, 60.0)), 20.0, 1e-9);
    }

    Position const c = body.getCenter();
    EXPECT_NEAR(c.x, 50.0, 1e-9);
    EXPECT_NEAR(c.y, 60.0, 1e-9);
    EXPECT_DOUBLE_EQ(body.getTotalMass(), 9 * config.nodeMass);
}

TEST(SoftBodyTest, StepConsumesAccumulatedForce) {
    SoftBodyConfig config;
    config.gravityScale = 0.0;
    SoftBody body = SoftBody::makeCircle(Position(0.0, 0.0), config);

    body.applyCentralForce(Vector(10.0, 0.0));
    body.applyCentralForce(Vector(5.0, 0.0));
    EXPECT_DOUBLE_EQ(body.getAccumulatedForce().x, 15.0);

    double const dt = 0.1;
    body.step(dt, Vector(0.0, 0.0), nullptr);

    EXPECT_TRUE(body.getAccumulatedForce().isZero());
    // a = F / M, shared by every node
    double const expected = 15.0 / body.getTotalMass() * dt;
    EXPECT_NEAR(body.getAverageVelocity().x, expected, 1e-9);
    EXPECT_NEAR(body.getAverageVelocity().y, 0.0, 1e-9);
}

TEST(SoftBodyTest, NonPositiveStepIsIgnored) {
    SoftBody body = SoftBody::makeCircle(Position(0.0, 0.0));
    body.applyCentralForce(Vector(1.0, 1.0));
    body.step(0.0, Vector(0.0, 980.0), nullptr);

    EXPECT_DOUBLE_EQ(body.getAccumulatedForce().x, 1.0);
    EXPECT_TRUE(body.getAverageVelocity().isZero());
}

TEST(SoftBodyTest, FallsFreelyWithoutQuery) {
    SoftBody body = SoftBody::makeCircle(Position(0.0, 0.0));
    for (int i = 0; i < 10; ++i) {
        body.step(0.01, Vector(0.0, 100.0), nullptr);
    }
    EXPECT_NEAR(body.getAverageVelocity().y, 10.0, 1e-6);
    EXPECT_GT(body.getCenter().y, 0.0);
}

TEST(SoftBodyTest, ConstraintsKeepTheShape) {
    SoftBodyConfig config;
    config.gravityScale = 0.0;
    SoftBody body = SoftBody::makeCircle(Position(0.0, 0.0), config);

    // Pulling hard on the body moves it without scattering the nodes
    body.applyCentralForce(Vector(500.0, 0.0));
    for (int i = 0; i < 30; ++i) {
        body.step(1.0 / 60.0, Vector(0.0, 0.0), nullptr);
    }
    Position const c = body.getCenter();
    for (std::size_t i = 0; i < body.getRingSize(); ++i) {
        EXPECT_NEAR(body.getNodes()[i].dist(c), config.radius, 0.5);
    }
}

TEST(SoftBodyTest, ComesToRestOnFloor) {
    Physics::CollisionWorld world;
    Physics::StaticCollider floor;
    floor.shape = makeBoxShape(400.0, 10.0);
    floor.xform.origin = Position(0.0, 110.0);  // top at y = 100
    world.addCollider(floor);

    SoftBody body = SoftBody::makeCircle(Position(0.0, 40.0));
    for (int i = 0; i < 240; ++i) {
        body.step(1.0 / 60.0, Vector(0.0, 980.0), &world);
    }

    for (const auto& node : body.getNodes()) {
        EXPECT_LT(node.y, 100.0);
    }
    EXPECT_GT(body.getCenter().y, 40.0);
    EXPECT_LT(std::fabs(body.getAverageVelocity().y), 30.0);
}

TEST(SoftBodyTest, SystemStepsWithConfiguredGravity) {
    entt::registry registry;
    auto e = registry.create();
    registry.emplace<SoftBody>(e, SoftBody::makeCircle(Position(0.0, 0.0)));

    SystemConfig config;
    config.GravityMagnitude = 60.0;

    Systems::SoftBodySystem system;
    system.setSystemConfig(config);
    system.update(registry, 0.5);

    EXPECT_NEAR(registry.get<SoftBody>(e).getAverageVelocity().y, 30.0, 1e-6);
}

TEST(SoftBodyTest, HeldInputRollsBodyAlongFloor) {
    Physics::CollisionWorld const world = makeFloorWorld();
    SoftBody body = SoftBody::makeCircle(Position(300.0, 440.0));

    for (int i = 0; i < 120; ++i) {
        body.step(kDt, kGravity, &world);
    }
    double const startX = body.getCenter().x;

    HoldRight input;
    for (int i = 0; i < 120; ++i) {
        Systems::ForceApplicatorSystem::apply(input, PlayfieldConstants::DefaultDirectionalPower, kDt, body);
        body.step(kDt, kGravity, &world);
    }

    // Two seconds of holding right carries the landed body well along
    EXPECT_GT(body.getCenter().x - startX, 10.0);
    EXPECT_GT(body.getAverageVelocity().x, 0.0);
    for (const auto& node : body.getNodes()) {
        EXPECT_LT(node.y, 500.0);
    }
}

TEST(SoftBodyTest, IdleLandingDoesNotDriftSideways) {
    Physics::CollisionWorld const world = makeFloorWorld();
    SoftBody body = SoftBody::makeCircle(Position(300.0, 400.0));

    for (int i = 0; i < 120; ++i) {
        body.step(kDt, kGravity, &world);
    }

    Position const c = body.getCenter();
    EXPECT_GT(c.y, 420.0);
    EXPECT_NEAR(c.x, 300.0, 0.5);
}

TEST(SoftBodyTest, NodeSlidesAlongFloorAfterTouchdown) {
    Physics::CollisionWorld const world = makeFloorWorld();
    SoftBodyConfig config;
    config.segments = 3;
    config.radius = 6.0;
    config.friction = 0.0;
    SoftBody body = SoftBody::makeCircle(Position(300.0, 488.0), config);

    // Land first so every later step starts in contact
    for (int i = 0; i < 60; ++i) {
        body.step(kDt, kGravity, &world);
    }
    double const startX = body.getCenter().x;

    body.applyCentralForce(Vector(config.nodeMass * 4.0 * 600.0, 0.0));
    for (int i = 0; i < 30; ++i) {
        body.step(kDt, kGravity, &world);
    }

    // Without friction the push is not lost to the contact clamp
    EXPECT_GT(body.getCenter().x - startX, 2.0);
}
