#include <gtest/gtest.h>
#include <set>

#include <entt/entt.hpp>

#include "playfield/bodies/soft_body.hpp"
#include "playfield/components/basic.hpp"
#include "playfield/core/constants.hpp"
#include "playfield/input/input_state.hpp"
#include "playfield/systems/force_applicator_system.hpp"

using Input::Action;
using Systems::ForceApplicatorSystem;

namespace {

class ScriptedInput : public Input::IInputState {
public:
    bool isActionPressed(Action action) const override {
        return pressed.count(action) > 0;
    }

    std::set<Action> pressed;
};

class RecordingReceiver : public Bodies::IForceReceiver {
public:
    void applyCentralForce(const Vector& force) override {
        total += force;
        ++calls;
    }

    Vector total;
    int calls = 0;
};

}  // namespace

TEST(ForceApplicatorTest, AllInputCombinations) {
    double const power = 1000.0;
    double const dt = 1.0 / 60.0;

    for (int mask = 0; mask < 16; ++mask) {
        ScriptedInput input;
        bool const left = mask & 1;
        bool const right = mask & 2;
        bool const up = mask & 4;
        bool const down = mask & 8;
        if (left) input.pressed.insert(Action::MoveLeft);
        if (right) input.pressed.insert(Action::MoveRight);
        if (up) input.pressed.insert(Action::MoveUp);
        if (down) input.pressed.insert(Action::MoveDown);

        double const ax = (right ? 1.0 : 0.0) - (left ? 1.0 : 0.0);
        double const ay = (down ? 1.0 : 0.0) - (up ? 1.0 : 0.0);

        Vector const force = ForceApplicatorSystem::computeForce(input, power, dt);
        EXPECT_DOUBLE_EQ(force.x, ax * power * dt) << "input mask " << mask;
        EXPECT_DOUBLE_EQ(force.y, ay * 2.0 * power * dt) << "input mask " << mask;
    }
}

TEST(ForceApplicatorTest, OpposingActionsCancel) {
    ScriptedInput input;
    input.pressed = {Action::MoveLeft, Action::MoveRight, Action::MoveUp, Action::MoveDown};

    Vector const axis = Input::directionalAxis(input);
    EXPECT_DOUBLE_EQ(axis.x, 0.0);
    EXPECT_DOUBLE_EQ(axis.y, 0.0);
}

TEST(ForceApplicatorTest, ApplyForwardsToReceiver) {
    ScriptedInput input;
    input.pressed = {Action::MoveRight, Action::MoveUp};
    RecordingReceiver receiver;

    ForceApplicatorSystem::apply(input, 600.0, 0.5, receiver);

    EXPECT_EQ(receiver.calls, 1);
    EXPECT_DOUBLE_EQ(receiver.total.x, 300.0);
    EXPECT_DOUBLE_EQ(receiver.total.y, -600.0);
}

TEST(ForceApplicatorTest, UpdateAccumulatesOnSoftBodies) {
    entt::registry registry;
    auto e = registry.create();
    registry.emplace<Bodies::SoftBody>(e, Bodies::SoftBody::makeCircle(Position(100.0, 100.0)));
    registry.emplace<Components::DirectionalForce>(e, 1200.0);

    // A soft body without DirectionalForce is left alone
    auto other = registry.create();
    registry.emplace<Bodies::SoftBody>(other, Bodies::SoftBody::makeCircle(Position(300.0, 100.0)));

    ScriptedInput input;
    input.pressed = {Action::MoveLeft, Action::MoveDown};

    ForceApplicatorSystem system(&input);
    system.update(registry, 0.25);

    const Vector& force = registry.get<Bodies::SoftBody>(e).getAccumulatedForce();
    EXPECT_DOUBLE_EQ(force.x, -300.0);
    EXPECT_DOUBLE_EQ(force.y, 600.0);
    EXPECT_TRUE(registry.get<Bodies::SoftBody>(other).getAccumulatedForce().isZero());
}

TEST(ForceApplicatorTest, NoInputServiceAppliesNothing) {
    entt::registry registry;
    auto e = registry.create();
    registry.emplace<Bodies::SoftBody>(e, Bodies::SoftBody::makeCircle(Position(0.0, 0.0)));
    registry.emplace<Components::DirectionalForce>(e);

    ForceApplicatorSystem system;
    system.update(registry, 0.25);

    EXPECT_TRUE(registry.get<Bodies::SoftBody>(e).getAccumulatedForce().isZero());
}

TEST(ForceApplicatorTest, ActionNames) {
    EXPECT_EQ(Input::getActionName(Action::MoveLeft), "move_left");
    EXPECT_EQ(Input::getActionName(Action::MoveDown), "move_down");
}

TEST(ForceApplicatorTest, DefaultPowerIsProjectConstant) {
    Components::DirectionalForce const force;
    EXPECT_DOUBLE_EQ(force.power, PlayfieldConstants::DefaultDirectionalPower);
    EXPECT_DOUBLE_EQ(PlayfieldConstants::DefaultDirectionalPower, 1000.0);
}
