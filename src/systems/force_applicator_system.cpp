#include "playfield/systems/force_applicator_system.hpp"

#include "playfield/components/basic.hpp"
#include "playfield/core/profile.hpp"

namespace Systems {

ForceApplicatorSystem::ForceApplicatorSystem(const Input::IInputState* input)
    : inputState(input)
{
}

void ForceApplicatorSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("ForceApplicatorSystem");

    // No input service: nothing is pressed
    if (inputState == nullptr) {
        return;
    }

    auto view = registry.view<Components::DirectionalForce, Bodies::SoftBody>();
    for (auto [entity, directional, body] : view.each()) {
        apply(*inputState, directional.power, dt, body);
    }
}

Vector ForceApplicatorSystem::computeForce(const Input::IInputState& input, double power, double dt) {
    Vector const axis = Input::directionalAxis(input);
    // Vertical magnitude is doubled
    return {axis.x * power * dt, axis.y * 2.0 * power * dt};
}

void ForceApplicatorSystem::apply(const Input::IInputState& input, double power, double dt,
                                  Bodies::IForceReceiver& receiver)
{
    receiver.applyCentralForce(computeForce(input, power, dt));
}

} // namespace Systems
