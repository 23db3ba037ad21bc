/**
 * @file force_applicator_system.hpp
 * @brief Applies player-driven directional force to soft bodies
 *
 * Each step the four directional actions are turned into a force of
 * power * dt horizontally and 2 * power * dt vertically, per pressed
 * direction, and applied through the body's IForceReceiver.
 *
 * Required components:
 * - DirectionalForce (power)
 * - SoftBody (receiver)
 */

#ifndef PLAYFIELD_FORCE_APPLICATOR_SYSTEM_HPP
#define PLAYFIELD_FORCE_APPLICATOR_SYSTEM_HPP

#include <entt/entt.hpp>

#include "playfield/bodies/soft_body.hpp"
#include "playfield/input/input_state.hpp"
#include "playfield/systems/i_system.hpp"

namespace Systems {

class ForceApplicatorSystem : public ISystem {
public:
    explicit ForceApplicatorSystem(const Input::IInputState* input = nullptr);
    ~ForceApplicatorSystem() override = default;

    void setInput(const Input::IInputState* input) { inputState = input; }

    void update(entt::registry& registry, double dt) override;

    /**
     * @brief Force for the current input state
     *
     * @return (axis.x * power * dt, axis.y * 2 * power * dt)
     */
    static Vector computeForce(const Input::IInputState& input, double power, double dt);

    /**
     * @brief Computes and applies the force to one receiver
     */
    static void apply(const Input::IInputState& input, double power, double dt,
                      Bodies::IForceReceiver& receiver);

private:
    const Input::IInputState* inputState;
};

} // namespace Systems

#endif // PLAYFIELD_FORCE_APPLICATOR_SYSTEM_HPP
