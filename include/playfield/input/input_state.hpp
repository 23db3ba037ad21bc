/**
 * @file input_state.hpp
 * @brief Named directional actions and the interface that reports them
 */

#pragma once

#include <array>
#include <string>

#include "playfield/math/vector_math.hpp"

namespace Input {

enum class Action {
    MoveLeft,
    MoveRight,
    MoveUp,
    MoveDown
};

constexpr std::array<Action, 4> AllActions = {
    Action::MoveLeft, Action::MoveRight, Action::MoveUp, Action::MoveDown
};

std::string getActionName(Action action);

/**
 * @class IInputState
 * @brief Pressed-state of the named actions for the current frame
 */
class IInputState {
public:
    virtual ~IInputState() = default;

    virtual bool isActionPressed(Action action) const = 0;
};

/**
 * @brief Per-axis direction from the four actions
 *
 * Each component is -1, 0 or +1; opposing actions cancel. Screen axes: up is -y.
 */
Vector directionalAxis(const IInputState& input);

} // namespace Input
