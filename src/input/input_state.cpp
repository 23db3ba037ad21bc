#include "playfield/input/input_state.hpp"

namespace Input {

std::string getActionName(Action action) {
    switch (action) {
        case Action::MoveLeft:  return "move_left";
        case Action::MoveRight: return "move_right";
        case Action::MoveUp:    return "move_up";
        case Action::MoveDown:  return "move_down";
        default: return "unknown";
    }
}

Vector directionalAxis(const IInputState& input) {
    auto axis = [&input](Action negative, Action positive) {
        double value = 0.0;
        if (input.isActionPressed(negative)) {
            value -= 1.0;
        }
        if (input.isActionPressed(positive)) {
            value += 1.0;
        }
        return value;
    };
    return {axis(Action::MoveLeft, Action::MoveRight),
            axis(Action::MoveUp, Action::MoveDown)};
}

} // namespace Input
