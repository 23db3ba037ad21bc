/**
 * @file keyboard_input.hpp
 * @brief SFML keyboard implementation of the action input service
 */

#pragma once

#include <unordered_map>
#include <vector>

#include <SFML/Window/Keyboard.hpp>

#include "playfield/input/input_state.hpp"

namespace Input {

/**
 * @class KeyboardInput
 * @brief Polls the real-time keyboard state for bound keys
 *
 * Default bindings: arrow keys and WASD. An action is pressed if any of its
 * keys is held. Input is ignored while the window is unfocused.
 */
class KeyboardInput : public IInputState {
public:
    KeyboardInput();

    bool isActionPressed(Action action) const override;

    void bind(Action action, sf::Keyboard::Key key);

    void setFocused(bool focused) { hasFocus = focused; }

private:
    std::unordered_map<Action, std::vector<sf::Keyboard::Key>> bindings;
    bool hasFocus = true;
};

} // namespace Input
