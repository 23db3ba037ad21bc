#include "playfield/input/keyboard_input.hpp"

namespace Input {

KeyboardInput::KeyboardInput() {
    bind(Action::MoveLeft, sf::Keyboard::Left);
    bind(Action::MoveLeft, sf::Keyboard::A);
    bind(Action::MoveRight, sf::Keyboard::Right);
    bind(Action::MoveRight, sf::Keyboard::D);
    bind(Action::MoveUp, sf::Keyboard::Up);
    bind(Action::MoveUp, sf::Keyboard::W);
    bind(Action::MoveDown, sf::Keyboard::Down);
    bind(Action::MoveDown, sf::Keyboard::S);
}

bool KeyboardInput::isActionPressed(Action action) const {
    if (!hasFocus) {
        return false;
    }
    auto it = bindings.find(action);
    if (it == bindings.end()) {
        return false;
    }
    for (auto key : it->second) {
        if (sf::Keyboard::isKeyPressed(key)) {
            return true;
        }
    }
    return false;
}

void KeyboardInput::bind(Action action, sf::Keyboard::Key key) {
    bindings[action].push_back(key);
}

} // namespace Input
