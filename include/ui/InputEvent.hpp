#pragma once

#include "model/Snapshot.hpp"

namespace halcyon::ui {

struct InputEvent {
    enum class Type {
        ButtonPress,
        Scroll
    };

    // X11/Wayland button numbering
    enum class Button {
        Primary = 1,
        Middle = 2,
        Secondary = 3
    };

    Type type = Type::ButtonPress;
    Button button = Button::Primary;
    model::StepDirection scroll = model::StepDirection::Increase;

    static InputEvent click(Button b) {
        InputEvent e;
        e.type = Type::ButtonPress;
        e.button = b;
        return e;
    }

    static InputEvent wheel(model::StepDirection direction) {
        InputEvent e;
        e.type = Type::Scroll;
        e.scroll = direction;
        return e;
    }

    bool is_button(Button b) const {
        return type == Type::ButtonPress && button == b;
    }
};

} // namespace halcyon::ui
