#pragma once

#include "joystick_state.hpp"

#include <array>
#include <span>
#include <string_view>
#include <vector>

namespace deckpad
{
    enum class ControlKind
    {
        Button,
        Axis,
    };

    struct ControlBinding
    {
        std::string_view label;
        ControlKind kind;
        int index;
    };

    struct ControlReading
    {
        std::string_view label;
        ControlKind kind;
        int index;
        int value;
    };

    using ControlGroup = std::vector<ControlReading>;

    ControlGroup read_controls(const JoystickState& state, std::span<const ControlBinding> bindings);

// -----------------------------------------------------------------------------

    // Steam Deck controller identifiers. The d-pad and back grips report as
    // plain buttons, the triggers as axes that rest at -32768.
    namespace steam_deck
    {
        inline constexpr int NumAxes = 6;
        inline constexpr int NumButtons = 20;

        inline constexpr std::array<ControlBinding, 4> FaceButtons {{
            { "A", ControlKind::Button, 0 },
            { "B", ControlKind::Button, 1 },
            { "X", ControlKind::Button, 2 },
            { "Y", ControlKind::Button, 3 },
        }};

        inline constexpr std::array<ControlBinding, 4> DPad {{
            { "Up",    ControlKind::Button, 11 },
            { "Down",  ControlKind::Button, 12 },
            { "Left",  ControlKind::Button, 13 },
            { "Right", ControlKind::Button, 14 },
        }};

        inline constexpr std::array<ControlBinding, 4> Shoulders {{
            { "L1",      ControlKind::Button,  9 },
            { "R1",      ControlKind::Button, 10 },
            { "L2 Axis", ControlKind::Axis,    4 },
            { "R2 Axis", ControlKind::Axis,    5 },
        }};

        inline constexpr std::array<ControlBinding, 6> Sticks {{
            { "LX", ControlKind::Axis,   0 },
            { "LY", ControlKind::Axis,   1 },
            { "RX", ControlKind::Axis,   2 },
            { "RY", ControlKind::Axis,   3 },
            { "L3", ControlKind::Button, 7 },
            { "R3", ControlKind::Button, 8 },
        }};

        inline constexpr std::array<ControlBinding, 4> BackGrips {{
            { "L4", ControlKind::Button, 17 },
            { "R4", ControlKind::Button, 16 },
            { "L5", ControlKind::Button, 19 },
            { "R5", ControlKind::Button, 18 },
        }};
    }

    inline ControlGroup face_buttons(const JoystickState& state)   { return read_controls(state, steam_deck::FaceButtons); }
    inline ControlGroup dpad_state(const JoystickState& state)     { return read_controls(state, steam_deck::DPad);        }
    inline ControlGroup shoulder_state(const JoystickState& state) { return read_controls(state, steam_deck::Shoulders);   }
    inline ControlGroup stick_state(const JoystickState& state)    { return read_controls(state, steam_deck::Sticks);      }
    inline ControlGroup back_buttons(const JoystickState& state)   { return read_controls(state, steam_deck::BackGrips);   }
}
