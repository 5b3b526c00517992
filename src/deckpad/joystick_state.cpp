#include "joystick_state.hpp"

#include "core.hpp"

#include <algorithm>

namespace deckpad
{
    const char* to_string(JoystickEventType type)
    {
        switch (type) {
            case JoystickEventType::AxisMotion:    return "AxisMotion";
            case JoystickEventType::ButtonDown:    return "ButtonDown";
            case JoystickEventType::ButtonUp:      return "ButtonUp";
            case JoystickEventType::DeviceRemoved: return "DeviceRemoved";
        }
        return "Unknown";
    }

    JoystickState::JoystickState(int num_axes, int num_buttons)
    {
        if (num_axes < 0 || num_buttons < 0) {
            raise_error("Invalid tracked counts (axes = {}, buttons = {})", num_axes, num_buttons);
        }

        axes.assign(num_axes, 0);
        buttons.assign(num_buttons, 0);
    }

    bool JoystickState::apply(const JoystickEvent& event)
    {
        switch (event.type) {
            break;case JoystickEventType::AxisMotion:
                if (!tracks_axis(event.index)) return false;
                axes[event.index] = int16_t(std::clamp<int32_t>(event.value, INT16_MIN, INT16_MAX));
            break;case JoystickEventType::ButtonDown:
                if (!tracks_button(event.index)) return false;
                buttons[event.index] = 1;
            break;case JoystickEventType::ButtonUp:
                if (!tracks_button(event.index)) return false;
                buttons[event.index] = 0;
            break;case JoystickEventType::DeviceRemoved:
                return false;
        }
        return true;
    }

    int16_t JoystickState::get_axis(int index) const
    {
        return tracks_axis(index) ? axes[index] : 0;
    }

    uint8_t JoystickState::get_button(int index) const
    {
        return tracks_button(index) ? buttons[index] : 0;
    }

    FullState JoystickState::snapshot() const
    {
        return FullState {
            .axes = axes,
            .buttons = buttons,
        };
    }
}
