#pragma once

#include <cstdint>
#include <vector>

namespace deckpad
{
    enum class JoystickEventType
    {
        AxisMotion,
        ButtonDown,
        ButtonUp,
        DeviceRemoved,
    };

    struct JoystickEvent
    {
        JoystickEventType type;
        int index = 0;
        int32_t value = 0;
    };

    const char* to_string(JoystickEventType type);

    struct FullState
    {
        std::vector<int16_t> axes;
        std::vector<uint8_t> buttons;

        friend bool operator==(const FullState&, const FullState&) = default;
    };

    // Latest known value of every tracked identifier. Identifiers outside the
    // tracked ranges are ignored, entries never touched keep their defaults.
    struct JoystickState
    {
        std::vector<int16_t> axes;
        std::vector<uint8_t> buttons;

        JoystickState(int num_axes, int num_buttons);

        // Returns false when the event refers to an untracked identifier
        bool apply(const JoystickEvent& event);

        int16_t get_axis(int index) const;
        uint8_t get_button(int index) const;

        bool tracks_axis(int index) const   { return index >= 0 && index < int(axes.size());    }
        bool tracks_button(int index) const { return index >= 0 && index < int(buttons.size()); }

        FullState snapshot() const;
    };
}
