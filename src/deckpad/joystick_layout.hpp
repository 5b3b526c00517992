#pragma once

#include "joystick_state.hpp"

#include <linux/input.h>

#include <optional>
#include <span>
#include <vector>

namespace deckpad
{
    // Maps a device's absolute range onto [-32768, 32767]
    struct AxisCalibration
    {
        int32_t minimum = INT16_MIN;
        int32_t maximum = INT16_MAX;
        int32_t flat = 0;

        int16_t apply(int32_t raw) const;
    };

    struct AxisInfo
    {
        int code;
        AxisCalibration calibration;
    };

    // Identifier assignment for one device.
    //
    // Buttons are numbered over the supported key codes from BTN_JOYSTICK up to
    // KEY_MAX, followed by the codes below BTN_JOYSTICK. Axes are numbered over
    // the supported absolute codes in ascending order with the hat range
    // (ABS_HAT0X..ABS_HAT3Y) left out. This is SDL2's generic Linux order.
    struct JoystickLayout
    {
        std::vector<int> button_codes; // identifier -> key code
        std::vector<AxisInfo> axes;    // identifier -> abs code + calibration

        static JoystickLayout build(std::span<const int> key_codes, std::span<const AxisInfo> abs_axes);

        // Fixed identifiers for the Steam Deck's built-in controller, keyed by
        // event code. Triggers come from ABS_HAT2Y/ABS_HAT2X, trackpad touch
        // and trigger click keys get no identifier.
        static JoystickLayout build_steam_deck(std::span<const AxisInfo> abs_axes);

        // Picks the Steam Deck layout for Valve's Deck controller and the
        // generic order for everything else
        static JoystickLayout build_for(int vid, int pid, std::span<const int> key_codes, std::span<const AxisInfo> abs_axes);

        std::optional<int> find_button(int key_code) const;
        std::optional<int> find_axis(int abs_code) const;

        int num_buttons() const { return int(button_codes.size()); }
        int num_axes() const    { return int(axes.size());         }

        // EV_KEY and EV_ABS events become joystick events, everything else
        // (sync reports, hats, misc scan codes, key autorepeat) is dropped
        std::optional<JoystickEvent> translate(const input_event& ev) const;
    };

    constexpr bool is_hat_code(int abs_code)
    {
        return abs_code >= ABS_HAT0X && abs_code <= ABS_HAT3Y;
    }

    inline constexpr int ValveVendorId = 0x28de;
    inline constexpr int SteamDeckProductId = 0x1205;

    constexpr bool is_steam_deck(int vid, int pid)
    {
        return vid == ValveVendorId && pid == SteamDeckProductId;
    }
}
