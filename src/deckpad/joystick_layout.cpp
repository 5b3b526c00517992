#include "joystick_layout.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace deckpad
{
    int16_t AxisCalibration::apply(int32_t raw) const
    {
        if (maximum <= minimum) {
            return int16_t(std::clamp<int32_t>(raw, INT16_MIN, INT16_MAX));
        }

        if (flat > 0) {
            auto center = (double(minimum) + double(maximum)) / 2;
            if (std::abs(raw - center) <= flat) return 0;
        }

        auto range = double(maximum) - double(minimum);
        auto scaled = (double(raw) - minimum) * 65535.0 / range - 32768.0;
        return int16_t(std::clamp<long>(std::lround(scaled), INT16_MIN, INT16_MAX));
    }

    JoystickLayout JoystickLayout::build(std::span<const int> key_codes, std::span<const AxisInfo> abs_axes)
    {
        JoystickLayout layout;

        auto keys = std::vector<int>(key_codes.begin(), key_codes.end());
        std::ranges::sort(keys);
        keys.erase(std::ranges::unique(keys).begin(), keys.end());

        for (auto code : keys) {
            if (code >= BTN_JOYSTICK && code < KEY_MAX) layout.button_codes.push_back(code);
        }
        for (auto code : keys) {
            if (code >= 0 && code < BTN_JOYSTICK) layout.button_codes.push_back(code);
        }

        auto axes = std::vector<AxisInfo>(abs_axes.begin(), abs_axes.end());
        std::ranges::sort(axes, {}, &AxisInfo::code);

        for (auto& axis : axes) {
            if (axis.code < 0 || axis.code >= ABS_MAX || is_hat_code(axis.code)) continue;
            if (!layout.axes.empty() && layout.axes.back().code == axis.code) continue;
            layout.axes.push_back(axis);
        }

        return layout;
    }

    namespace
    {
        constexpr std::array<int, 20> SteamDeckButtons {
            BTN_A, BTN_B, BTN_X, BTN_Y,
            BTN_SELECT, BTN_MODE, BTN_START,
            BTN_THUMBL, BTN_THUMBR,
            BTN_TL, BTN_TR,
            BTN_DPAD_UP, BTN_DPAD_DOWN, BTN_DPAD_LEFT, BTN_DPAD_RIGHT,
            BTN_BASE,
            BTN_TRIGGER_HAPPY1, BTN_TRIGGER_HAPPY2, BTN_TRIGGER_HAPPY3, BTN_TRIGGER_HAPPY4,
        };

        constexpr std::array<int, 6> SteamDeckAxes {
            ABS_X, ABS_Y, ABS_RX, ABS_RY,
            ABS_HAT2Y, ABS_HAT2X,
        };
    }

    JoystickLayout JoystickLayout::build_steam_deck(std::span<const AxisInfo> abs_axes)
    {
        JoystickLayout layout;
        layout.button_codes.assign(SteamDeckButtons.begin(), SteamDeckButtons.end());

        for (auto code : SteamDeckAxes) {
            auto axis = AxisInfo { .code = code };

            auto iter = std::ranges::find(abs_axes, code, &AxisInfo::code);
            if (iter != abs_axes.end()) axis.calibration = iter->calibration;

            // Triggers rest at their minimum, there is no center to flatten
            if (code == ABS_HAT2X || code == ABS_HAT2Y) axis.calibration.flat = 0;

            layout.axes.push_back(axis);
        }

        return layout;
    }

    JoystickLayout JoystickLayout::build_for(int vid, int pid, std::span<const int> key_codes, std::span<const AxisInfo> abs_axes)
    {
        if (is_steam_deck(vid, pid)) return build_steam_deck(abs_axes);
        return build(key_codes, abs_axes);
    }

    std::optional<int> JoystickLayout::find_button(int key_code) const
    {
        auto iter = std::ranges::find(button_codes, key_code);
        if (iter == button_codes.end()) return std::nullopt;
        return int(iter - button_codes.begin());
    }

    std::optional<int> JoystickLayout::find_axis(int abs_code) const
    {
        auto iter = std::ranges::find(axes, abs_code, &AxisInfo::code);
        if (iter == axes.end()) return std::nullopt;
        return int(iter - axes.begin());
    }

    std::optional<JoystickEvent> JoystickLayout::translate(const input_event& ev) const
    {
        if (ev.type == EV_KEY) {
            if (ev.value == 2) return std::nullopt;

            auto index = find_button(ev.code);
            if (!index) return std::nullopt;

            return JoystickEvent {
                .type = ev.value ? JoystickEventType::ButtonDown : JoystickEventType::ButtonUp,
                .index = *index,
                .value = ev.value ? 1 : 0,
            };
        }

        if (ev.type == EV_ABS) {
            auto index = find_axis(ev.code);
            if (!index) return std::nullopt;

            return JoystickEvent {
                .type = JoystickEventType::AxisMotion,
                .index = *index,
                .value = axes[*index].calibration.apply(ev.value),
            };
        }

        return std::nullopt;
    }
}
