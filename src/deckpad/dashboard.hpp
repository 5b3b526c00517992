#pragma once

#include "controls.hpp"
#include "joystick_state.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace deckpad
{
    // A rendered block of terminal text, one entry per row
    using TextBlock = std::vector<std::string>;

    enum class Align
    {
        Left,
        Right,
    };

    // Width in terminal cells, ignoring ANSI escape sequences
    size_t visible_width(std::string_view text);
    std::string pad(std::string_view text, size_t width, Align align = Align::Left);

    std::string ansi(std::string_view sgr, std::string_view text);

    std::string format_button(int value, std::string_view released_label);
    std::string format_axis(int value);

    // "Button  3: Pressed" / "Axis    0: +12040"
    std::string format_event_line(const JoystickEvent& event);

    struct Table
    {
        std::vector<std::string> headers;
        std::vector<Align> align;
        std::vector<std::vector<std::string>> rows;

        TextBlock render() const;
    };

    TextBlock panel(std::string_view title, const TextBlock& body);
    TextBlock columns(const std::vector<TextBlock>& blocks, size_t gap = 1);
    TextBlock stack(const std::vector<TextBlock>& blocks);

    TextBlock group_panel(std::string_view title, const ControlGroup& group);

    // Two panels listing every tracked button and axis
    TextBlock render_raw_dashboard(const JoystickState& state);

    // Face buttons and d-pad, then sticks, then shoulders and back grips
    TextBlock render_dashboard(const JoystickState& state);

    std::string join_lines(const TextBlock& block);

    // Alternate screen for live redraws, restored on destruction
    struct TerminalScreen
    {
        TerminalScreen();
        ~TerminalScreen();

        TerminalScreen(const TerminalScreen&) = delete;
        TerminalScreen& operator=(const TerminalScreen&) = delete;

        void present(const TextBlock& frame);
    };
}
