#include "dashboard.hpp"

#include "core.hpp"

#include <algorithm>

namespace deckpad
{
    size_t visible_width(std::string_view text)
    {
        size_t width = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            auto c = static_cast<unsigned char>(text[i]);
            if (c == 0x1B && i + 1 < text.size() && text[i + 1] == '[') {
                i += 2;
                while (i < text.size() && (static_cast<unsigned char>(text[i]) < 0x40 || static_cast<unsigned char>(text[i]) > 0x7E)) ++i;
                continue;
            }
            // UTF-8 continuation bytes do not start a new cell
            if ((c & 0xC0) != 0x80) width++;
        }
        return width;
    }

    std::string pad(std::string_view text, size_t width, Align align)
    {
        auto w = visible_width(text);
        if (w >= width) return std::string(text);

        auto fill = std::string(width - w, ' ');
        return align == Align::Left
            ? std::string(text) + fill
            : fill + std::string(text);
    }

    std::string ansi(std::string_view sgr, std::string_view text)
    {
        return std::format("\u001B[{}m{}\u001B[0m", sgr, text);
    }

    std::string format_button(int value, std::string_view released_label)
    {
        return value ? ansi("1;32", "Pressed") : ansi("31", released_label);
    }

    std::string format_axis(int value)
    {
        auto color = value > 1000 ? "32" : value < -1000 ? "31" : "37";
        return ansi(color, std::format("{:+6d}", value));
    }

    std::string format_event_line(const JoystickEvent& event)
    {
        switch (event.type) {
            case JoystickEventType::AxisMotion:
                return std::format("Axis   {:2}: {:+6d}", event.index, event.value);
            case JoystickEventType::ButtonDown:
            case JoystickEventType::ButtonUp:
                return std::format("Button {:2}: {}", event.index, event.value ? "Pressed" : "Released");
            case JoystickEventType::DeviceRemoved:
                return "Device removed";
        }
        return {};
    }

// -----------------------------------------------------------------------------

    namespace
    {
        std::string repeat(std::string_view glyph, size_t count)
        {
            std::string out;
            out.reserve(glyph.size() * count);
            for (size_t i = 0; i < count; ++i) out += glyph;
            return out;
        }

        size_t block_width(const TextBlock& block)
        {
            size_t width = 0;
            for (auto& line : block) width = std::max(width, visible_width(line));
            return width;
        }
    }

    TextBlock Table::render() const
    {
        auto column_count = headers.size();
        for (auto& row : rows) column_count = std::max(column_count, row.size());

        std::vector<size_t> widths(column_count, 0);
        for (size_t c = 0; c < headers.size(); ++c) widths[c] = visible_width(headers[c]);
        for (auto& row : rows) {
            for (size_t c = 0; c < row.size(); ++c) widths[c] = std::max(widths[c], visible_width(row[c]));
        }

        auto alignment = [&](size_t c) { return c < align.size() ? align[c] : Align::Left; };

        auto render_row = [&](const std::vector<std::string>& cells) {
            std::string line;
            for (size_t c = 0; c < column_count; ++c) {
                if (c) line += "  ";
                line += pad(c < cells.size() ? cells[c] : "", widths[c], alignment(c));
            }
            return line;
        };

        TextBlock block;
        if (!headers.empty()) {
            std::vector<std::string> styled;
            for (auto& header : headers) styled.push_back(ansi("1", header));
            block.push_back(render_row(styled));

            size_t total = 0;
            for (auto w : widths) total += w;
            total += column_count ? 2 * (column_count - 1) : 0;
            block.push_back(repeat("─", total));
        }
        for (auto& row : rows) block.push_back(render_row(row));

        return block;
    }

    TextBlock panel(std::string_view title, const TextBlock& body)
    {
        auto title_width = visible_width(title);
        auto inner = std::max(block_width(body), title_width + 1);

        TextBlock block;
        block.push_back("╭─ " + ansi("1;36", title) + " " + repeat("─", inner - title_width - 1) + "╮");
        for (auto& line : body) {
            block.push_back("│ " + pad(line, inner) + " │");
        }
        block.push_back("╰" + repeat("─", inner + 2) + "╯");

        return block;
    }

    TextBlock columns(const std::vector<TextBlock>& blocks, size_t gap)
    {
        size_t height = 0;
        std::vector<size_t> widths;
        for (auto& block : blocks) {
            height = std::max(height, block.size());
            widths.push_back(block_width(block));
        }

        TextBlock out(height);
        for (size_t row = 0; row < height; ++row) {
            for (size_t b = 0; b < blocks.size(); ++b) {
                if (b) out[row] += std::string(gap, ' ');
                auto& block = blocks[b];
                out[row] += pad(row < block.size() ? block[row] : "", widths[b]);
            }
        }

        return out;
    }

    TextBlock stack(const std::vector<TextBlock>& blocks)
    {
        TextBlock out;
        for (auto& block : blocks) out.insert(out.end(), block.begin(), block.end());
        return out;
    }

    TextBlock group_panel(std::string_view title, const ControlGroup& group)
    {
        Table table {
            .align = { Align::Left, Align::Right },
        };

        for (auto& control : group) {
            table.rows.push_back({
                ansi("36", control.label),
                control.kind == ControlKind::Button
                    ? format_button(control.value, "Off")
                    : format_axis(control.value),
            });
        }

        return panel(title, table.render());
    }

    TextBlock render_raw_dashboard(const JoystickState& state)
    {
        Table buttons {
            .headers = { "ID", "State" },
            .align = { Align::Right, Align::Left },
        };
        for (size_t i = 0; i < state.buttons.size(); ++i) {
            buttons.rows.push_back({ ansi("36", std::to_string(i)), format_button(state.buttons[i], "Released") });
        }

        Table axes {
            .headers = { "ID", "Value" },
            .align = { Align::Right, Align::Right },
        };
        for (size_t i = 0; i < state.axes.size(); ++i) {
            axes.rows.push_back({ ansi("36", std::to_string(i)), format_axis(state.axes[i]) });
        }

        return columns({
            panel("Buttons", buttons.render()),
            panel("Axes", axes.render()),
        }, 2);
    }

    TextBlock render_dashboard(const JoystickState& state)
    {
        auto left = stack({
            group_panel("Face Buttons", face_buttons(state)),
            group_panel("D-Pad", dpad_state(state)),
        });
        auto middle = group_panel("Joysticks", stick_state(state));
        auto right = stack({
            group_panel("Shoulders", shoulder_state(state)),
            group_panel("Back Grips", back_buttons(state)),
        });

        return columns({ left, middle, right }, 2);
    }

    std::string join_lines(const TextBlock& block)
    {
        std::string out;
        for (auto& line : block) {
            out += line;
            out += '\n';
        }
        return out;
    }

// -----------------------------------------------------------------------------

    TerminalScreen::TerminalScreen()
    {
        std::print("\u001B[?1049h\u001B[?25l");
        std::fflush(stdout);
    }

    TerminalScreen::~TerminalScreen()
    {
        std::print("\u001B[?25h\u001B[?1049l");
        std::fflush(stdout);
    }

    void TerminalScreen::present(const TextBlock& frame)
    {
        std::string out = "\u001B[H";
        for (auto& line : frame) {
            out += line;
            out += "\u001B[K\n";
        }
        out += "\u001B[J";

        std::print("{}", out);
        std::fflush(stdout);
    }
}
