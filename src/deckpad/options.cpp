#include "options.hpp"

#include <charconv>

namespace deckpad
{
    namespace
    {
        int parse_int(std::string_view flag, std::string_view text, int min, int max)
        {
            int value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                raise_error("Invalid value for {}: '{}'", flag, text);
            }
            if (value < min || value > max) {
                raise_error("Value for {} out of range [{}, {}]: {}", flag, min, max, value);
            }
            return value;
        }

        LogLevel parse_level(std::string_view source, std::string_view text)
        {
            auto level = parse_log_level(text);
            if (!level) raise_error("Invalid log level from {}: '{}'", source, text);
            return *level;
        }
    }

    Options parse_options(int argc, char* argv[], const char* env_log_level)
    {
        Options options;

        if (env_log_level && *env_log_level) {
            options.log_level = parse_level("DECKPAD_LOG_LEVEL", env_log_level);
        }

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            auto value = [&]() -> std::string_view {
                if (i + 1 >= argc) raise_error("Missing value for {}", arg);
                return argv[++i];
            };

            if      (arg == "--index"sv)     options.joystick.index       = parse_int(arg, value(), 0, 255);
            else if (arg == "--device"sv)    options.joystick.devnode     = value();
            else if (arg == "--axes"sv)      options.joystick.num_axes    = parse_int(arg, value(), 0, ABS_CNT);
            else if (arg == "--buttons"sv)   options.joystick.num_buttons = parse_int(arg, value(), 0, KEY_CNT);
            else if (arg == "--rate"sv)      options.refresh_hz           = parse_int(arg, value(), 1, 1000);
            else if (arg == "--log-level"sv) options.log_level            = parse_level(arg, value());
            else if (arg == "--table"sv)     options.table = true;
            else if (arg == "--help"sv || arg == "-h"sv) options.help = true;
            else raise_error("Unknown option '{}'", arg);
        }

        return options;
    }

    std::string usage(std::string_view program, bool with_table)
    {
        auto text = std::format(
            "Usage: {} [options]\n"
            "  --index N        joystick to open, 0 is the first one found (default 0)\n"
            "  --device PATH    open this evdev node instead of searching\n"
            "  --axes N         number of axes to track (default {})\n"
            "  --buttons N      number of buttons to track (default {})\n"
            "  --rate HZ        refresh rate (default 60)\n"
            "  --log-level L    trace, debug, info, warn or error (default info, or DECKPAD_LOG_LEVEL)\n",
            program, steam_deck::NumAxes, steam_deck::NumButtons);

        if (with_table) {
            text += "  --table          redraw a table of all values instead of printing events\n";
        }
        text += "  --help           show this message\n";

        return text;
    }
}
