#pragma once

#include "core.hpp"
#include "joystick.hpp"

#include <string>
#include <string_view>

namespace deckpad
{
    struct Options
    {
        JoystickConfig joystick;
        int refresh_hz = 60;
        LogLevel log_level = LogLevel::Info;
        bool table = false;
        bool help = false;

        int refresh_delay_ms() const { return 1000 / refresh_hz; }
    };

    // env_log_level is the value of DECKPAD_LOG_LEVEL, or null when unset.
    // Command-line flags take precedence over the environment.
    Options parse_options(int argc, char* argv[], const char* env_log_level = nullptr);

    std::string usage(std::string_view program, bool with_table);
}
