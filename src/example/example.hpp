#pragma once

#include "deckpad/options.hpp"
#include "deckpad/signals.hpp"

#include <optional>

namespace deckpad::example
{
    // Parses flags and DECKPAD_LOG_LEVEL, applies the log level and installs the
    // Ctrl+C handler. Returns nullopt when only usage was requested.
    std::optional<Options> init_example(int argc, char* argv[], bool with_table);
}
