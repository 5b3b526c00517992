#include "example.hpp"

#include <cstdlib>

namespace deckpad::example
{
    std::optional<Options> init_example(int argc, char* argv[], bool with_table)
    {
        auto program = argc > 0 ? argv[0] : "deckpad";

        Options options;
        try {
            options = parse_options(argc, argv, std::getenv("DECKPAD_LOG_LEVEL"));
        } catch (const std::exception&) {
            std::print(stderr, "{}", usage(program, with_table));
            throw;
        }

        if (options.help) {
            std::print("{}", usage(program, with_table));
            return std::nullopt;
        }

        if (options.table && !with_table) {
            raise_error("--table is only supported by the poller");
        }

        set_log_level(options.log_level);
        install_quit_handler();

        return options;
    }
}
