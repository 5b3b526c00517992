#include "example.hpp"

#include "deckpad/dashboard.hpp"
#include "deckpad/joystick.hpp"

#include <chrono>
#include <cstdlib>
#include <thread>

namespace deckpad::example
{
    static
    TextBlock render_frame(Joystick* joystick)
    {
        auto header = TextBlock {
            std::format("--- {} --- (Press Ctrl+C to quit)", joystick->get_name()),
            "",
        };
        return stack({ header, render_dashboard(joystick->get_state()) });
    }

    static
    int cmain(int argc, char* argv[])
    {
        try {
            auto options = init_example(argc, argv, false);
            if (!options) return EXIT_SUCCESS;

            auto joystick = Joystick::open(options->joystick);
            defer { unref(joystick); };

            {
                TerminalScreen screen;
                screen.present(render_frame(joystick));

                while (!quit_requested()) {
                    if (!joystick->update()) break;
                    screen.present(render_frame(joystick));
                    std::this_thread::sleep_for(std::chrono::milliseconds(options->refresh_delay_ms()));
                }
            }

            if (!joystick->is_connected()) log_warn("Joystick [{}] is no longer connected", joystick->get_name());
        } catch (const Error& e) {
            log_debug("Dashboard stopped: {}", e.what());
            return EXIT_FAILURE;
        } catch (const std::exception& e) {
            log_error("Dashboard stopped: {}", e.what());
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }
}

int main(int argc, char* argv[])
{
    return deckpad::example::cmain(argc, argv);
}
