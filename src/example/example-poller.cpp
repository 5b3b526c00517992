#include "example.hpp"

#include "deckpad/dashboard.hpp"
#include "deckpad/joystick.hpp"

#include <chrono>
#include <cstdlib>
#include <thread>

namespace deckpad::example
{
    static
    void print_events(Joystick* joystick, const Options& options)
    {
        auto print_event = [](const JoystickEvent& event) {
            std::println("{}", format_event_line(event));
        };

        while (!quit_requested()) {
            if (!joystick->update(print_event)) break;
            std::fflush(stdout);
            std::this_thread::sleep_for(std::chrono::milliseconds(options.refresh_delay_ms()));
        }
    }

    static
    void redraw_table(Joystick* joystick, const Options& options)
    {
        TerminalScreen screen;

        while (!quit_requested()) {
            if (!joystick->update()) break;

            auto header = TextBlock {
                std::format("--- SIMPLE JOYSTICK DASHBOARD --- {} (Press Ctrl+C to quit)", joystick->get_name()),
                "",
            };
            screen.present(stack({ header, render_raw_dashboard(joystick->get_state()) }));

            std::this_thread::sleep_for(std::chrono::milliseconds(options.refresh_delay_ms()));
        }
    }

    static
    int cmain(int argc, char* argv[])
    {
        try {
            auto options = init_example(argc, argv, true);
            if (!options) return EXIT_SUCCESS;

            auto joystick = Joystick::open(options->joystick);
            defer { unref(joystick); };

            if (options->table) redraw_table(joystick, *options);
            else                print_events(joystick, *options);

            if (quit_requested()) log_info("Exiting poller...");
        } catch (const Error& e) {
            log_debug("Poller stopped: {}", e.what());
            return EXIT_FAILURE;
        } catch (const std::exception& e) {
            log_error("Poller stopped: {}", e.what());
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }
}

int main(int argc, char* argv[])
{
    return deckpad::example::cmain(argc, argv);
}
