#include "signals.hpp"

#include <atomic>
#include <csignal>

namespace deckpad
{
    namespace
    {
        std::atomic<bool> quit_flag = false;

        void signal_handler(int)
        {
            quit_flag = true;
        }
    }

    void install_quit_handler()
    {
        quit_flag = false;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    bool quit_requested()
    {
        return quit_flag;
    }

    void request_quit()
    {
        quit_flag = true;
    }
}
