#pragma once

namespace deckpad
{
    // SIGINT and SIGTERM set a flag the polling loops check once per frame
    void install_quit_handler();
    bool quit_requested();
    void request_quit();
}
