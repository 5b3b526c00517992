#pragma once

#include "core.hpp"

#include <functional>

#include <sys/epoll.h>

namespace deckpad
{
    struct FdEventData
    {
        int fd;
        uint32_t events;
    };

    using FdEventCallback = std::function<void(FdEventData)>;

    struct FdEventBus : RefCounted
    {
        struct Impl;

        static FdEventBus* create();
        static void destroy(FdEventBus*);

    public:
        void register_fd_listener(int fd, uint32_t events, FdEventCallback&& callback);
        void unregister_fd_listener(int fd);
        bool has_fd_listener(int fd);

        // Waits at most timeout_ms (0 returns immediately) and runs the callback
        // of every ready descriptor. Returns the number of callbacks run.
        int dispatch(int timeout_ms = 0);
    };
}
