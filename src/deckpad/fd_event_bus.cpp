#include "fd_event_bus.hpp"

#include <algorithm>
#include <list>

#include <sys/epoll.h>
#include <fcntl.h>
#include <unistd.h>

namespace deckpad
{
    struct FdEventHandler
    {
        int fd;
        FdEventCallback callback;
    };

    struct FdEventBus::Impl : FdEventBus {
        int epollfd = -1;
        std::list<FdEventHandler> handlers;
    };

    FdEventBus* FdEventBus::create()
    {
        auto bus = new FdEventBus::Impl;
        defer { unref(bus); };
        bus->epollfd = unix_check_n1(epoll_create1(EPOLL_CLOEXEC));
        return take(bus);
    }

    void FdEventBus::destroy(FdEventBus* _self)
    {
        decl_self(_self);

        if (self->epollfd != -1) close(take_fd(self->epollfd));
        delete self;
    }

    void FdEventBus::register_fd_listener(int fd, uint32_t events, FdEventCallback&& fn)
    {
        decl_self(this);

        epoll_event event {
            .events = events,
            .data{.ptr = &self->handlers.emplace_back(fd, std::move(fn))},
        };
        unix_check_n1(epoll_ctl(self->epollfd, EPOLL_CTL_ADD, fd, &event));
    }

    void FdEventBus::unregister_fd_listener(int fd)
    {
        decl_self(this);

        auto iter = std::ranges::find_if(self->handlers, [&](auto& handler) { return handler.fd == fd; });
        if (iter == self->handlers.end()) {
            log_warn("File descriptor {} not found in registered list", fd);
            return;
        }

        // A descriptor that was already closed has left the epoll set on its own
        unix_check_n1(epoll_ctl(self->epollfd, EPOLL_CTL_DEL, iter->fd, nullptr), EBADF, ENOENT);
        self->handlers.erase(iter);

        log_debug("Unregistered file descriptor: {}", fd);
    }

    bool FdEventBus::has_fd_listener(int fd)
    {
        decl_self(this);

        return std::ranges::any_of(self->handlers, [&](auto& handler) { return handler.fd == fd; });
    }

    int FdEventBus::dispatch(int timeout_ms)
    {
        decl_self(this);

        epoll_event events[16];
        auto events_ready = unix_check_n1(epoll_wait(self->epollfd, events, std::size(events), timeout_ms), EINTR);
        if (events_ready <= 0) return 0;

        // A callback may unregister any descriptor, including ones later in this batch
        int handled = 0;
        for (int i = 0; i < events_ready; ++i) {
            auto* ready = static_cast<FdEventHandler*>(events[i].data.ptr);
            auto iter = std::ranges::find_if(self->handlers, [&](auto& handler) { return &handler == ready; });
            if (iter == self->handlers.end()) continue;

            auto callback = iter->callback;
            callback(FdEventData {
                .fd = iter->fd,
                .events = events[i].events,
            });
            handled++;
        }

        return handled;
    }
}
