#pragma once

#include "core.hpp"
#include "joystick_layout.hpp"

#include <libevdev/libevdev.h>

#include <functional>

namespace deckpad
{
    using JoystickEventCallback = std::function<void(const JoystickEvent&)>;

    struct EvJoystick : RefCounted
    {
        struct Impl;

        static EvJoystick* open(std::string_view devnode);
        static void destroy(EvJoystick*);

    public:
        const char* get_devnode();
        const char* get_name();
        int get_vid();
        int get_pid();
        int get_fd();

        const JoystickLayout& get_layout();

        bool has_gamepad();
        bool has_joystick();

        bool is_open();
        bool is_removed();

        // Drains every queued kernel event without blocking. Returns false once
        // the device is gone, after reporting a DeviceRemoved event.
        bool poll(const JoystickEventCallback& callback);

        void close();
    };
}
