#pragma once

#include "fd_event_bus.hpp"

#include <libudev.h>

#include <string>
#include <vector>

namespace deckpad
{
    enum class UDevAction
    {
        Add,
        Remove,
    };

    struct UDevJoystickNode
    {
        std::string syspath;
        std::string devnode;
        std::string name;
    };

    struct UDeviceEvent
    {
        UDevAction action;
        const UDevJoystickNode* node;
    };

    using UDeviceCallbackFn = std::function<void(UDeviceEvent)>;

    // "/dev/input/event12" -> 12, -1 for anything that is not an evdev node
    int event_node_number(std::string_view devnode);

    struct UDevSubsystem : RefCounted
    {
        struct Impl;

        static UDevSubsystem* create();
        static void destroy(UDevSubsystem*);

    public:
        void register_device_listener(UDeviceCallbackFn&&);

        // Joystick evdev nodes currently present, ordered by event number
        std::vector<UDevJoystickNode> enumerate_joysticks();

        void start(FdEventBus* bus);
        void stop();
    };
}
