#pragma once

#include "core.hpp"
#include "controls.hpp"
#include "evdev_joystick.hpp"

#include <string>

namespace deckpad
{
    struct JoystickConfig
    {
        int index = 0;
        std::string devnode;
        int num_axes = steam_deck::NumAxes;
        int num_buttons = steam_deck::NumButtons;
    };

    // One open joystick plus the record of its latest button and axis values.
    //
    // update() must be called once per frame. It drains the device and hotplug
    // queues without blocking and folds every event into the state. The grouped
    // accessors read that state and never touch the device.
    struct Joystick : RefCounted
    {
        struct Impl;

        static Joystick* open(const JoystickConfig& config);
        static void destroy(Joystick*);

    public:
        const char* get_name();
        const char* get_devnode();

        // Returns false once the device has been removed or closed
        bool update();
        bool update(const JoystickEventCallback& on_event);

        const JoystickState& get_state();

        ControlGroup face_buttons();
        ControlGroup dpad_state();
        ControlGroup shoulder_state();
        ControlGroup stick_state();
        ControlGroup back_buttons();
        FullState full_state();

        bool is_open();
        bool is_connected();

        void close();
    };
}
