#include "joystick.hpp"

#include "fd_event_bus.hpp"
#include "udev_subsystem.hpp"

namespace deckpad
{
    struct Joystick::Impl : Joystick
    {
        FdEventBus* bus = nullptr;
        UDevSubsystem* udev = nullptr;
        EvJoystick* device = nullptr;

        std::string name;
        std::string devnode;

        JoystickState state{steam_deck::NumAxes, steam_deck::NumButtons};
        bool attached = false;
        bool connected = false;

        const JoystickEventCallback* on_event = nullptr;
    };

    namespace
    {
        void handle_joystick_event(Joystick::Impl* self, const JoystickEvent& event)
        {
            if (event.type == JoystickEventType::DeviceRemoved) {
                self->connected = false;
            } else if (!self->state.apply(event)) {
                log_trace("Ignoring {} for untracked identifier {}", to_string(event.type), event.index);
            }

            if (self->on_event) (*self->on_event)(event);
        }

        void detach_device(Joystick::Impl* self)
        {
            if (!self->device) return;

            if (self->bus->has_fd_listener(self->device->get_fd())) {
                self->bus->unregister_fd_listener(self->device->get_fd());
            }
            self->device->close();
            unref(take(self->device));
        }

        std::string find_joystick(UDevSubsystem* udev, int index)
        {
            if (index < 0) raise_error("Invalid joystick index {}", index);

            auto joysticks = udev->enumerate_joysticks();
            if (joysticks.empty()) {
                raise_error("No joystick found. Please connect a controller.");
            }
            if (index >= int(joysticks.size())) {
                raise_error("Failed to open joystick {}: only {} joystick(s) found", index, joysticks.size());
            }

            return joysticks[index].devnode;
        }
    }

    Joystick* Joystick::open(const JoystickConfig& config)
    {
        auto self = new Joystick::Impl;
        defer { unref(self); };

        self->state = JoystickState(config.num_axes, config.num_buttons);

        self->bus = FdEventBus::create();
        self->udev = UDevSubsystem::create();

        self->devnode = config.devnode.empty()
            ? find_joystick(self->udev, config.index)
            : config.devnode;

        self->device = EvJoystick::open(self->devnode);
        self->name = self->device->get_name();
        self->attached = true;
        self->connected = true;

        auto& layout = self->device->get_layout();
        if (layout.num_buttons() > config.num_buttons || layout.num_axes() > config.num_axes) {
            log_debug("Device reports {} buttons and {} axes, tracking {} and {}",
                layout.num_buttons(), layout.num_axes(), config.num_buttons, config.num_axes);
        }

        self->bus->register_fd_listener(self->device->get_fd(), EPOLLIN, [self](FdEventData) {
            if (!self->device) return;
            if (!self->device->poll([self](const JoystickEvent& event) { handle_joystick_event(self, event); })) {
                detach_device(self);
            }
        });

        self->udev->register_device_listener([self](UDeviceEvent event) {
            if (event.action == UDevAction::Add) {
                log_debug("Joystick connected: {} [{}]", event.node->devnode, event.node->name);
                return;
            }

            if (!self->device || event.node->devnode != self->devnode) return;

            log_warn("Joystick [{}] removed", self->name);
            detach_device(self);
            handle_joystick_event(self, JoystickEvent { .type = JoystickEventType::DeviceRemoved });
        });
        self->udev->start(self->bus);

        log_info("Opened: {}", self->name);

        return take(self);
    }

    void Joystick::destroy(Joystick* _self)
    {
        decl_self(_self);

        self->close();
        delete self;
    }

    const char* Joystick::get_name()    { return get_impl(this)->name.c_str();    }
    const char* Joystick::get_devnode() { return get_impl(this)->devnode.c_str(); }

    bool Joystick::update()
    {
        return update({});
    }

    bool Joystick::update(const JoystickEventCallback& on_event)
    {
        decl_self(this);

        if (!self->bus) return false;

        self->on_event = on_event ? &on_event : nullptr;
        defer { self->on_event = nullptr; };

        self->bus->dispatch(0);

        return self->connected;
    }

    const JoystickState& Joystick::get_state() { return get_impl(this)->state; }

    ControlGroup Joystick::face_buttons()   { return deckpad::face_buttons(  get_impl(this)->state); }
    ControlGroup Joystick::dpad_state()     { return deckpad::dpad_state(    get_impl(this)->state); }
    ControlGroup Joystick::shoulder_state() { return deckpad::shoulder_state(get_impl(this)->state); }
    ControlGroup Joystick::stick_state()    { return deckpad::stick_state(   get_impl(this)->state); }
    ControlGroup Joystick::back_buttons()   { return deckpad::back_buttons(  get_impl(this)->state); }
    FullState    Joystick::full_state()     { return get_impl(this)->state.snapshot();               }

    bool Joystick::is_open()      { return get_impl(this)->device != nullptr; }
    bool Joystick::is_connected() { return get_impl(this)->connected;         }

    void Joystick::close()
    {
        decl_self(this);

        if (!self->bus) return;

        detach_device(self);
        self->connected = false;

        unref(take(self->udev));
        unref(take(self->bus));

        if (self->attached) log_info("Joystick closed and resources released.");
    }
}
