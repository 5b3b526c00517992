#include "evdev_joystick.hpp"

#include <libevdev/libevdev.h>
#include <unistd.h>
#include <fcntl.h>

#define DECKPAD_NOISY_EVDEV_EVENTS 0
#define DECKPAD_DUMP_LAYOUT 1

namespace deckpad
{
    struct EvJoystick::Impl : EvJoystick
    {
        std::string devnode;
        libevdev* device = nullptr;
        int fd = -1;

        JoystickLayout layout;

        bool needs_sync = false;
        bool removed = false;

        ~Impl()
        {
            close();
        }
    };

    namespace
    {
        JoystickLayout read_layout(libevdev* device, int vid, int pid)
        {
            std::vector<int> keys;
            for (int code = 0; code <= KEY_MAX; ++code) {
                if (libevdev_has_event_code(device, EV_KEY, code)) keys.push_back(code);
            }

            std::vector<AxisInfo> axes;
            for (int code = 0; code < ABS_MAX; ++code) {
                if (!libevdev_has_event_code(device, EV_ABS, code)) continue;
                auto info = libevdev_get_abs_info(device, code);
                if (!info) continue;
                axes.push_back(AxisInfo {
                    .code = code,
                    .calibration = AxisCalibration {
                        .minimum = info->minimum,
                        .maximum = info->maximum,
                        .flat = info->flat,
                    },
                });
            }

            return JoystickLayout::build_for(vid, pid, keys, axes);
        }
    }

    EvJoystick* EvJoystick::open(std::string_view devnode)
    {
        auto self = new EvJoystick::Impl;
        defer { unref(self); };

        self->devnode = devnode;

        self->fd = ::open(self->devnode.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (self->fd == -1) raise_unix_error(std::format("Failed to open joystick {}", self->devnode));

        unix_check_ne(libevdev_new_from_fd(self->fd, &self->device));

        if (!self->has_gamepad() && !self->has_joystick()) {
            raise_error("Device {} [{}] is not a joystick", self->devnode, self->get_name());
        }

        self->layout = read_layout(self->device, self->get_vid(), self->get_pid());

#if DECKPAD_DUMP_LAYOUT
        log_debug("evdev = {}", libevdev_get_name(self->device));
        log_debug("  vid = {:#06x}", self->get_vid());
        log_debug("  pid = {:#06x}", self->get_pid());
        if (is_steam_deck(self->get_vid(), self->get_pid())) log_debug("  layout = Steam Deck");
        log_debug("  buttons = {}", self->layout.num_buttons());
        for (int i = 0; i < self->layout.num_buttons(); ++i) {
            log_trace("    button {:2} = {}", i, libevdev_event_code_get_name(EV_KEY, self->layout.button_codes[i]) ?: "?");
        }
        log_debug("  axes = {}", self->layout.num_axes());
        for (int i = 0; i < self->layout.num_axes(); ++i) {
            auto& axis = self->layout.axes[i];
            log_trace("    axis {:2} = {} [{}, {}] flat {}", i, libevdev_event_code_get_name(EV_ABS, axis.code) ?: "?",
                axis.calibration.minimum, axis.calibration.maximum, axis.calibration.flat);
        }
#endif

        return take(self);
    }

    void EvJoystick::destroy(EvJoystick* _self)
    {
        decl_self(_self);

        delete self;
    }

    const char* EvJoystick::get_devnode() { return get_impl(this)->devnode.c_str(); }
    int         EvJoystick::get_fd()      { return get_impl(this)->fd;              }

    const char* EvJoystick::get_name()
    {
        decl_self(this);

        if (!self->device) return "";
        return libevdev_get_name(self->device) ?: "";
    }

    int EvJoystick::get_vid() { decl_self(this); return self->device ? libevdev_get_id_vendor( self->device) : 0; }
    int EvJoystick::get_pid() { decl_self(this); return self->device ? libevdev_get_id_product(self->device) : 0; }

    const JoystickLayout& EvJoystick::get_layout() { return get_impl(this)->layout; }

    bool EvJoystick::has_gamepad()  { return libevdev_has_event_code(get_impl(this)->device, EV_KEY, BTN_GAMEPAD);  }
    bool EvJoystick::has_joystick() { return libevdev_has_event_code(get_impl(this)->device, EV_KEY, BTN_JOYSTICK); }

    bool EvJoystick::is_open()    { return get_impl(this)->fd != -1; }
    bool EvJoystick::is_removed() { return get_impl(this)->removed;  }

    bool EvJoystick::poll(const JoystickEventCallback& callback)
    {
        decl_self(this);

        if (self->removed || !self->device) return false;

        input_event ev = {};

        for (;;) {
            auto res = unix_check_ne(libevdev_next_event(self->device,
                self->needs_sync ? LIBEVDEV_READ_FLAG_SYNC : LIBEVDEV_READ_FLAG_NORMAL, &ev), EAGAIN, ENODEV);

            if (res == LIBEVDEV_READ_STATUS_SYNC) {
                self->needs_sync = true;
                if (ev.type == EV_SYN && ev.code == SYN_DROPPED) {
                    log_debug("Sync required");
                    continue;
                } else {
                    log_trace("Sync ({}) = {}", libevdev_event_code_get_name(ev.type, ev.code) ?: "?", ev.value);
                }
            }
            else if (res == -EAGAIN) {
                if (!self->needs_sync) return true;

                log_debug("Sync completed!");
                self->needs_sync = false;
                continue;
            }
            else if (res == -ENODEV) {
                log_warn("Joystick [{}] disconnected", self->get_name());
                self->removed = true;
                callback(JoystickEvent { .type = JoystickEventType::DeviceRemoved });
                return false;
            }
#if DECKPAD_NOISY_EVDEV_EVENTS
            else {
                if (ev.type != EV_SYN) {
                    log_trace("Event ({}) = {}", libevdev_event_code_get_name(ev.type, ev.code) ?: "?", ev.value);
                }
            }
#endif

            if (auto event = self->layout.translate(ev)) {
                callback(*event);
            }
        }
    }

    void EvJoystick::close()
    {
        decl_self(this);

        if (self->device) {
            log_trace("Freeing libevdev device (device = {}, fd = {})", (void*)self->device, self->fd);
            libevdev_free(self->device);
            self->device = nullptr;
        }
        if (self->fd != -1) ::close(take_fd(self->fd));
    }
}
