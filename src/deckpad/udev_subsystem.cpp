#include "udev_subsystem.hpp"

#include <libudev.h>

#include <algorithm>
#include <charconv>

#define DECKPAD_TRACE_UDEV_EVENTS 0

namespace deckpad
{
    struct UDevSubsystem::Impl : UDevSubsystem
    {
        udev* ud = nullptr;
        udev_monitor* mon = nullptr;
        FdEventBus* bus = nullptr;
        std::vector<UDeviceCallbackFn> device_callbacks;
    };

    int event_node_number(std::string_view devnode)
    {
        constexpr auto Prefix = "/dev/input/event"sv;
        if (!devnode.starts_with(Prefix)) return -1;

        auto digits = devnode.substr(Prefix.size());
        if (digits.empty()) return -1;

        int number = -1;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
        if (ec != std::errc{} || end != digits.data() + digits.size()) return -1;
        return number;
    }

    UDevSubsystem* UDevSubsystem::create()
    {
        auto self = new UDevSubsystem::Impl;
        defer { unref(self); };

        self->ud = udev_new();
        if (!self->ud) raise_unix_error("udev_new");

        self->mon = udev_monitor_new_from_netlink(self->ud, "udev");
        if (!self->mon) raise_unix_error("udev_monitor_new_from_netlink");

        return take(self);
    }

    void UDevSubsystem::destroy(UDevSubsystem* _self)
    {
        decl_self(_self);

        self->stop();

        if (self->mon) udev_monitor_unref(self->mon);
        if (self->ud) udev_unref(self->ud);

        delete self;
    }

    namespace
    {
        bool is_joystick(udev_device* dev)
        {
            auto joystick = udev_device_get_property_value(dev, "ID_INPUT_JOYSTICK");
            return joystick && "1"sv == joystick;
        }

        UDevJoystickNode describe_node(udev_device* dev)
        {
            UDevJoystickNode node {
                .syspath = udev_device_get_syspath(dev) ?: "",
                .devnode = udev_device_get_devnode(dev) ?: "",
            };

            // eventN nodes carry no name, it lives on the parent inputN device
            if (auto parent = udev_device_get_parent_with_subsystem_devtype(dev, "input", nullptr)) {
                node.name = udev_device_get_sysattr_value(parent, "name") ?: "";
            }

            return node;
        }

        void handle_udev_events(UDevSubsystem::Impl* self)
        {
            for (;;) {
                auto dev = udev_monitor_receive_device(self->mon);
                if (!dev) break;
                defer { udev_device_unref(dev); };

                auto devnode = udev_device_get_devnode(dev);
                if (!devnode || event_node_number(devnode) < 0) continue;

                auto action = udev_device_get_action(dev);
                if (!action) continue;

#if DECKPAD_TRACE_UDEV_EVENTS
                log_trace("udev {} {}", action, devnode);
#endif

                UDevAction kind;
                if      ("add"sv    == action) kind = UDevAction::Add;
                else if ("remove"sv == action) kind = UDevAction::Remove;
                else continue;

                if (kind == UDevAction::Add && !is_joystick(dev)) continue;

                auto node = describe_node(dev);
                for (auto& cb : self->device_callbacks) {
                    cb(UDeviceEvent {
                        .action = kind,
                        .node = &node,
                    });
                }
            }
        }
    }

    void UDevSubsystem::register_device_listener(UDeviceCallbackFn&& fn)
    {
        get_impl(this)->device_callbacks.emplace_back(std::move(fn));
    }

    std::vector<UDevJoystickNode> UDevSubsystem::enumerate_joysticks()
    {
        decl_self(this);

        auto enumerate = udev_enumerate_new(self->ud);
        if (!enumerate) raise_unix_error("udev_enumerate_new");
        defer { udev_enumerate_unref(enumerate); };

        udev_enumerate_add_match_subsystem(enumerate, "input");
        udev_enumerate_add_match_property(enumerate, "ID_INPUT_JOYSTICK", "1");
        unix_check_ne(udev_enumerate_scan_devices(enumerate));

        std::vector<UDevJoystickNode> joysticks;

        udev_list_entry* entry;
        udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate)) {
            auto path = udev_list_entry_get_name(entry);
            auto dev = udev_device_new_from_syspath(self->ud, path);
            if (!dev) continue;
            defer { udev_device_unref(dev); };

            auto devnode = udev_device_get_devnode(dev);
            if (!devnode || event_node_number(devnode) < 0) continue;
            if (!is_joystick(dev)) continue;

            joysticks.emplace_back(describe_node(dev));
        }

        std::ranges::sort(joysticks, {}, [](const UDevJoystickNode& node) { return event_node_number(node.devnode); });

        log_debug("Found {} joystick node(s)", joysticks.size());
        for (auto& joystick : joysticks) {
            log_debug("  {} [{}]", joystick.devnode, joystick.name);
        }

        return joysticks;
    }

    void UDevSubsystem::start(FdEventBus* bus)
    {
        decl_self(this);

        if (self->bus) raise_error("udev monitor already started");

        unix_check_ne(udev_monitor_filter_add_match_subsystem_devtype(self->mon, "input", nullptr));
        unix_check_ne(udev_monitor_enable_receiving(self->mon));
        auto fd = unix_check_n1(udev_monitor_get_fd(self->mon));

        bus->register_fd_listener(fd, EPOLLIN, [self](FdEventData) {
            handle_udev_events(self);
        });
        self->bus = ref(bus);
    }

    void UDevSubsystem::stop()
    {
        decl_self(this);

        if (!self->bus) return;

        self->bus->unregister_fd_listener(udev_monitor_get_fd(self->mon));
        unref(take(self->bus));
    }
}
