#include <catch2/catch_test_macros.hpp>
#include "../src/deckpad/controls.hpp"
#include "../src/deckpad/dashboard.hpp"
#include "../src/deckpad/joystick_layout.hpp"
#include "../src/deckpad/joystick_state.hpp"
#include "../src/deckpad/options.hpp"
#include "../src/deckpad/signals.hpp"
#include "../src/deckpad/udev_subsystem.hpp"

#include <algorithm>
#include <array>

using namespace deckpad;

namespace
{
    JoystickEvent button_event(int index, bool pressed)
    {
        return JoystickEvent {
            .type = pressed ? JoystickEventType::ButtonDown : JoystickEventType::ButtonUp,
            .index = index,
            .value = pressed ? 1 : 0,
        };
    }

    JoystickEvent axis_event(int index, int32_t value)
    {
        return JoystickEvent {
            .type = JoystickEventType::AxisMotion,
            .index = index,
            .value = value,
        };
    }

    input_event raw_event(uint16_t type, uint16_t code, int32_t value)
    {
        input_event ev{};
        ev.type = type;
        ev.code = code;
        ev.value = value;
        return ev;
    }

    Options parse(std::vector<const char*> args, const char* env = nullptr)
    {
        args.insert(args.begin(), "deckpad-test");
        return parse_options(int(args.size()), const_cast<char**>(args.data()), env);
    }

    std::string strip_ansi(std::string_view text)
    {
        std::string out;
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\x1B' && i + 1 < text.size() && text[i + 1] == '[') {
                i += 2;
                while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7E)) ++i;
                continue;
            }
            out += text[i];
        }
        return out;
    }

    bool contains(const TextBlock& block, std::string_view needle)
    {
        return std::ranges::any_of(block, [&](auto& line) { return strip_ansi(line).find(needle) != std::string::npos; });
    }
}

// ---------------------------------------------------------------------------
// JoystickState
// ---------------------------------------------------------------------------

TEST_CASE("New state starts released and centered", "[state]") {
    JoystickState state(6, 20);

    CHECK(state.axes.size() == 6);
    CHECK(state.buttons.size() == 20);
    CHECK(std::ranges::all_of(state.axes, [](auto v) { return v == 0; }));
    CHECK(std::ranges::all_of(state.buttons, [](auto v) { return v == 0; }));
}

TEST_CASE("Button entries hold the last event received", "[state]") {
    JoystickState state(6, 20);

    SECTION("Press then release") {
        state.apply(button_event(3, true));
        state.apply(button_event(3, false));
        CHECK(state.get_button(3) == 0);
    }

    SECTION("Repeated presses stay pressed") {
        state.apply(button_event(3, true));
        state.apply(button_event(3, true));
        CHECK(state.get_button(3) == 1);
    }

    SECTION("Long alternating sequence ends on the final state") {
        bool pressed = false;
        for (int i = 0; i < 101; ++i) {
            pressed = (i % 3) != 0;
            state.apply(button_event(19, pressed));
        }
        CHECK(state.get_button(19) == (pressed ? 1 : 0));
    }

    SECTION("Other buttons are untouched") {
        state.apply(button_event(0, true));
        CHECK(state.get_button(0) == 1);
        CHECK(state.get_button(1) == 0);
    }
}

TEST_CASE("Axis values are stored verbatim", "[state]") {
    JoystickState state(6, 20);

    for (int32_t value : { -32768, -1001, -1, 0, 1, 12040, 32767 }) {
        state.apply(axis_event(2, value));
        CHECK(state.get_axis(2) == value);
    }
}

TEST_CASE("Untracked identifiers are ignored", "[state]") {
    JoystickState state(6, 20);
    auto before = state.snapshot();

    CHECK_FALSE(state.apply(button_event(20, true)));
    CHECK_FALSE(state.apply(button_event(-1, true)));
    CHECK_FALSE(state.apply(axis_event(6, 100)));
    CHECK_FALSE(state.apply(JoystickEvent { .type = JoystickEventType::DeviceRemoved }));

    CHECK(state.snapshot() == before);
    CHECK(state.get_button(42) == 0);
    CHECK(state.get_axis(42) == 0);
}

TEST_CASE("Snapshot is a copy", "[state]") {
    JoystickState state(2, 2);
    state.apply(axis_event(0, 500));

    auto snapshot = state.snapshot();
    state.apply(axis_event(0, -500));

    CHECK(snapshot.axes[0] == 500);
    CHECK(state.get_axis(0) == -500);
}

TEST_CASE("Negative tracked counts are rejected", "[state]") {
    CHECK_THROWS(JoystickState(-1, 20));
}

// ---------------------------------------------------------------------------
// Grouped controls
// ---------------------------------------------------------------------------

TEST_CASE("Groups agree with the full state", "[controls]") {
    JoystickState state(steam_deck::NumAxes, steam_deck::NumButtons);
    for (int i = 0; i < steam_deck::NumButtons; i += 2) state.apply(button_event(i, true));
    for (int i = 0; i < steam_deck::NumAxes; ++i) state.apply(axis_event(i, i * 5000 - 12000));

    auto full = state.snapshot();

    for (auto& group : { face_buttons(state), dpad_state(state), shoulder_state(state), stick_state(state), back_buttons(state) }) {
        for (auto& control : group) {
            if (control.kind == ControlKind::Button) CHECK(control.value == full.buttons[control.index]);
            else                                     CHECK(control.value == full.axes[control.index]);
        }
    }
}

TEST_CASE("Steam Deck group layout", "[controls]") {
    JoystickState state(steam_deck::NumAxes, steam_deck::NumButtons);
    state.apply(button_event(16, true));
    state.apply(axis_event(5, 21530));

    auto back = back_buttons(state);
    REQUIRE(back.size() == 4);
    CHECK(back[0].label == "L4");
    CHECK(back[0].value == 0);
    CHECK(back[1].label == "R4");
    CHECK(back[1].value == 1);

    auto shoulders = shoulder_state(state);
    REQUIRE(shoulders.size() == 4);
    CHECK(shoulders[3].label == "R2 Axis");
    CHECK(shoulders[3].kind == ControlKind::Axis);
    CHECK(shoulders[3].value == 21530);

    auto sticks = stick_state(state);
    REQUIRE(sticks.size() == 6);
    CHECK(sticks[4].label == "L3");
    CHECK(sticks[4].index == 7);
}

TEST_CASE("Groups read zero for identifiers that are not tracked", "[controls]") {
    JoystickState state(2, 4);

    for (auto& control : back_buttons(state)) CHECK(control.value == 0);
    for (auto& control : shoulder_state(state)) CHECK(control.value == 0);
}

// ---------------------------------------------------------------------------
// JoystickLayout
// ---------------------------------------------------------------------------

TEST_CASE("Joystick buttons are numbered before low key codes", "[layout]") {
    std::array keys { KEY_VOLUMEUP, BTN_WEST, BTN_SOUTH, BTN_EAST, BTN_NORTH, BTN_TL };
    auto layout = JoystickLayout::build(keys, {});

    REQUIRE(layout.num_buttons() == 6);
    CHECK(layout.find_button(BTN_SOUTH) == 0);
    CHECK(layout.find_button(BTN_EAST) == 1);
    CHECK(layout.find_button(BTN_NORTH) == 2);
    CHECK(layout.find_button(BTN_WEST) == 3);
    CHECK(layout.find_button(BTN_TL) == 4);
    CHECK(layout.find_button(KEY_VOLUMEUP) == 5);
    CHECK_FALSE(layout.find_button(BTN_TR));
}

TEST_CASE("Hat codes are not axes", "[layout]") {
    std::array axes {
        AxisInfo { .code = ABS_RX },
        AxisInfo { .code = ABS_HAT0X },
        AxisInfo { .code = ABS_X },
        AxisInfo { .code = ABS_HAT0Y },
        AxisInfo { .code = ABS_Y },
        AxisInfo { .code = ABS_HAT3Y },
    };
    auto layout = JoystickLayout::build({}, axes);

    REQUIRE(layout.num_axes() == 3);
    CHECK(layout.find_axis(ABS_X) == 0);
    CHECK(layout.find_axis(ABS_Y) == 1);
    CHECK(layout.find_axis(ABS_RX) == 2);
    CHECK_FALSE(layout.find_axis(ABS_HAT0X));
}

TEST_CASE("Steam Deck codes reach the named groups", "[layout]") {
    // Capabilities of the Deck's built-in controller as the kernel reports them
    std::array keys {
        BTN_TL, BTN_TR, BTN_TL2, BTN_TR2,
        BTN_A, BTN_B, BTN_X, BTN_Y,
        BTN_DPAD_UP, BTN_DPAD_DOWN, BTN_DPAD_LEFT, BTN_DPAD_RIGHT,
        BTN_SELECT, BTN_MODE, BTN_START,
        BTN_THUMBL, BTN_THUMBR, BTN_THUMB, BTN_THUMB2, BTN_BASE,
        BTN_TRIGGER_HAPPY1, BTN_TRIGGER_HAPPY2, BTN_TRIGGER_HAPPY3, BTN_TRIGGER_HAPPY4,
    };
    auto stick = AxisCalibration { .minimum = -32767, .maximum = 32767, .flat = 2500 };
    auto trigger = AxisCalibration { .minimum = 0, .maximum = 32767, .flat = 2500 };
    std::array axes {
        AxisInfo { .code = ABS_X,     .calibration = stick },
        AxisInfo { .code = ABS_Y,     .calibration = stick },
        AxisInfo { .code = ABS_RX,    .calibration = stick },
        AxisInfo { .code = ABS_RY,    .calibration = stick },
        AxisInfo { .code = ABS_HAT0X, .calibration = stick },
        AxisInfo { .code = ABS_HAT0Y, .calibration = stick },
        AxisInfo { .code = ABS_HAT1X, .calibration = stick },
        AxisInfo { .code = ABS_HAT1Y, .calibration = stick },
        AxisInfo { .code = ABS_HAT2X, .calibration = trigger },
        AxisInfo { .code = ABS_HAT2Y, .calibration = trigger },
    };

    auto layout = JoystickLayout::build_for(ValveVendorId, SteamDeckProductId, keys, axes);
    REQUIRE(layout.num_buttons() == steam_deck::NumButtons);
    REQUIRE(layout.num_axes() == steam_deck::NumAxes);

    JoystickState state(steam_deck::NumAxes, steam_deck::NumButtons);
    auto feed = [&](uint16_t type, uint16_t code, int32_t value) {
        auto event = layout.translate(raw_event(type, code, value));
        REQUIRE(event);
        CHECK(state.apply(*event));
    };

    SECTION("Resting triggers read the minimum") {
        feed(EV_ABS, ABS_HAT2Y, 0);
        feed(EV_ABS, ABS_HAT2X, 0);

        auto shoulders = shoulder_state(state);
        CHECK(shoulders[2].value == -32768);
        CHECK(shoulders[3].value == -32768);
    }

    SECTION("Buttons and triggers land in their groups") {
        feed(EV_KEY, BTN_A, 1);
        feed(EV_KEY, BTN_TL, 1);
        feed(EV_KEY, BTN_DPAD_UP, 1);
        feed(EV_KEY, BTN_TRIGGER_HAPPY1, 1);
        feed(EV_KEY, BTN_THUMBR, 1);
        feed(EV_ABS, ABS_HAT2Y, 32767);
        feed(EV_ABS, ABS_HAT2X, 0);
        feed(EV_ABS, ABS_RX, 32767);

        auto face = face_buttons(state);
        CHECK(face[0].label == "A");
        CHECK(face[0].value == 1);
        CHECK(face[1].value == 0);
        CHECK(face[2].value == 0);
        CHECK(face[3].value == 0);

        auto shoulders = shoulder_state(state);
        CHECK(shoulders[0].label == "L1");
        CHECK(shoulders[0].value == 1);
        CHECK(shoulders[1].value == 0);
        CHECK(shoulders[2].label == "L2 Axis");
        CHECK(shoulders[2].value == 32767);
        CHECK(shoulders[3].label == "R2 Axis");
        CHECK(shoulders[3].value == -32768);

        auto dpad = dpad_state(state);
        CHECK(dpad[0].label == "Up");
        CHECK(dpad[0].value == 1);
        CHECK(dpad[1].value == 0);

        auto back = back_buttons(state);
        CHECK(back[0].label == "L4");
        CHECK(back[0].value == 0);
        CHECK(back[1].label == "R4");
        CHECK(back[1].value == 1);

        auto sticks = stick_state(state);
        CHECK(sticks[2].label == "RX");
        CHECK(sticks[2].value == 32767);
        CHECK(sticks[5].label == "R3");
        CHECK(sticks[5].value == 1);
    }

    SECTION("Touch and trigger click keys have no identifier") {
        for (auto code : { BTN_THUMB, BTN_THUMB2, BTN_TL2, BTN_TR2 }) {
            CHECK_FALSE(layout.find_button(code));
            CHECK_FALSE(layout.translate(raw_event(EV_KEY, code, 1)));
        }
        CHECK_FALSE(layout.translate(raw_event(EV_ABS, ABS_HAT0X, 100)));
    }
}

TEST_CASE("Other devices keep the generic order", "[layout]") {
    std::array keys { BTN_SOUTH, BTN_EAST, BTN_THUMB };
    std::array axes { AxisInfo { .code = ABS_X }, AxisInfo { .code = ABS_HAT2Y } };

    auto layout = JoystickLayout::build_for(ValveVendorId, 0x1142, keys, axes);
    CHECK(layout.find_button(BTN_THUMB) == 0);
    CHECK(layout.find_button(BTN_SOUTH) == 1);
    CHECK(layout.num_axes() == 1);
    CHECK_FALSE(layout.find_axis(ABS_HAT2Y));
}

TEST_CASE("Axis calibration", "[layout]") {
    SECTION("Full signed range passes through") {
        AxisCalibration calibration { .minimum = -32768, .maximum = 32767 };
        CHECK(calibration.apply(-32768) == -32768);
        CHECK(calibration.apply(0) == 0);
        CHECK(calibration.apply(12040) == 12040);
        CHECK(calibration.apply(32767) == 32767);
    }

    SECTION("Unsigned trigger range rests at the minimum") {
        AxisCalibration calibration { .minimum = 0, .maximum = 32767 };
        CHECK(calibration.apply(0) == -32768);
        CHECK(calibration.apply(32767) == 32767);
    }

    SECTION("Small ranges are stretched") {
        AxisCalibration calibration { .minimum = 0, .maximum = 255 };
        CHECK(calibration.apply(0) == -32768);
        CHECK(calibration.apply(255) == 32767);
        CHECK(calibration.apply(128) > 0);
    }

    SECTION("Values inside the flat zone read zero") {
        AxisCalibration calibration { .minimum = -32768, .maximum = 32767, .flat = 128 };
        CHECK(calibration.apply(100) == 0);
        CHECK(calibration.apply(-100) == 0);
        CHECK(calibration.apply(5000) == 5000);
    }

    SECTION("Out of range values are clamped") {
        AxisCalibration calibration { .minimum = -100, .maximum = 100 };
        CHECK(calibration.apply(1000) == 32767);
        CHECK(calibration.apply(-1000) == -32768);
    }

    SECTION("Degenerate range clamps the raw value") {
        AxisCalibration calibration { .minimum = 5, .maximum = 5 };
        CHECK(calibration.apply(42) == 42);
        CHECK(calibration.apply(100000) == 32767);
    }
}

TEST_CASE("Kernel events become joystick events", "[layout]") {
    std::array keys { BTN_SOUTH, BTN_EAST };
    std::array axes {
        AxisInfo { .code = ABS_X, .calibration = { .minimum = -32768, .maximum = 32767 } },
        AxisInfo { .code = ABS_Z, .calibration = { .minimum = 0, .maximum = 32767 } },
    };
    auto layout = JoystickLayout::build(keys, axes);

    SECTION("Button press and release") {
        auto down = layout.translate(raw_event(EV_KEY, BTN_EAST, 1));
        REQUIRE(down);
        CHECK(down->type == JoystickEventType::ButtonDown);
        CHECK(down->index == 1);
        CHECK(down->value == 1);

        auto up = layout.translate(raw_event(EV_KEY, BTN_EAST, 0));
        REQUIRE(up);
        CHECK(up->type == JoystickEventType::ButtonUp);
        CHECK(up->value == 0);
    }

    SECTION("Axis motion is calibrated") {
        auto motion = layout.translate(raw_event(EV_ABS, ABS_Z, 0));
        REQUIRE(motion);
        CHECK(motion->type == JoystickEventType::AxisMotion);
        CHECK(motion->index == 1);
        CHECK(motion->value == -32768);
    }

    SECTION("Everything else is dropped") {
        CHECK_FALSE(layout.translate(raw_event(EV_SYN, SYN_REPORT, 0)));
        CHECK_FALSE(layout.translate(raw_event(EV_MSC, MSC_SCAN, 90001)));
        CHECK_FALSE(layout.translate(raw_event(EV_KEY, BTN_SOUTH, 2)));
        CHECK_FALSE(layout.translate(raw_event(EV_KEY, BTN_WEST, 1)));
        CHECK_FALSE(layout.translate(raw_event(EV_ABS, ABS_HAT0X, -1)));
    }
}

TEST_CASE("Event node numbers", "[udev]") {
    CHECK(event_node_number("/dev/input/event0") == 0);
    CHECK(event_node_number("/dev/input/event17") == 17);
    CHECK(event_node_number("/dev/input/js0") == -1);
    CHECK(event_node_number("/dev/input/event") == -1);
    CHECK(event_node_number("/dev/input/event3x") == -1);
}

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

TEST_CASE("Default options", "[options]") {
    auto options = parse({});

    CHECK(options.joystick.index == 0);
    CHECK(options.joystick.devnode.empty());
    CHECK(options.joystick.num_axes == 6);
    CHECK(options.joystick.num_buttons == 20);
    CHECK(options.refresh_hz == 60);
    CHECK(options.refresh_delay_ms() == 16);
    CHECK(options.log_level == LogLevel::Info);
    CHECK_FALSE(options.table);
    CHECK_FALSE(options.help);
}

TEST_CASE("Options from flags", "[options]") {
    auto options = parse({ "--index", "1", "--axes", "8", "--buttons", "32", "--rate", "30",
                           "--device", "/dev/input/event7", "--table", "--log-level", "debug" });

    CHECK(options.joystick.index == 1);
    CHECK(options.joystick.num_axes == 8);
    CHECK(options.joystick.num_buttons == 32);
    CHECK(options.refresh_hz == 30);
    CHECK(options.refresh_delay_ms() == 33);
    CHECK(options.joystick.devnode == "/dev/input/event7");
    CHECK(options.table);
    CHECK(options.log_level == LogLevel::Debug);
}

TEST_CASE("Log level from the environment", "[options]") {
    CHECK(parse({}, "warn").log_level == LogLevel::Warn);
    CHECK(parse({ "--log-level", "trace" }, "warn").log_level == LogLevel::Trace);
    CHECK(parse({}, "").log_level == LogLevel::Info);
    CHECK_THROWS(parse({}, "loud"));
}

TEST_CASE("Invalid options are rejected", "[options]") {
    CHECK_THROWS(parse({ "--rate", "0" }));
    CHECK_THROWS(parse({ "--rate", "fast" }));
    CHECK_THROWS(parse({ "--index", "-1" }));
    CHECK_THROWS(parse({ "--axes" }));
    CHECK_THROWS(parse({ "--bogus" }));
    CHECK_THROWS(parse({ "--log-level", "verbose" }));
}

TEST_CASE("Usage mentions the table flag only when supported", "[options]") {
    CHECK(usage("deckpad-poller", true).find("--table") != std::string::npos);
    CHECK(usage("deckpad-dashboard", false).find("--table") == std::string::npos);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

TEST_CASE("Visible width ignores escape sequences", "[dashboard]") {
    CHECK(visible_width("Pressed") == 7);
    CHECK(visible_width(ansi("1;32", "Pressed")) == 7);
    CHECK(visible_width("╭─╮") == 3);
    CHECK(visible_width("") == 0);
}

TEST_CASE("Padding aligns by visible width", "[dashboard]") {
    CHECK(pad("ab", 4) == "ab  ");
    CHECK(pad("ab", 4, Align::Right) == "  ab");
    CHECK(pad("abcdef", 4) == "abcdef");
    CHECK(visible_width(pad(ansi("31", "Off"), 8)) == 8);
}

TEST_CASE("Value formatting", "[dashboard]") {
    CHECK(format_button(1, "Off") == ansi("1;32", "Pressed"));
    CHECK(format_button(0, "Off") == ansi("31", "Off"));
    CHECK(format_button(0, "Released") == ansi("31", "Released"));

    CHECK(format_axis(12040) == ansi("32", "+12040"));
    CHECK(format_axis(-32768) == ansi("31", "-32768"));
    CHECK(format_axis(1000) == ansi("37", " +1000"));
    CHECK(format_axis(0) == ansi("37", "    +0"));
}

TEST_CASE("Per-event lines", "[dashboard]") {
    CHECK(format_event_line(button_event(3, true)) == "Button  3: Pressed");
    CHECK(format_event_line(button_event(12, false)) == "Button 12: Released");
    CHECK(format_event_line(axis_event(0, 12040)) == "Axis    0: +12040");
    CHECK(format_event_line(axis_event(5, -256)) == "Axis    5:   -256");
}

TEST_CASE("Panels are rectangular", "[dashboard]") {
    auto block = panel("Face Buttons", { "A  Pressed", "B" });

    REQUIRE(block.size() == 4);
    auto width = visible_width(block[0]);
    for (auto& line : block) CHECK(visible_width(line) == width);
    CHECK(strip_ansi(block[0]).find("Face Buttons") != std::string::npos);
}

TEST_CASE("Columns pad shorter blocks", "[dashboard]") {
    auto block = columns({ { "a", "b", "c" }, { "long" } }, 2);

    REQUIRE(block.size() == 3);
    CHECK(block[0] == "a  long");
    CHECK(block[1] == "b      ");
}

TEST_CASE("Grouped dashboard shows every group", "[dashboard]") {
    JoystickState state(steam_deck::NumAxes, steam_deck::NumButtons);
    state.apply(button_event(0, true));
    state.apply(axis_event(4, -32768));

    auto frame = render_dashboard(state);

    for (auto title : { "Face Buttons", "D-Pad", "Joysticks", "Shoulders", "Back Grips" }) {
        CHECK(contains(frame, title));
    }
    CHECK(contains(frame, "Pressed"));
    CHECK(contains(frame, "Off"));
    CHECK(contains(frame, "-32768"));
    CHECK(contains(frame, "L2 Axis"));
}

TEST_CASE("Raw dashboard lists every tracked identifier", "[dashboard]") {
    JoystickState state(3, 4);
    state.apply(button_event(2, true));
    state.apply(axis_event(1, 2048));

    auto frame = render_raw_dashboard(state);

    CHECK(contains(frame, "Buttons"));
    CHECK(contains(frame, "Axes"));
    CHECK(contains(frame, "Released"));
    CHECK(contains(frame, "+2048"));
    // Borders, header and separator plus one row per identifier
    CHECK(frame.size() == 2 + 2 + 4);
}

TEST_CASE("Joined frames end every line", "[dashboard]") {
    CHECK(join_lines({ "a", "b" }) == "a\nb\n");
    CHECK(join_lines({}).empty());
}

// ---------------------------------------------------------------------------
// Quit flag
// ---------------------------------------------------------------------------

TEST_CASE("Quit requests", "[signals]") {
    install_quit_handler();
    CHECK_FALSE(quit_requested());

    request_quit();
    CHECK(quit_requested());

    install_quit_handler();
    CHECK_FALSE(quit_requested());
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST_CASE("Raised errors are distinguishable from other exceptions", "[core]") {
    try {
        raise_error("Device {} is missing", 3);
        FAIL("raise_error returned");
    } catch (const Error& e) {
        CHECK(e.what() == "Device 3 is missing"sv);
    }

    CHECK_THROWS_AS(raise_unix_error("open", ENOENT), Error);
    CHECK_THROWS_AS(unix_check_n1(-1), Error);

    std::runtime_error other("bad");
    CHECK(dynamic_cast<const Error*>(&other) == nullptr);
}
