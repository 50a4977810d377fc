// flightpad: list flight controls, capture one and print what it maps to.
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/event_loop.hpp"
#include "core/log.hpp"
#include "core/settings.hpp"
#include "flight/capture_lifecycle.hpp"
#include "flight/device_defaults.hpp"
#include "flight/json_profile_store.hpp"
#include "flight/profile_update.hpp"
#include "hid/hidraw_backend.hpp"

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted.store(true); }

static std::string hex_bytes(const std::vector<uint8_t>& b, size_t max_bytes = 32) {
    static const char* digits = "0123456789ABCDEF";
    std::string s;
    for (size_t i = 0; i < b.size() && i < max_bytes; ++i) {
        if (i) s.push_back(' ');
        s.push_back(digits[b[i] >> 4]);
        s.push_back(digits[b[i] & 0xF]);
    }
    if (b.size() > max_bytes) s += " ...";
    return s;
}

// Prints both streams; the raw stream only when asked since it fires per report
class ConsoleSink : public FlightSink {
public:
    explicit ConsoleSink(bool show_raw) : _show_raw(show_raw) {}

    void on_state_update(const FlightControlsState& s) override {
        if (!s.connected) { std::printf("[state] %s disconnected\n", s.device_name.c_str()); return; }
        if (s.raw_bytes.empty()) { std::printf("[state] %s connected\n", s.device_name.c_str()); return; }
        if (!_show_raw) return;
        std::ostringstream ss;
        ss << "[state] axes=";
        for (size_t i = 0; i < s.axes.size(); ++i) ss << (i ? "," : "") << s.axes[i];
        ss << " buttons=";
        for (bool b : s.buttons) ss << (b ? '1' : '0');
        ss << " hat=" << s.hat_switch << " raw=" << hex_bytes(s.raw_bytes);
        std::printf("%s\n", ss.str().c_str());
    }

    void on_gamepad_update(const GamepadState& g) override {
        std::printf("[pad%d] %s LX=%6d LY=%6d RX=%6d RY=%6d LT=%3u RT=%3u buttons=0x%04X\n",
                    g.controller_id, g.connected ? "on " : "off",
                    g.left_stick_x, g.left_stick_y, g.right_stick_x, g.right_stick_y,
                    (unsigned)g.left_trigger, (unsigned)g.right_trigger, (unsigned)g.buttons);
    }

    void on_device_detected(const DeviceInfo& d) override {
        std::printf("[detect] %s (%s) at %s\n", d.product.c_str(),
                    make_vid_pid(d.vendor_id, d.product_id).c_str(), d.path.c_str());
    }

private:
    bool _show_raw;
};

static void print_usage() {
    std::fprintf(stderr,
        "usage: flightpad [--settings FILE] [--raw] <command>\n"
        "  list                              flight controls currently attached\n"
        "  capture [PATH]                    capture a device (first found when PATH is omitted)\n"
        "  watch                             report devices as they are plugged in\n"
        "  profiles                          dump stored profiles\n"
        "  reset VID:PID                     restore a device profile to defaults\n"
        "  set-axis VID:PID INDEX FIELD=VAL  edit axis mappings fed by INDEX\n");
}

// Runs the loop until Ctrl+C
static void run_until_interrupted(EventLoop& loop) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    loop.add_periodic(std::chrono::milliseconds(100), [&loop]() {
        if (g_interrupted.load()) loop.stop();
    });
    loop.run();
}

static int cmd_list(CaptureLifecycle& lifecycle) {
    auto devices = lifecycle.get_devices();
    if (devices.empty()) {
        std::printf("No flight controls found\n");
        return 0;
    }
    for (const auto& d : devices) {
        const DeviceDefault* known = find_device_default(d.vendor_id, d.product_id);
        std::printf("%s  %s  %s%s\n", d.path.c_str(), make_vid_pid(d.vendor_id, d.product_id).c_str(),
                    d.product.c_str(), known ? "  [known]" : "");
    }
    return 0;
}

static int cmd_capture(CaptureLifecycle& lifecycle, EventLoop& loop, std::string path) {
    if (path.empty()) {
        auto devices = lifecycle.get_devices();
        if (devices.empty()) {
            std::fprintf(stderr, "No flight controls found\n");
            return 1;
        }
        path = devices.front().path;
    }
    if (!lifecycle.start_capture(path)) {
        std::fprintf(stderr, "Could not capture %s\n", path.c_str());
        return 1;
    }
    // Leave the loop as soon as the device goes away
    loop.add_periodic(std::chrono::milliseconds(250), [&]() {
        if (!lifecycle.is_capturing()) loop.stop();
    });
    run_until_interrupted(loop);
    lifecycle.stop_capture();
    loop.poll();
    return 0;
}

static int cmd_set_axis(CaptureLifecycle& lifecycle, ProfileStore& store, const std::vector<std::string>& args) {
    if (args.size() < 3) { print_usage(); return 2; }
    auto vid_pid = normalize_vid_pid(args[0]);
    uint16_t vid = 0, pid = 0;
    if (!vid_pid || !parse_vid_pid(*vid_pid, vid, pid)) {
        std::fprintf(stderr, "Bad device id '%s' (expected VVVV:PPPP)\n", args[0].c_str());
        return 2;
    }
    uint32_t index = 0;
    try {
        index = static_cast<uint32_t>(std::stoul(args[1]));
    } catch (const std::exception&) {
        std::fprintf(stderr, "Bad axis index '%s'\n", args[1].c_str());
        return 2;
    }
    auto update = parse_axis_update(args[2]);
    if (!update) {
        std::fprintf(stderr, "Cannot parse '%s'\n", args[2].c_str());
        return 2;
    }
    if (auto why = update->validate()) {
        std::fprintf(stderr, "Rejected: %s\n", why->c_str());
        return 2;
    }

    std::optional<FlightProfile> current = store.find(*vid_pid);
    FlightProfile base = current ? *current : store.get_or_create_profile(vid, pid, "");
    auto updated = apply_axis_update(base, index, *update);
    if (!updated) return 2;
    if (!lifecycle.apply_profile(*updated)) {
        std::fprintf(stderr, "Failed to save profile\n");
        return 1;
    }
    std::printf("%s\n", JsonProfileStore::to_json_text({*updated}).c_str());
    return 0;
}

int main(int argc, char** argv) {
    std::string settings_path = "flightpad.cfg";
    bool show_raw = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--settings" && i + 1 < argc) settings_path = argv[++i];
        else if (a == "--raw") show_raw = true;
        else if (a == "-h" || a == "--help") { print_usage(); return 0; }
        else args.push_back(a);
    }
    if (args.empty()) { print_usage(); return 2; }
    const std::string command = args.front();
    args.erase(args.begin());

    FlightSettings settings;
    if (!load_settings(settings_path, settings)) {
        // First run: leave a file the user can edit
        if (!save_settings(settings_path, settings)) log_warn("Could not write default settings to " + settings_path);
    }
    set_log_file(settings.log_file);
    set_verbose_logging(settings.verbose);

    EventLoop loop;
    HidrawBackend backend(loop);
    JsonProfileStore store(settings.profiles_path);

    CaptureOptions options;
    options.enabled = settings.enabled;
    options.controller_slot = settings.controller_slot;
    options.hotplug_interval = std::chrono::milliseconds(settings.hotplug_interval_ms);
    // Declared first so it outlives the lifecycle
    ConsoleSink sink(show_raw);
    CaptureLifecycle lifecycle(backend, store, loop, options);
    lifecycle.set_sink(&sink);

    int rc = 0;
    if (command == "list") {
        rc = cmd_list(lifecycle);
    } else if (command == "capture") {
        rc = cmd_capture(lifecycle, loop, args.empty() ? std::string() : args.front());
    } else if (command == "watch") {
        lifecycle.initialize();
        if (!lifecycle.hotplug_active()) {
            std::fprintf(stderr, "Flight controls are disabled in %s\n", settings_path.c_str());
            return 1;
        }
        run_until_interrupted(loop);
    } else if (command == "profiles") {
        std::printf("%s\n", JsonProfileStore::to_json_text(store.list_all()).c_str());
    } else if (command == "reset") {
        if (args.empty()) { print_usage(); return 2; }
        auto vid_pid = normalize_vid_pid(args.front());
        if (!vid_pid) {
            std::fprintf(stderr, "Bad device id '%s' (expected VVVV:PPPP)\n", args.front().c_str());
            return 2;
        }
        auto fresh = store.reset(*vid_pid);
        if (!fresh) {
            std::fprintf(stderr, "No stored profile for %s\n", vid_pid->c_str());
            return 1;
        }
        std::printf("%s\n", JsonProfileStore::to_json_text({*fresh}).c_str());
    } else if (command == "set-axis") {
        rc = cmd_set_axis(lifecycle, store, args);
    } else {
        print_usage();
        rc = 2;
    }

    lifecycle.dispose();
    return rc;
}
