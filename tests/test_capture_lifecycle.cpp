#include "test_harness.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>
#include "core/event_loop.hpp"
#include "flight/capture_lifecycle.hpp"
#include "flight/device_defaults.hpp"

using namespace std::chrono_literals;

// ---- fakes ----

struct FakeDeviceState {
    HidDevice::DataHandler on_data;
    HidDevice::ErrorHandler on_error;
    bool closed = false;
    int close_calls = 0;
    bool alive = true;

    void push(const std::vector<uint8_t>& data) { if (!closed && on_data) on_data(data); }
    void fail(const std::string& message) { if (!closed && on_error) on_error(message); }
};

class FakeDevice : public HidDevice {
public:
    explicit FakeDevice(std::shared_ptr<FakeDeviceState> state) : _state(std::move(state)) {}
    ~FakeDevice() override { _state->alive = false; }
    void set_handlers(DataHandler on_data, ErrorHandler on_error) override {
        _state->on_data = std::move(on_data);
        _state->on_error = std::move(on_error);
    }
    void close() override {
        ++_state->close_calls;
        _state->closed = true;
    }
private:
    std::shared_ptr<FakeDeviceState> _state;
};

class FakeBackend : public HidBackend {
public:
    std::vector<DeviceInfo> devices;
    bool fail_open = false;
    bool fail_enumerate = false;
    int open_calls = 0;
    std::vector<std::shared_ptr<FakeDeviceState>> opened;

    std::vector<DeviceInfo> enumerate() override {
        if (fail_enumerate) throw std::runtime_error("bus unavailable");
        return devices;
    }
    std::unique_ptr<HidDevice> open(const std::string&) override {
        ++open_calls;
        if (fail_open) return nullptr;
        auto state = std::make_shared<FakeDeviceState>();
        opened.push_back(state);
        return std::make_unique<FakeDevice>(state);
    }
    FakeDeviceState& last() { return *opened.back(); }
};

class MemoryProfileStore : public ProfileStore {
public:
    std::vector<FlightProfile> profiles;
    int saves = 0;

    FlightProfile get_or_create_profile(uint16_t vendor_id, uint16_t product_id, const std::string& name) override {
        const std::string vid_pid = make_vid_pid(vendor_id, product_id);
        for (const auto& p : profiles) if (p.vid_pid == vid_pid && !p.game_id) return p;
        profiles.push_back(default_profile_for(vendor_id, product_id, name));
        return profiles.back();
    }
    std::optional<FlightProfile> find(const std::string& vid_pid, const std::optional<std::string>& game_id) const override {
        std::optional<FlightProfile> device_wide;
        for (const auto& p : profiles) {
            if (p.vid_pid != vid_pid) continue;
            if (game_id && p.game_id == game_id) return p;
            if (!p.game_id) device_wide = p;
        }
        return device_wide;
    }
    bool save(const FlightProfile& profile) override {
        ++saves;
        for (auto& p : profiles) {
            if (p.vid_pid == profile.vid_pid && p.game_id == profile.game_id) { p = profile; return true; }
        }
        profiles.push_back(profile);
        return true;
    }
    std::optional<FlightProfile> reset(const std::string& vid_pid) override {
        uint16_t vid, pid;
        if (!parse_vid_pid(vid_pid, vid, pid)) return std::nullopt;
        for (auto& p : profiles) {
            if (p.vid_pid == vid_pid && !p.game_id) { p = default_profile_for(vid, pid, p.name); return p; }
        }
        return std::nullopt;
    }
    bool remove(const std::string& vid_pid, const std::optional<std::string>& game_id) override {
        auto it = std::find_if(profiles.begin(), profiles.end(),
                               [&](const FlightProfile& p){ return p.vid_pid == vid_pid && p.game_id == game_id; });
        if (it == profiles.end()) return false;
        profiles.erase(it);
        return true;
    }
    std::vector<FlightProfile> list_all() const override { return profiles; }
};

struct RecordingSink : FlightSink {
    std::vector<FlightControlsState> states;
    std::vector<GamepadState> pads;
    std::vector<DeviceInfo> detected;
    std::function<void(const FlightControlsState&)> on_state;

    void on_state_update(const FlightControlsState& s) override {
        states.push_back(s);
        if (on_state) on_state(s);
    }
    void on_gamepad_update(const GamepadState& g) override { pads.push_back(g); }
    void on_device_detected(const DeviceInfo& d) override { detected.push_back(d); }

    size_t disconnects() const {
        return std::count_if(states.begin(), states.end(), [](const FlightControlsState& s){ return !s.connected; });
    }
};

static DeviceInfo device(const std::string& path, uint16_t vid, uint16_t pid, const std::string& product,
                         uint16_t usage_page = 0x01, uint16_t usage = 0x04) {
    DeviceInfo d;
    d.path = path;
    d.vendor_id = vid;
    d.product_id = pid;
    d.product = product;
    d.usage_page = usage_page;
    d.usage = usage;
    return d;
}

// Members are torn down bottom-up; the lifecycle goes first
struct Rig {
    EventLoop loop;
    FakeBackend backend;
    MemoryProfileStore store;
    RecordingSink sink;
    CaptureLifecycle lifecycle;

    explicit Rig(CaptureOptions options = {}) : lifecycle(backend, store, loop, options) {
        lifecycle.set_sink(&sink);
        backend.devices.push_back(device("/dev/hidraw0", 0x044F, 0xB10A, "T.16000M"));
        backend.devices.push_back(device("/dev/hidraw1", 0x1234, 0x5678, "Generic Pedals"));
    }
};

// T.16000M report: stick centered, no buttons, hat released, twist centered, throttle at 0
static std::vector<uint8_t> t16_report(uint8_t buttons_lo = 0x00) {
    return {buttons_lo, 0x00, 0x0F, 0x00, 0x20, 0x00, 0x20, 0x80, 0x00};
}

// ---- tests ----

TEST(DisabledRefusesCapture) {
    CaptureOptions o;
    o.enabled = false;
    Rig rig(o);
    ASSERT_FALSE(rig.lifecycle.start_capture("/dev/hidraw0"));
    ASSERT_EQ(rig.backend.open_calls, 0);
    ASSERT_TRUE(rig.sink.states.empty());
}

TEST(UnknownPathIsNotFound) {
    Rig rig;
    ASSERT_FALSE(rig.lifecycle.start_capture("/dev/hidraw9"));
    ASSERT_EQ(rig.backend.open_calls, 0);
    ASSERT_FALSE(rig.lifecycle.is_capturing());
}

TEST(OpenFailureReturnsFalse) {
    Rig rig;
    rig.backend.fail_open = true;
    ASSERT_FALSE(rig.lifecycle.start_capture("/dev/hidraw0"));
    ASSERT_EQ(rig.backend.open_calls, 1);
    ASSERT_FALSE(rig.lifecycle.is_capturing());
    ASSERT_TRUE(rig.sink.states.empty());
}

TEST(EnumerationFailureIsContained) {
    Rig rig;
    rig.backend.fail_enumerate = true;
    ASSERT_TRUE(rig.lifecycle.get_devices().empty());
    ASSERT_FALSE(rig.lifecycle.start_capture("/dev/hidraw0"));
}

TEST(GetDevicesFiltersJoysticks) {
    Rig rig;
    rig.backend.devices.push_back(device("/dev/hidraw2", 0x046D, 0xC077, "Mouse", 0x01, 0x02));
    rig.backend.devices.push_back(device("/dev/hidraw3", 0x046D, 0xC31C, "Keyboard media", 0x0C, 0x01));
    rig.backend.devices.push_back(device("/dev/hidraw4", 0x045E, 0x028E, "", 0x01, 0x05));
    auto list = rig.lifecycle.get_devices();
    ASSERT_EQ(list.size(), 3u);
    ASSERT_EQ(list[0].path, "/dev/hidraw0");
    ASSERT_EQ(list[2].path, "/dev/hidraw4");
    ASSERT_EQ(list[2].product, "Unknown Device");
}

TEST(KnownDeviceIsDecodedAndMapped) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    ASSERT_TRUE(rig.lifecycle.is_capturing());
    ASSERT_TRUE(rig.lifecycle.active_layout().has_value());
    ASSERT_EQ(rig.sink.states.size(), 1u);
    ASSERT_TRUE(rig.sink.states[0].connected);
    ASSERT_EQ(rig.sink.states[0].device_name, "T.16000M");
    ASSERT_TRUE(rig.sink.states[0].raw_bytes.empty());
    ASSERT_EQ(rig.store.profiles.size(), 1u);

    rig.backend.last().push(t16_report());
    ASSERT_EQ(rig.sink.states.size(), 2u);
    const FlightControlsState& live = rig.sink.states[1];
    ASSERT_EQ(live.axes.size(), 4u);
    ASSERT_EQ(live.buttons.size(), 16u);
    ASSERT_EQ(live.hat_switch, -1);
    ASSERT_TRUE(live.raw_bytes == t16_report());
    ASSERT_TRUE(rig.lifecycle.last_raw_bytes() == t16_report());

    ASSERT_EQ(rig.sink.pads.size(), 1u);
    const GamepadState& g = rig.sink.pads[0];
    ASSERT_TRUE(g.connected);
    ASSERT_EQ(g.left_stick_x, 0);
    ASSERT_EQ(g.left_stick_y, 0);
    ASSERT_EQ(g.right_stick_x, 0);
    ASSERT_EQ(g.right_trigger, 255);   // throttle axis is inverted
    ASSERT_EQ(g.buttons, 0);
}

TEST(UnchangedReportsAreSuppressed) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.backend.last().push(t16_report());
    rig.backend.last().push(t16_report());
    rig.backend.last().push(t16_report());
    ASSERT_EQ(rig.sink.states.size(), 4u);
    ASSERT_EQ(rig.sink.pads.size(), 1u);

    rig.backend.last().push(t16_report(0x01));
    ASSERT_EQ(rig.sink.pads.size(), 2u);
    ASSERT_EQ(rig.sink.pads[1].buttons, GamepadButton::A);
}

TEST(UnknownDeviceUsesRawPassThrough) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw1"));
    ASSERT_FALSE(rig.lifecycle.active_layout().has_value());
    std::vector<uint8_t> report = {0x01, 0x02, 0x03};
    rig.backend.last().push(report);
    ASSERT_EQ(rig.sink.states.size(), 2u);
    ASSERT_TRUE(rig.sink.states[1].raw_bytes == report);
    ASSERT_TRUE(rig.sink.states[1].axes.empty());
    ASSERT_EQ(rig.sink.states[1].hat_switch, -1);
    ASSERT_TRUE(rig.sink.pads.empty());
}

TEST(StoredLayoutEnablesMapping) {
    Rig rig;
    FlightProfile p = default_profile_for(0x1234, 0x5678, "Generic Pedals");
    ReportLayout l;
    l.axes.push_back({0, 1, true, true, 0, 255});
    p.report_layout = l;
    rig.store.profiles.push_back(p);

    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw1"));
    ASSERT_TRUE(rig.lifecycle.active_layout().has_value());
    rig.backend.last().push({0xFF});
    ASSERT_EQ(rig.sink.pads.size(), 1u);
    ASSERT_EQ(rig.sink.pads[0].left_stick_x, 32767);
}

TEST(StopIsIdempotent) {
    CaptureOptions o;
    o.controller_slot = 2;
    Rig rig(o);
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    FakeDeviceState& dev = rig.backend.last();
    rig.lifecycle.stop_capture();
    ASSERT_FALSE(rig.lifecycle.is_capturing());
    ASSERT_EQ(dev.close_calls, 1);
    ASSERT_EQ(rig.sink.disconnects(), 1u);
    ASSERT_EQ(rig.sink.pads.size(), 1u);
    ASSERT_FALSE(rig.sink.pads[0].connected);
    ASSERT_EQ(rig.sink.pads[0].controller_id, 2);
    ASSERT_FALSE(rig.lifecycle.active_profile().has_value());
    ASSERT_TRUE(rig.lifecycle.last_raw_bytes().empty());

    rig.lifecycle.stop_capture();
    ASSERT_EQ(dev.close_calls, 1);
    ASSERT_EQ(rig.sink.disconnects(), 1u);
    ASSERT_EQ(rig.sink.pads.size(), 1u);

    // Device object is released on the next loop turn
    ASSERT_TRUE(dev.alive);
    rig.loop.poll();
    ASSERT_FALSE(dev.alive);
}

TEST(StopWithoutCaptureEmitsNothing) {
    Rig rig;
    rig.lifecycle.stop_capture();
    ASSERT_TRUE(rig.sink.states.empty());
    ASSERT_TRUE(rig.sink.pads.empty());
}

TEST(DeviceErrorStopsCapture) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.backend.last().fail("device unplugged");
    ASSERT_FALSE(rig.lifecycle.is_capturing());
    ASSERT_EQ(rig.sink.disconnects(), 1u);
    ASSERT_FALSE(rig.sink.states.back().connected);
    ASSERT_EQ(rig.backend.last().close_calls, 1);
    rig.loop.poll();
}

TEST(StopFromInsideStateCallback) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.sink.on_state = [&](const FlightControlsState& s) {
        if (!s.raw_bytes.empty()) rig.lifecycle.stop_capture();
    };
    rig.backend.last().push(t16_report());
    ASSERT_FALSE(rig.lifecycle.is_capturing());
    ASSERT_EQ(rig.sink.disconnects(), 1u);
    // Only the neutral disconnect pad; the report was not mapped after the stop
    ASSERT_EQ(rig.sink.pads.size(), 1u);
    ASSERT_FALSE(rig.sink.pads[0].connected);
    rig.loop.poll();
}

TEST(StopDuringStopIsIgnored) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    int nested = 0;
    rig.sink.on_state = [&](const FlightControlsState& s) {
        if (!s.connected) { ++nested; rig.lifecycle.stop_capture(); }
    };
    rig.lifecycle.stop_capture();
    ASSERT_EQ(nested, 1);
    ASSERT_EQ(rig.sink.disconnects(), 1u);
}

TEST(RestartFromDisconnectCallback) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    int restarts = 0;
    bool restarted = false;
    rig.sink.on_state = [&](const FlightControlsState& s) {
        if (!s.connected && restarts == 0) {
            ++restarts;
            restarted = rig.lifecycle.start_capture("/dev/hidraw0");
        }
    };
    rig.backend.last().fail("device reset");
    ASSERT_TRUE(restarted);
    ASSERT_EQ(rig.backend.open_calls, 2);
    ASSERT_TRUE(rig.lifecycle.is_capturing());
    ASSERT_TRUE(rig.lifecycle.active_profile().has_value());
    ASSERT_TRUE(rig.lifecycle.active_layout().has_value());

    rig.backend.last().push(t16_report());
    ASSERT_TRUE(rig.sink.pads.back().connected);
    ASSERT_EQ(rig.sink.pads.back().right_trigger, 255);
    ASSERT_EQ(rig.sink.states.back().axes.size(), 4u);

    rig.lifecycle.stop_capture();
    ASSERT_EQ(rig.sink.disconnects(), 2u);
    ASSERT_FALSE(rig.sink.states.back().connected);
    rig.loop.poll();
}

TEST(DestructorDoesNotEmit) {
    EventLoop loop;
    FakeBackend backend;
    backend.devices.push_back(device("/dev/hidraw0", 0x044F, 0xB10A, "T.16000M"));
    MemoryProfileStore store;
    RecordingSink sink;
    {
        CaptureLifecycle lifecycle(backend, store, loop);
        lifecycle.set_sink(&sink);
        ASSERT_TRUE(lifecycle.start_capture("/dev/hidraw0"));
    }
    ASSERT_EQ(sink.states.size(), 1u);
    ASSERT_EQ(sink.disconnects(), 0u);
    ASSERT_EQ(backend.last().close_calls, 1);
    loop.poll();
    ASSERT_FALSE(backend.last().alive);
}

TEST(StartReplacesPreviousCapture) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    FakeDeviceState& first = rig.backend.last();
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw1"));
    ASSERT_EQ(first.close_calls, 1);
    ASSERT_EQ(rig.sink.states.size(), 3u);
    ASSERT_TRUE(rig.sink.states[0].connected);
    ASSERT_FALSE(rig.sink.states[1].connected);
    ASSERT_EQ(rig.sink.states[1].device_name, "T.16000M");
    ASSERT_TRUE(rig.sink.states[2].connected);
    ASSERT_EQ(rig.lifecycle.device_name(), "Generic Pedals");
}

TEST(HotplugOnlyDetects) {
    Rig rig;
    rig.lifecycle.initialize();
    ASSERT_TRUE(rig.lifecycle.hotplug_active());
    rig.loop.poll(EventLoop::Clock::now() + 10s);
    ASSERT_EQ(rig.sink.detected.size(), 1u);
    ASSERT_EQ(rig.sink.detected[0].path, "/dev/hidraw0");
    ASSERT_EQ(rig.backend.open_calls, 0);
    ASSERT_FALSE(rig.lifecycle.is_capturing());

    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.loop.poll(EventLoop::Clock::now() + 20s);
    ASSERT_EQ(rig.sink.detected.size(), 1u);
    ASSERT_EQ(rig.backend.open_calls, 1);
}

TEST(HotplugIgnoresNonJoysticks) {
    Rig rig;
    rig.backend.devices.clear();
    rig.backend.devices.push_back(device("/dev/hidraw5", 0x046D, 0xC077, "Mouse", 0x01, 0x02));
    rig.lifecycle.initialize();
    rig.loop.poll(EventLoop::Clock::now() + 10s);
    ASSERT_TRUE(rig.sink.detected.empty());
}

TEST(DisposePreventsCapture) {
    Rig rig;
    rig.lifecycle.initialize();
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.lifecycle.dispose();
    ASSERT_TRUE(rig.lifecycle.disposed());
    ASSERT_FALSE(rig.lifecycle.is_capturing());
    ASSERT_FALSE(rig.lifecycle.hotplug_active());
    ASSERT_FALSE(rig.lifecycle.start_capture("/dev/hidraw0"));
    ASSERT_EQ(rig.backend.open_calls, 1);

    rig.lifecycle.initialize();
    ASSERT_FALSE(rig.lifecycle.hotplug_active());
    rig.lifecycle.dispose();
    ASSERT_EQ(rig.sink.disconnects(), 1u);
}

TEST(UpdateConfigTogglesCapture) {
    Rig rig;
    rig.lifecycle.initialize();
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.lifecycle.update_config(false, 2);
    ASSERT_FALSE(rig.lifecycle.enabled());
    ASSERT_FALSE(rig.lifecycle.is_capturing());
    ASSERT_FALSE(rig.lifecycle.hotplug_active());
    ASSERT_EQ(rig.sink.pads.back().controller_id, 2);
    ASSERT_FALSE(rig.lifecycle.start_capture("/dev/hidraw0"));

    rig.lifecycle.update_config(true, 9);
    ASSERT_TRUE(rig.lifecycle.hotplug_active());
    ASSERT_EQ(rig.lifecycle.controller_slot(), 3);
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
}

TEST(SlotChangeAppliesToNextReport) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.backend.last().push(t16_report());
    rig.lifecycle.update_config(true, 1);
    ASSERT_TRUE(rig.lifecycle.is_capturing());
    rig.backend.last().push(t16_report(0x02));
    ASSERT_EQ(rig.sink.pads.back().controller_id, 1);
}

TEST(ApplyProfileSwapsMappings) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.backend.last().push(t16_report());
    ASSERT_EQ(rig.sink.pads.back().right_trigger, 255);

    FlightProfile p = *rig.lifecycle.active_profile();
    p.axis_mappings[3].inverted = false;
    ASSERT_TRUE(rig.lifecycle.apply_profile(p));
    ASSERT_EQ(rig.store.saves, 1);
    ASSERT_TRUE(rig.lifecycle.active_layout().has_value());
    ASSERT_TRUE(rig.lifecycle.active_profile()->report_layout.has_value());

    rig.backend.last().push(t16_report());
    ASSERT_EQ(rig.sink.pads.size(), 2u);
    ASSERT_EQ(rig.sink.pads.back().right_trigger, 0);
    ASSERT_FALSE(rig.store.profiles[0].axis_mappings[3].inverted);
}

TEST(ApplyProfileForOtherDeviceOnlySaves) {
    Rig rig;
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    FlightProfile other = default_profile_for(0x1234, 0x5678, "Pedals");
    ASSERT_TRUE(rig.lifecycle.apply_profile(other));
    ASSERT_EQ(rig.lifecycle.active_profile()->vid_pid, "044F:B10A");
    ASSERT_EQ(rig.store.profiles.size(), 2u);
}

TEST(ControllerSlotOptionIsClamped) {
    CaptureOptions o;
    o.controller_slot = 8;
    Rig rig(o);
    ASSERT_EQ(rig.lifecycle.controller_slot(), 3);
    ASSERT_TRUE(rig.lifecycle.start_capture("/dev/hidraw0"));
    rig.backend.last().push(t16_report());
    ASSERT_EQ(rig.sink.pads[0].controller_id, 3);
}

int main() {
    std::cout << "Running Capture Lifecycle Tests\n";
    std::cout << "===============================\n\n";

    try {
        RUN_TEST(DisabledRefusesCapture);
        RUN_TEST(UnknownPathIsNotFound);
        RUN_TEST(OpenFailureReturnsFalse);
        RUN_TEST(EnumerationFailureIsContained);
        RUN_TEST(GetDevicesFiltersJoysticks);
        RUN_TEST(KnownDeviceIsDecodedAndMapped);
        RUN_TEST(UnchangedReportsAreSuppressed);
        RUN_TEST(UnknownDeviceUsesRawPassThrough);
        RUN_TEST(StoredLayoutEnablesMapping);
        RUN_TEST(StopIsIdempotent);
        RUN_TEST(StopWithoutCaptureEmitsNothing);
        RUN_TEST(DeviceErrorStopsCapture);
        RUN_TEST(StopFromInsideStateCallback);
        RUN_TEST(StopDuringStopIsIgnored);
        RUN_TEST(RestartFromDisconnectCallback);
        RUN_TEST(DestructorDoesNotEmit);
        RUN_TEST(StartReplacesPreviousCapture);
        RUN_TEST(HotplugOnlyDetects);
        RUN_TEST(HotplugIgnoresNonJoysticks);
        RUN_TEST(DisposePreventsCapture);
        RUN_TEST(UpdateConfigTogglesCapture);
        RUN_TEST(SlotChangeAppliesToNextReport);
        RUN_TEST(ApplyProfileSwapsMappings);
        RUN_TEST(ApplyProfileForOtherDeviceOnlySaves);
        RUN_TEST(ControllerSlotOptionIsClamped);

        std::cout << "\nAll tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}
