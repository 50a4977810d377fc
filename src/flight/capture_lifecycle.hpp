#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/event_loop.hpp"
#include "hid/hid_backend.hpp"
#include "hid/report_layout.hpp"
#include "flight_profile.hpp"
#include "gamepad_state.hpp"
#include "profile_store.hpp"

// Consumer of the two push streams. Called on the event-loop thread.
struct FlightSink {
    virtual ~FlightSink() = default;
    // Every raw report plus connect/disconnect transitions
    virtual void on_state_update(const FlightControlsState& state) = 0;
    // Mapped controller state, only when it changed (and once on disconnect)
    virtual void on_gamepad_update(const GamepadState& state) = 0;
    // Hotplug scan found a device while idle (informational only)
    virtual void on_device_detected(const DeviceInfo&) {}
};

struct CaptureOptions {
    bool enabled = true;
    int controller_slot = 0;
    std::chrono::milliseconds hotplug_interval{3000};
};

// Owns the one captured device. Idle -> Capturing on start_capture(), back to
// Idle on stop_capture(), device error or dispose(). Everything here must be
// called on the event loop's thread; device callbacks are delivered there too.
class CaptureLifecycle {
public:
    static constexpr uint16_t JoystickUsagePage = 0x01;
    static constexpr uint16_t JoystickUsage = 0x04;
    static constexpr uint16_t GamepadUsage = 0x05;

    CaptureLifecycle(HidBackend& backend, ProfileStore& profiles, EventLoop& loop, CaptureOptions options = {});
    ~CaptureLifecycle();
    CaptureLifecycle(const CaptureLifecycle&) = delete;
    CaptureLifecycle& operator=(const CaptureLifecycle&) = delete;

    void set_sink(FlightSink* sink) { _sink = sink; }

    void initialize();
    void update_config(bool enabled, int controller_slot);

    // Joystick/gamepad interfaces only; empty on enumeration failure
    std::vector<DeviceInfo> get_devices();

    // False when disabled, disposed, the path is no longer present or the open
    // fails. Any previous capture is stopped first.
    bool start_capture(const std::string& device_path);
    void stop_capture();
    void dispose();

    // Saves through the store and, when it belongs to the captured device,
    // swaps in the new mappings. The report layout bound at start is kept.
    bool apply_profile(const FlightProfile& profile);

    bool is_capturing() const { return _device != nullptr; }
    bool enabled() const { return _enabled; }
    bool disposed() const { return _disposed; }
    bool hotplug_active() const { return _hotplug_timer.has_value(); }
    int controller_slot() const { return _controller_slot; }
    const std::optional<FlightProfile>& active_profile() const { return _profile; }
    const std::optional<ReportLayout>& active_layout() const { return _layout; }
    const std::string& device_name() const { return _device_name; }
    const std::vector<uint8_t>& last_raw_bytes() const { return _last_raw_bytes; }

private:
    void on_report(uint64_t session, const std::vector<uint8_t>& data);
    void on_device_error(uint64_t session, const std::string& message);
    void hotplug_tick();
    void start_hotplug_scan();
    void stop_hotplug_scan();
    void send_connected_state(bool connected, const std::string& name);
    void emit_state(const FlightControlsState& state);
    void emit_gamepad(const GamepadState& state);

    HidBackend& _backend;
    ProfileStore& _profiles;
    EventLoop& _loop;
    FlightSink* _sink = nullptr;

    bool _enabled;
    int _controller_slot;
    std::chrono::milliseconds _hotplug_interval;
    bool _disposed = false;
    bool _stopping = false;
    std::optional<EventLoop::TimerId> _hotplug_timer;

    // Session state, cleared on stop
    std::unique_ptr<HidDevice> _device;
    std::string _device_path;
    std::string _device_name;
    uint64_t _session = 0;   // bumps per start so stale callbacks are dropped
    std::optional<FlightProfile> _profile;
    std::optional<ReportLayout> _layout;
    std::optional<GamepadState> _last_gamepad;
    std::vector<uint8_t> _last_raw_bytes;
};
