#include "capture_lifecycle.hpp"
#include "device_defaults.hpp"
#include "mapping_engine.hpp"
#include "core/log.hpp"
#include "hid/report_parser.hpp"
#include <algorithm>
#include <exception>
#include <sstream>

static int clamp_slot(int slot) { return std::clamp(slot, 0, 3); }

CaptureLifecycle::CaptureLifecycle(HidBackend& backend, ProfileStore& profiles, EventLoop& loop, CaptureOptions options)
    : _backend(backend), _profiles(profiles), _loop(loop),
      _enabled(options.enabled), _controller_slot(clamp_slot(options.controller_slot)),
      _hotplug_interval(options.hotplug_interval) {}

CaptureLifecycle::~CaptureLifecycle() {
    // The sink may already be gone
    _sink = nullptr;
    dispose();
}

void CaptureLifecycle::initialize() {
    if (_enabled && !_disposed) start_hotplug_scan();
    std::ostringstream ss;
    ss << "Service initialized (enabled=" << (_enabled ? "true" : "false") << ", slot=" << _controller_slot << ")";
    log_info(ss.str());
}

void CaptureLifecycle::update_config(bool enabled, int controller_slot) {
    const bool was_enabled = _enabled;
    _enabled = enabled;
    _controller_slot = clamp_slot(controller_slot);

    if (!enabled && was_enabled) {
        stop_capture();
        stop_hotplug_scan();
    }
    if (enabled && !was_enabled && !_disposed) start_hotplug_scan();
}

std::vector<DeviceInfo> CaptureLifecycle::get_devices() {
    std::vector<DeviceInfo> all;
    try {
        all = _backend.enumerate();
    } catch (const std::exception& e) {
        log_warn(std::string("Failed to enumerate HID devices: ") + e.what());
        return {};
    }
    std::vector<DeviceInfo> out;
    for (auto& d : all) {
        if (d.usage_page != JoystickUsagePage) continue;
        if (d.usage != JoystickUsage && d.usage != GamepadUsage) continue;
        if (d.path.empty()) continue;
        if (d.product.empty()) d.product = "Unknown Device";
        out.push_back(std::move(d));
    }
    return out;
}

bool CaptureLifecycle::start_capture(const std::string& device_path) {
    if (!_enabled) {
        log_info("Cannot start capture: flight controls disabled");
        return false;
    }
    if (_disposed) {
        log_info("Cannot start capture: service disposed");
        return false;
    }

    stop_capture();

    std::vector<DeviceInfo> all;
    try {
        all = _backend.enumerate();
    } catch (const std::exception& e) {
        log_warn(std::string("Failed to enumerate HID devices: ") + e.what());
        return false;
    }
    auto info = std::find_if(all.begin(), all.end(), [&](const DeviceInfo& d){ return d.path == device_path; });
    if (info == all.end()) {
        log_warn("Device not found: " + device_path);
        return false;
    }

    std::unique_ptr<HidDevice> device;
    try {
        device = _backend.open(device_path);
    } catch (const std::exception& e) {
        log_warn(std::string("Failed to open device: ") + e.what());
        return false;
    }
    if (!device) {
        log_warn("Failed to open device: " + device_path);
        return false;
    }

    const uint16_t vid = info->vendor_id;
    const uint16_t pid = info->product_id;
    const std::string name = info->product.empty() ? std::string("Unknown Device") : info->product;
    const std::string vid_pid = make_vid_pid(vid, pid);
    const DeviceDefault* known = find_device_default(vid, pid);

    FlightProfile profile;
    try {
        profile = _profiles.get_or_create_profile(vid, pid, name);
    } catch (const std::exception& e) {
        log_warn("Failed to resolve profile for " + vid_pid + ": " + e.what());
        try { device->close(); }
        catch (const std::exception& ce) { log_warn(std::string("Ignoring close error: ") + ce.what()); }
        return false;
    }

    _device_name = name;
    _device_path = device_path;
    _profile = std::move(profile);
    if (_profile->report_layout) _layout = _profile->report_layout;
    else if (known && known->layout) _layout = known->layout;
    else _layout.reset();
    _last_gamepad.reset();
    _last_raw_bytes.clear();

    if (!_layout) log_warn("No report layout for " + vid_pid + ", using raw pass-through mode");
    log_info("Opened device: " + _device_name + " (" + vid_pid + ") at " + device_path);
    if (known) log_info("Known device: " + known->name);

    const uint64_t session = ++_session;
    _device = std::move(device);
    _device->set_handlers(
        [this, session](const std::vector<uint8_t>& data) { on_report(session, data); },
        [this, session](const std::string& message) { on_device_error(session, message); });

    send_connected_state(true, _device_name);
    return true;
}

void CaptureLifecycle::stop_capture() {
    if (_stopping) return;
    _stopping = true;

    // Unbind the session before anything reaches the sink, which may start a new capture
    std::shared_ptr<HidDevice> device(std::move(_device));
    const bool was_bound = !_device_path.empty();
    const std::string name = _device_name;
    ++_session;
    _device_path.clear();
    _last_gamepad.reset();
    _last_raw_bytes.clear();
    _profile.reset();
    _layout.reset();

    if (device) {
        try {
            device->close();
        } catch (const std::exception& e) {
            log_warn(std::string("Ignoring close error: ") + e.what());
        }
        // We may be running inside one of this device's callbacks; release it on the next loop turn
        _loop.post([device]() {});
    }
    _stopping = false;

    if (was_bound) {
        log_info("Device capture stopped");
        send_connected_state(false, name);
    }
}

void CaptureLifecycle::dispose() {
    _disposed = true;
    stop_capture();
    stop_hotplug_scan();
}

bool CaptureLifecycle::apply_profile(const FlightProfile& profile) {
    bool saved = false;
    try {
        saved = _profiles.save(profile);
    } catch (const std::exception& e) {
        log_warn("Failed to save profile " + profile.vid_pid + ": " + e.what());
    }
    if (_device && _profile && _profile->vid_pid == profile.vid_pid && _profile->game_id == profile.game_id) {
        _profile = profile;
        _profile->report_layout = _layout;
        _last_gamepad.reset();
        log_info("Active profile updated: " + profile.name);
    }
    return saved;
}

void CaptureLifecycle::on_report(uint64_t session, const std::vector<uint8_t>& data) {
    if (session != _session || !_device) return;

    if (!_layout || !_profile) {
        _last_raw_bytes = data;
        FlightControlsState raw;
        raw.connected = true;
        raw.device_name = _device_name;
        raw.hat_switch = -1;
        raw.raw_bytes = data;
        emit_state(raw);
        return;
    }

    ParsedReport parsed = decode_report(data, *_layout);
    _last_raw_bytes = data;

    FlightControlsState live;
    live.connected = true;
    live.device_name = _device_name;
    live.axes = parsed.axes;
    live.buttons = parsed.buttons;
    live.hat_switch = parsed.hat_switch;
    live.raw_bytes = data;
    emit_state(live);

    // The sink may have stopped or restarted capture from inside the callback
    if (session != _session || !_device || !_profile) return;

    GamepadState gp = map_to_gamepad(parsed, *_profile, _controller_slot);
    if (gamepad_state_changed(_last_gamepad, gp)) {
        _last_gamepad = gp;
        if (verbose_logging()) {
            std::ostringstream ss;
            ss << "Gamepad: LX=" << gp.left_stick_x << " LY=" << gp.left_stick_y
               << " RX=" << gp.right_stick_x << " RY=" << gp.right_stick_y
               << " LT=" << (int)gp.left_trigger << " RT=" << (int)gp.right_trigger
               << " buttons=0x" << std::hex << gp.buttons << std::dec;
            log_verbose(ss.str());
        }
        emit_gamepad(gp);
    }
}

void CaptureLifecycle::on_device_error(uint64_t session, const std::string& message) {
    if (session != _session || !_device) return;
    log_warn("HID device error: " + message);
    log_info("Device disconnected");
    stop_capture();
}

void CaptureLifecycle::start_hotplug_scan() {
    stop_hotplug_scan();
    _hotplug_timer = _loop.add_periodic(_hotplug_interval, [this]() { hotplug_tick(); });
}

void CaptureLifecycle::stop_hotplug_scan() {
    if (!_hotplug_timer) return;
    _loop.cancel(*_hotplug_timer);
    _hotplug_timer.reset();
}

// Detection only: opening a device always takes an explicit start_capture()
void CaptureLifecycle::hotplug_tick() {
    if (_disposed || !_enabled) return;
    if (_device) return;

    std::vector<DeviceInfo> devices = get_devices();
    if (devices.empty() || _device) return;

    const DeviceInfo& first = devices.front();
    const DeviceDefault* known = find_device_default(first.vendor_id, first.product_id);
    log_info("Auto-detected device: " + (known ? known->name : first.product) +
             " (" + make_vid_pid(first.vendor_id, first.product_id) + ")");
    if (_sink) _sink->on_device_detected(first);
}

void CaptureLifecycle::send_connected_state(bool connected, const std::string& name) {
    FlightControlsState state;
    state.connected = connected;
    state.device_name = name;
    state.hat_switch = -1;
    emit_state(state);

    if (!connected) {
        GamepadState neutral{};
        neutral.controller_id = _controller_slot;
        neutral.connected = false;
        emit_gamepad(neutral);
    }
}

void CaptureLifecycle::emit_state(const FlightControlsState& state) {
    if (_sink) _sink->on_state_update(state);
}

void CaptureLifecycle::emit_gamepad(const GamepadState& state) {
    if (_sink) _sink->on_gamepad_update(state);
}
