#include "device_defaults.hpp"
#include "gamepad_state.hpp"
#include <cstdio>

static AxisMapping axis(uint32_t src, AxisTarget target, bool inverted, double deadzone = 0.05) {
    AxisMapping m;
    m.source_index = src; m.target = target; m.inverted = inverted;
    m.deadzone = deadzone; m.sensitivity = 1.0; m.curve = ResponseCurve::Linear;
    return m;
}

static std::vector<ButtonMapping> face_buttons(uint32_t count) {
    static const uint16_t order[] = {
        GamepadButton::A, GamepadButton::B, GamepadButton::X, GamepadButton::Y,
        GamepadButton::LeftShoulder, GamepadButton::RightShoulder,
        GamepadButton::Back, GamepadButton::Start,
        GamepadButton::LeftThumb, GamepadButton::RightThumb
    };
    std::vector<ButtonMapping> out;
    for (uint32_t i = 0; i < count && i < sizeof(order) / sizeof(order[0]); ++i) out.push_back({i, order[i]});
    return out;
}

// Thrustmaster T.16000M: 16 buttons, hat nibble (15 = released), 14-bit X/Y,
// 8-bit twist and throttle slider. No report id.
static ReportLayout t16000m_layout() {
    ReportLayout l;
    l.skip_report_id = false;
    l.axes = {
        {3, 2, true, true, 0, 16383},   // X
        {5, 2, true, true, 0, 16383},   // Y
        {7, 1, true, true, 0, 255},     // twist (Rz)
        {8, 1, true, true, 0, 255},     // throttle slider
    };
    for (uint8_t i = 0; i < 16; ++i) l.buttons.push_back({static_cast<uint32_t>(i / 8), static_cast<uint8_t>(i % 8)});
    l.hat = HatField{2, 0, 4, 15};
    return l;
}

// X56 stick interface 0. Absolute bit positions in the captured report:
// report id first, JOY_X @ bit 8, JOY_Y @ bit 24, POV nibble
// @ bit 52, trigger/A/B/C/D/E @ bits 56..61, compact stick @ bits 80 and 88.
static ReportLayout x56_stick_layout() {
    ReportLayout l;
    l.skip_report_id = true;
    l.axes = {
        {0, 2, true, true, 0, 65535},   // JOY_X
        {2, 2, true, true, 0, 65535},   // JOY_Y
        {9, 1, true, true, 0, 255},     // C_JOY_X
        {10, 1, true, true, 0, 255},    // C_JOY_Y
    };
    for (uint8_t bit = 0; bit < 6; ++bit) l.buttons.push_back({6, bit});
    l.hat = HatField{5, 4, 4, 15};
    return l;
}

const std::vector<DeviceDefault>& device_defaults() {
    static const std::vector<DeviceDefault> table = {
        {0x044F, 0xB10A, "Thrustmaster T.16000M", t16000m_layout(),
         {axis(0, AxisTarget::LeftStickX, false), axis(1, AxisTarget::LeftStickY, true),
          axis(2, AxisTarget::RightStickX, false, 0.08), axis(3, AxisTarget::RightTrigger, true, 0.0)},
         face_buttons(10)},
        {0x0738, 0x2221, "Saitek X56 H.O.T.A.S. Stick", x56_stick_layout(),
         {axis(0, AxisTarget::LeftStickX, false), axis(1, AxisTarget::LeftStickY, true),
          axis(2, AxisTarget::RightStickX, false), axis(3, AxisTarget::RightStickY, true)},
         // trigger, A, B, C, D, E
         {{0, GamepadButton::RightShoulder}, {1, GamepadButton::A}, {2, GamepadButton::B},
          {3, GamepadButton::LeftShoulder}, {4, GamepadButton::X}, {5, GamepadButton::Y}}},
        // Throttle report layout not mapped yet; captured in raw mode for calibration
        {0x0738, 0xA221, "Saitek X56 H.O.T.A.S. Throttle", std::nullopt, {}, {}},
    };
    return table;
}

const DeviceDefault* find_device_default(uint16_t vendor_id, uint16_t product_id) {
    for (const auto& d : device_defaults())
        if (d.vendor_id == vendor_id && d.product_id == product_id) return &d;
    return nullptr;
}

std::string make_vid_pid(uint16_t vendor_id, uint16_t product_id) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04X:%04X", static_cast<unsigned>(vendor_id), static_cast<unsigned>(product_id));
    return buf;
}

bool parse_vid_pid(const std::string& vid_pid, uint16_t& vendor_id, uint16_t& product_id) {
    if (vid_pid.size() != 9 || vid_pid[4] != ':') return false;
    auto hex4 = [](const std::string& s, uint16_t& out) -> bool {
        unsigned v = 0;
        for (char c : s) {
            int d;
            if (c >= '0' && c <= '9') d = c - '0';
            else if (c >= 'a' && c <= 'f') d = 10 + (c - 'a');
            else if (c >= 'A' && c <= 'F') d = 10 + (c - 'A');
            else return false;
            v = (v << 4) | static_cast<unsigned>(d);
        }
        out = static_cast<uint16_t>(v);
        return true;
    };
    uint16_t vid = 0, pid = 0;
    if (!hex4(vid_pid.substr(0, 4), vid) || !hex4(vid_pid.substr(5, 4), pid)) return false;
    vendor_id = vid; product_id = pid;
    return true;
}

std::optional<std::string> normalize_vid_pid(const std::string& vid_pid) {
    uint16_t vid = 0, pid = 0;
    if (!parse_vid_pid(vid_pid, vid, pid)) return std::nullopt;
    return make_vid_pid(vid, pid);
}

FlightProfile default_profile_for(uint16_t vendor_id, uint16_t product_id, const std::string& name) {
    FlightProfile p;
    p.vid_pid = make_vid_pid(vendor_id, product_id);
    p.name = name;

    const DeviceDefault* known = find_device_default(vendor_id, product_id);
    if (known && !known->axis_mappings.empty()) {
        if (p.name.empty()) p.name = known->name;
        p.axis_mappings = known->axis_mappings;
        p.button_mappings = known->button_mappings;
        return p;
    }
    if (p.name.empty()) p.name = known ? known->name : "Unknown Device";
    p.axis_mappings = {
        axis(0, AxisTarget::LeftStickX, false),
        axis(1, AxisTarget::LeftStickY, true),
        axis(2, AxisTarget::RightStickX, false),
        axis(3, AxisTarget::RightTrigger, false, 0.0),
    };
    p.button_mappings = face_buttons(10);
    return p;
}
