#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "hid/report_layout.hpp"

enum class AxisTarget : uint8_t {
    LeftStickX, LeftStickY, RightStickX, RightStickY,
    LeftTrigger, RightTrigger
};

enum class ResponseCurve : uint8_t { Linear, Expo };

constexpr double MinDeadzone = 0.0;
constexpr double MaxDeadzone = 0.5;
constexpr double MinSensitivity = 0.1;
constexpr double MaxSensitivity = 3.0;

struct AxisMapping {
    uint32_t source_index = 0;
    AxisTarget target = AxisTarget::LeftStickX;
    bool inverted = false;
    double deadzone = 0.05;      // MinDeadzone..MaxDeadzone
    double sensitivity = 1.0;    // MinSensitivity..MaxSensitivity
    ResponseCurve curve = ResponseCurve::Linear;
};

struct ButtonMapping {
    uint32_t source_index = 0;
    uint16_t target_button = 0;  // GamepadButton bits
};

// One profile per device identity ("VVVV:PPPP"), optionally narrowed to a game.
struct FlightProfile {
    std::string vid_pid;
    std::optional<std::string> game_id;
    std::string name;
    std::optional<ReportLayout> report_layout;
    std::vector<AxisMapping> axis_mappings;
    std::vector<ButtonMapping> button_mappings;
};

inline bool is_trigger(AxisTarget t) {
    return t == AxisTarget::LeftTrigger || t == AxisTarget::RightTrigger;
}

// Wire names used by the profile file and the console tool
const char* axis_target_name(AxisTarget t);
std::optional<AxisTarget> parse_axis_target(const std::string& s);
const char* response_curve_name(ResponseCurve c);
std::optional<ResponseCurve> parse_response_curve(const std::string& s);
