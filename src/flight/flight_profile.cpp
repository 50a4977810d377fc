#include "flight_profile.hpp"
#include <array>

struct AxisTargetMeta { AxisTarget target; const char* name; };
static constexpr std::array<AxisTargetMeta, 6> AXIS_TARGET_META = {{
    {AxisTarget::LeftStickX, "leftStickX"}, {AxisTarget::LeftStickY, "leftStickY"},
    {AxisTarget::RightStickX, "rightStickX"}, {AxisTarget::RightStickY, "rightStickY"},
    {AxisTarget::LeftTrigger, "leftTrigger"}, {AxisTarget::RightTrigger, "rightTrigger"}
}};

const char* axis_target_name(AxisTarget t) {
    for (const auto& m : AXIS_TARGET_META) if (m.target == t) return m.name;
    return "leftStickX";
}

std::optional<AxisTarget> parse_axis_target(const std::string& s) {
    for (const auto& m : AXIS_TARGET_META) if (s == m.name) return m.target;
    return std::nullopt;
}

const char* response_curve_name(ResponseCurve c) {
    return c == ResponseCurve::Expo ? "expo" : "linear";
}

std::optional<ResponseCurve> parse_response_curve(const std::string& s) {
    if (s == "linear") return ResponseCurve::Linear;
    if (s == "expo") return ResponseCurve::Expo;
    return std::nullopt;
}
