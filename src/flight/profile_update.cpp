#include "profile_update.hpp"
#include <cmath>
#include <stdexcept>

std::optional<std::string> AxisMappingUpdate::validate() const {
    switch (field) {
        case AxisMappingField::Target:
            if (!std::holds_alternative<AxisTarget>(value)) return std::string("target expects an axis target");
            return std::nullopt;
        case AxisMappingField::Inverted:
            if (!std::holds_alternative<bool>(value)) return std::string("inverted expects a boolean");
            return std::nullopt;
        case AxisMappingField::Curve:
            if (!std::holds_alternative<ResponseCurve>(value)) return std::string("curve expects linear or expo");
            return std::nullopt;
        case AxisMappingField::Deadzone: {
            if (!std::holds_alternative<double>(value)) return std::string("deadzone expects a number");
            double d = std::get<double>(value);
            if (!std::isfinite(d) || d < MinDeadzone || d > MaxDeadzone) return std::string("deadzone out of range 0..0.5");
            return std::nullopt;
        }
        case AxisMappingField::Sensitivity: {
            if (!std::holds_alternative<double>(value)) return std::string("sensitivity expects a number");
            double s = std::get<double>(value);
            if (!std::isfinite(s) || s < MinSensitivity || s > MaxSensitivity) return std::string("sensitivity out of range 0.1..3.0");
            return std::nullopt;
        }
    }
    return std::string("unknown field");
}

std::optional<FlightProfile> apply_axis_update(const FlightProfile& profile, uint32_t source_index,
                                               const AxisMappingUpdate& update) {
    if (update.validate()) return std::nullopt;
    FlightProfile out = profile;
    for (auto& m : out.axis_mappings) {
        if (m.source_index != source_index) continue;
        switch (update.field) {
            case AxisMappingField::Target: m.target = std::get<AxisTarget>(update.value); break;
            case AxisMappingField::Inverted: m.inverted = std::get<bool>(update.value); break;
            case AxisMappingField::Deadzone: m.deadzone = std::get<double>(update.value); break;
            case AxisMappingField::Sensitivity: m.sensitivity = std::get<double>(update.value); break;
            case AxisMappingField::Curve: m.curve = std::get<ResponseCurve>(update.value); break;
        }
    }
    return out;
}

std::optional<AxisMappingUpdate> parse_axis_update(const std::string& text) {
    auto pos = text.find('=');
    if (pos == std::string::npos) return std::nullopt;
    std::string key = text.substr(0, pos);
    std::string val = text.substr(pos + 1);

    if (key == "target") {
        auto t = parse_axis_target(val);
        if (!t) return std::nullopt;
        return AxisMappingUpdate::target(*t);
    }
    if (key == "inverted") {
        if (val == "1" || val == "true") return AxisMappingUpdate::inverted(true);
        if (val == "0" || val == "false") return AxisMappingUpdate::inverted(false);
        return std::nullopt;
    }
    if (key == "curve") {
        auto c = parse_response_curve(val);
        if (!c) return std::nullopt;
        return AxisMappingUpdate::curve(*c);
    }
    if (key == "deadzone" || key == "sensitivity") {
        double d;
        try {
            size_t used = 0;
            d = std::stod(val, &used);
            if (used != val.size()) return std::nullopt;
        } catch (const std::exception&) { return std::nullopt; }
        AxisMappingUpdate u = key == "deadzone" ? AxisMappingUpdate::deadzone(d) : AxisMappingUpdate::sensitivity(d);
        if (u.validate()) return std::nullopt;
        return u;
    }
    return std::nullopt;
}
