#pragma once
#include <optional>
#include <string>
#include <variant>
#include "flight_profile.hpp"

enum class AxisMappingField : uint8_t { Target, Inverted, Deadzone, Sensitivity, Curve };

// One edit of one axis mapping field: which field, and a value whose
// alternative must agree with it (Target->AxisTarget, Inverted->bool,
// Deadzone/Sensitivity->double, Curve->ResponseCurve).
struct AxisMappingUpdate {
    using Value = std::variant<AxisTarget, bool, double, ResponseCurve>;

    AxisMappingField field;
    Value value;

    static AxisMappingUpdate target(AxisTarget t) { return {AxisMappingField::Target, t}; }
    static AxisMappingUpdate inverted(bool b) { return {AxisMappingField::Inverted, b}; }
    static AxisMappingUpdate deadzone(double d) { return {AxisMappingField::Deadzone, d}; }
    static AxisMappingUpdate sensitivity(double s) { return {AxisMappingField::Sensitivity, s}; }
    static AxisMappingUpdate curve(ResponseCurve c) { return {AxisMappingField::Curve, c}; }

    // Empty when valid, else a short reason
    std::optional<std::string> validate() const;
};

// Returns a copy of `profile` with the field updated on every axis mapping fed
// by `source_index`. Nothing is returned when the update fails validation.
std::optional<FlightProfile> apply_axis_update(const FlightProfile& profile, uint32_t source_index,
                                               const AxisMappingUpdate& update);

// Parse "field=value" as typed by a user (e.g. "deadzone=0.1", "curve=expo")
std::optional<AxisMappingUpdate> parse_axis_update(const std::string& text);
