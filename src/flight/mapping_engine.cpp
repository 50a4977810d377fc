#include "mapping_engine.hpp"
#include <algorithm>
#include <cmath>

double apply_trigger_deadzone(double v, double deadzone) {
    if (v < deadzone) return 0.0;
    return (v - deadzone) / (1.0 - deadzone);
}

double apply_stick_deadzone(double v, double deadzone) {
    double mag = std::fabs(v);
    if (mag < deadzone) return 0.0;
    double sign = v >= 0.0 ? 1.0 : -1.0;
    return sign * ((mag - deadzone) / (1.0 - deadzone));
}

double apply_trigger_curve(double v, double sensitivity, ResponseCurve curve) {
    if (curve == ResponseCurve::Expo) return v * v * sensitivity;
    return v * sensitivity;
}

double apply_stick_curve(double v, double sensitivity, ResponseCurve curve) {
    if (curve == ResponseCurve::Expo) {
        double sign = v >= 0.0 ? 1.0 : -1.0;
        return sign * v * v * sensitivity;
    }
    return v * sensitivity;
}

// Half-up rounding (floor(x + 0.5)), so -0.5 rounds toward zero
static double round_half_up(double x) { return std::floor(x + 0.5); }

uint8_t scale_trigger(double v) {
    double r = round_half_up(std::clamp(v, 0.0, 1.0) * 255.0);
    return static_cast<uint8_t>(std::clamp(r, 0.0, 255.0));
}

int16_t scale_stick(double v) {
    double r = round_half_up(std::clamp(v, -1.0, 1.0) * 32767.0);
    return static_cast<int16_t>(std::clamp(r, -32768.0, 32767.0));
}

uint16_t hat_to_dpad(int hat) {
    uint16_t bits = 0;
    if (hat < 0) return bits;
    if (hat == 7 || hat == 0 || hat == 1) bits |= GamepadButton::DPadUp;
    if (hat == 1 || hat == 2 || hat == 3) bits |= GamepadButton::DPadRight;
    if (hat == 3 || hat == 4 || hat == 5) bits |= GamepadButton::DPadDown;
    if (hat == 5 || hat == 6 || hat == 7) bits |= GamepadButton::DPadLeft;
    return bits;
}

GamepadState map_to_gamepad(const ParsedReport& sample, const FlightProfile& profile, int controller_id) {
    GamepadState state{};
    state.controller_id = std::clamp(controller_id, 0, 3);
    state.connected = true;

    for (const auto& m : profile.axis_mappings) {
        if (m.source_index >= sample.axes.size()) continue;
        const double raw = sample.axes[m.source_index];
        // Out-of-range values would divide by zero below; hold them to the editable range
        const double dz = std::clamp(m.deadzone, MinDeadzone, MaxDeadzone);
        const double sens = std::clamp(m.sensitivity, MinSensitivity, MaxSensitivity);

        if (is_trigger(m.target)) {
            double v = m.inverted ? 1.0 - raw : raw;
            v = apply_trigger_deadzone(v, dz);
            v = apply_trigger_curve(v, sens, m.curve);
            uint8_t out = scale_trigger(v);
            if (m.target == AxisTarget::LeftTrigger) state.left_trigger = out;
            else state.right_trigger = out;
            continue;
        }

        double v = raw * 2.0 - 1.0;
        if (m.inverted) v = -v;
        v = apply_stick_deadzone(v, dz);
        v = apply_stick_curve(v, sens, m.curve);
        int16_t out = scale_stick(v);
        switch (m.target) {
            case AxisTarget::LeftStickX: state.left_stick_x = out; break;
            case AxisTarget::LeftStickY: state.left_stick_y = out; break;
            case AxisTarget::RightStickX: state.right_stick_x = out; break;
            case AxisTarget::RightStickY: state.right_stick_y = out; break;
            default: break;
        }
    }

    for (const auto& b : profile.button_mappings) {
        if (b.source_index >= sample.buttons.size()) continue;
        if (sample.buttons[b.source_index]) state.buttons |= b.target_button;
    }

    state.buttons |= hat_to_dpad(sample.hat_switch);
    return state;
}

bool gamepad_state_changed(const std::optional<GamepadState>& prev, const GamepadState& next) {
    if (!prev) return true;
    const GamepadState& p = *prev;
    return p.buttons != next.buttons ||
           p.left_trigger != next.left_trigger ||
           p.right_trigger != next.right_trigger ||
           p.left_stick_x != next.left_stick_x ||
           p.left_stick_y != next.left_stick_y ||
           p.right_stick_x != next.right_stick_x ||
           p.right_stick_y != next.right_stick_y;
}
