#pragma once
#include <optional>
#include "flight_profile.hpp"
#include "gamepad_state.hpp"
#include "hid/report_layout.hpp"

// Shapes one decoded report into virtual controller state using the profile's
// axis/button mappings. Mappings that reference controls the device does not
// have are ignored. Hat positions fold onto the D-pad with diagonals asserting
// both neighbouring directions.
GamepadState map_to_gamepad(const ParsedReport& sample, const FlightProfile& profile, int controller_id);

// Individual pipeline stages, exposed for tests
double apply_trigger_deadzone(double v, double deadzone);
double apply_stick_deadzone(double v, double deadzone);
double apply_trigger_curve(double v, double sensitivity, ResponseCurve curve);
double apply_stick_curve(double v, double sensitivity, ResponseCurve curve);
uint8_t scale_trigger(double v);
int16_t scale_stick(double v);
uint16_t hat_to_dpad(int hat_switch);

// True when `prev` is absent or `next` differs in any control value.
// connected and controller_id are not compared.
bool gamepad_state_changed(const std::optional<GamepadState>& prev, const GamepadState& next);
