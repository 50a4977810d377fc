#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Button bits of the virtual controller. Values match XINPUT_GAMEPAD_* so the
// mask can be handed to an XInput-style consumer untouched (we avoid the
// platform header dependency).
namespace GamepadButton {
    constexpr uint16_t DPadUp        = 0x0001;
    constexpr uint16_t DPadDown      = 0x0002;
    constexpr uint16_t DPadLeft      = 0x0004;
    constexpr uint16_t DPadRight     = 0x0008;
    constexpr uint16_t Start         = 0x0010;
    constexpr uint16_t Back          = 0x0020;
    constexpr uint16_t LeftThumb     = 0x0040;
    constexpr uint16_t RightThumb    = 0x0080;
    constexpr uint16_t LeftShoulder  = 0x0100;
    constexpr uint16_t RightShoulder = 0x0200;
    constexpr uint16_t Guide         = 0x0400;
    constexpr uint16_t A             = 0x1000;
    constexpr uint16_t B             = 0x2000;
    constexpr uint16_t X             = 0x4000;
    constexpr uint16_t Y             = 0x8000;
}

struct GamepadState {
    int controller_id = 0;      // 0..3
    uint16_t buttons = 0;
    uint8_t left_trigger = 0;
    uint8_t right_trigger = 0;
    int16_t left_stick_x = 0;
    int16_t left_stick_y = 0;
    int16_t right_stick_x = 0;
    int16_t right_stick_y = 0;
    bool connected = false;
};

// Live-tester payload: emitted on every raw report and on connect/disconnect
struct FlightControlsState {
    bool connected = false;
    std::string device_name;
    std::vector<float> axes;
    std::vector<bool> buttons;
    int hat_switch = -1;
    std::vector<uint8_t> raw_bytes;
};
