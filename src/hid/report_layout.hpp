#pragma once
#include <cstdint>
#include <optional>
#include <vector>

// Declarative description of where each control lives inside an input report.
// Offsets are relative to the first payload byte (after the optional report id).

struct AxisField {
    uint32_t byte_offset = 0;
    uint8_t byte_count = 2;      // 1 or 2
    bool little_endian = true;
    bool is_unsigned = true;
    int32_t range_min = 0;
    int32_t range_max = 65535;
};

struct ButtonField {
    uint32_t byte_offset = 0;
    uint8_t bit_index = 0;       // 0..7, LSB first
};

struct HatField {
    uint32_t byte_offset = 0;
    uint8_t bit_offset = 0;
    uint8_t bit_count = 4;
    int32_t center_value = 8;    // extracted value reported when the hat is released
};

struct ReportLayout {
    bool skip_report_id = false;
    std::vector<AxisField> axes;
    std::vector<ButtonField> buttons;
    std::optional<HatField> hat;
};

// Decoded report. Axes are normalized to 0..1, hat_switch is -1 when centered
// else a clock position (0 = up, increasing clockwise).
struct ParsedReport {
    std::vector<float> axes;
    std::vector<bool> buttons;
    int hat_switch = -1;
};
