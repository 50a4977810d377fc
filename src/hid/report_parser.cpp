#include "report_parser.hpp"
#include <algorithm>

int32_t read_axis_raw(const uint8_t* data, size_t size, size_t base, const AxisField& field) {
    const size_t count = field.byte_count == 2 ? 2 : 1;
    const size_t idx = base + field.byte_offset;
    if (idx + count > size) return 0;

    int32_t raw;
    if (count == 2) {
        uint16_t u = field.little_endian
            ? static_cast<uint16_t>(data[idx] | (data[idx + 1] << 8))
            : static_cast<uint16_t>((data[idx] << 8) | data[idx + 1]);
        raw = u;
        if (!field.is_unsigned && raw > 32767) raw -= 65536;
    } else {
        raw = data[idx];
        if (!field.is_unsigned && raw > 127) raw -= 256;
    }
    return raw;
}

ParsedReport decode_report(const uint8_t* data, size_t size, const ReportLayout& layout) {
    ParsedReport out;
    const size_t base = layout.skip_report_id ? 1 : 0;

    out.axes.reserve(layout.axes.size());
    for (const auto& f : layout.axes) {
        int32_t raw = read_axis_raw(data, size, base, f);
        // 64-bit span so extreme user ranges cannot overflow
        int64_t range = static_cast<int64_t>(f.range_max) - f.range_min;
        double normalized = range > 0 ? (static_cast<double>(raw) - f.range_min) / static_cast<double>(range) : 0.0;
        out.axes.push_back(static_cast<float>(std::clamp(normalized, 0.0, 1.0)));
    }

    out.buttons.reserve(layout.buttons.size());
    for (const auto& b : layout.buttons) {
        size_t idx = base + b.byte_offset;
        if (idx >= size || b.bit_index > 7) { out.buttons.push_back(false); continue; }
        out.buttons.push_back(((data[idx] >> b.bit_index) & 1) != 0);
    }

    if (layout.hat) {
        const HatField& h = *layout.hat;
        size_t idx = base + h.byte_offset;
        if (idx < size) {
            unsigned bits = std::min<unsigned>(h.bit_count, 8);
            unsigned mask = (1u << bits) - 1u;
            int value = h.bit_offset < 8 ? static_cast<int>((data[idx] >> h.bit_offset) & mask) : 0;
            out.hat_switch = value == h.center_value ? -1 : value;
        }
    }
    return out;
}
