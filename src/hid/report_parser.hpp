#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "report_layout.hpp"

// Pure decoder. Never throws: a field that does not fit in the buffer decodes
// to its default (axis 0, button released, hat centered).
ParsedReport decode_report(const uint8_t* data, size_t size, const ReportLayout& layout);

inline ParsedReport decode_report(const std::vector<uint8_t>& buffer, const ReportLayout& layout) {
    return decode_report(buffer.data(), buffer.size(), layout);
}

// Raw integer for one axis field, sign-reinterpreted per the field; 0 when short
int32_t read_axis_raw(const uint8_t* data, size_t size, size_t base, const AxisField& field);
