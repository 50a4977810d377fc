#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "flight_profile.hpp"

// Built-in knowledge about specific sticks/throttles. A device may be known by
// name only (no layout yet), in which case capture falls back to raw mode.
struct DeviceDefault {
    uint16_t vendor_id;
    uint16_t product_id;
    std::string name;
    std::optional<ReportLayout> layout;
    std::vector<AxisMapping> axis_mappings;
    std::vector<ButtonMapping> button_mappings;
};

const DeviceDefault* find_device_default(uint16_t vendor_id, uint16_t product_id);
const std::vector<DeviceDefault>& device_defaults();

// "044F:B10A" style identity used to key profiles
std::string make_vid_pid(uint16_t vendor_id, uint16_t product_id);
bool parse_vid_pid(const std::string& vid_pid, uint16_t& vendor_id, uint16_t& product_id);
// Canonical upper-case form of a typed id, nothing if malformed
std::optional<std::string> normalize_vid_pid(const std::string& vid_pid);

// Fresh profile for a device: the built-in mappings when the device is known,
// otherwise a generic stick/throttle arrangement. The layout is left empty so
// the built-in table keeps supplying it (and can be improved without touching
// saved profiles).
FlightProfile default_profile_for(uint16_t vendor_id, uint16_t product_id, const std::string& name);
