#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Snapshot of one HID interface as reported by enumeration. Only `path` is
// stable enough to reopen the device later.
struct DeviceInfo {
    std::string path;
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    std::string product;
    std::string manufacturer;
    std::string serial_number;
    uint16_t release = 0;
    int interface_number = -1;   // -1 when the bus does not expose one
    uint16_t usage_page = 0;
    uint16_t usage = 0;
};

// An open device. Reports are pushed through the data handler; an error means
// the device is gone and no further data will arrive.
class HidDevice {
public:
    using DataHandler = std::function<void(const std::vector<uint8_t>&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    virtual ~HidDevice() = default;
    virtual void set_handlers(DataHandler on_data, ErrorHandler on_error) = 0;
    // Must be idempotent. Handlers are not invoked after close() returns.
    virtual void close() = 0;
};

class HidBackend {
public:
    virtual ~HidBackend() = default;
    virtual std::vector<DeviceInfo> enumerate() = 0;
    // nullptr when the device cannot be opened
    virtual std::unique_ptr<HidDevice> open(const std::string& path) = 0;
};
