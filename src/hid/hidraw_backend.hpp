#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/event_loop.hpp"
#include "hid_backend.hpp"

// Linux backend on top of /dev/hidrawN. Identity comes from sysfs so listing
// does not need read permission on the device nodes. Each open device gets a
// reader thread; reports and errors are handed to `loop` with post().
class HidrawBackend : public HidBackend {
public:
    explicit HidrawBackend(EventLoop& loop, std::string sysfs_root = "/sys/class/hidraw");

    std::vector<DeviceInfo> enumerate() override;
    std::unique_ptr<HidDevice> open(const std::string& path) override;

    // Fills bus ids, name and serial from a hid uevent blob (HID_ID=0003:0000044F:0000B10A ...)
    static bool parse_hid_uevent(const std::string& text, DeviceInfo& info);
    // First Usage Page / Usage pair ahead of the first collection
    static bool read_top_level_usage(const std::vector<uint8_t>& descriptor, uint16_t& usage_page, uint16_t& usage);

private:
    EventLoop& _loop;
    std::string _sysfs_root;
};
