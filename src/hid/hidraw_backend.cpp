#include "hidraw_backend.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string read_text_file(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return {};
    std::stringstream ss; ss << in.rdbuf();
    return ss.str();
}

static std::string first_line(const fs::path& p) {
    std::string s = read_text_file(p);
    auto nl = s.find('\n');
    if (nl != std::string::npos) s.erase(nl);
    return s;
}

static bool parse_hex_u32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    try {
        size_t used = 0;
        unsigned long v = std::stoul(s, &used, 16);
        if (used != s.size()) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool HidrawBackend::parse_hid_uevent(const std::string& text, DeviceInfo& info) {
    bool have_id = false;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (key == "HID_ID") {
            // bus:vendor:product, each hex
            auto c1 = val.find(':');
            auto c2 = c1 == std::string::npos ? c1 : val.find(':', c1 + 1);
            if (c2 == std::string::npos) continue;
            uint32_t vid = 0, pid = 0;
            if (!parse_hex_u32(val.substr(c1 + 1, c2 - c1 - 1), vid)) continue;
            if (!parse_hex_u32(val.substr(c2 + 1), pid)) continue;
            info.vendor_id = static_cast<uint16_t>(vid & 0xFFFF);
            info.product_id = static_cast<uint16_t>(pid & 0xFFFF);
            have_id = true;
        } else if (key == "HID_NAME") {
            info.product = val;
        } else if (key == "HID_UNIQ") {
            info.serial_number = val;
        }
    }
    return have_id;
}

bool HidrawBackend::read_top_level_usage(const std::vector<uint8_t>& d, uint16_t& usage_page, uint16_t& usage) {
    bool have_page = false, have_usage = false;
    size_t i = 0;
    while (i < d.size()) {
        const uint8_t prefix = d[i];
        if (prefix == 0xFE) { // long item
            if (i + 1 >= d.size()) break;
            i += 3 + d[i + 1];
            continue;
        }
        size_t size = prefix & 0x03;
        if (size == 3) size = 4;
        if (i + 1 + size > d.size()) break;
        uint32_t value = 0;
        for (size_t b = 0; b < size; ++b) value |= static_cast<uint32_t>(d[i + 1 + b]) << (8 * b);

        const uint8_t tag = prefix & 0xFC;
        if (tag == 0x04 && !have_page) { usage_page = static_cast<uint16_t>(value); have_page = true; }
        else if (tag == 0x08 && !have_usage) { usage = static_cast<uint16_t>(value & 0xFFFF); have_usage = true; }
        else if (tag == 0xA0) break; // Collection
        i += 1 + size;
    }
    return have_page && have_usage;
}

HidrawBackend::HidrawBackend(EventLoop& loop, std::string sysfs_root)
    : _loop(loop), _sysfs_root(std::move(sysfs_root)) {}

std::vector<DeviceInfo> HidrawBackend::enumerate() {
    std::vector<DeviceInfo> out;
    std::error_code ec;
    fs::directory_iterator it(_sysfs_root, ec);
    if (ec) {
        log_verbose("hidraw enumerate: cannot read " + _sysfs_root + ": " + ec.message());
        return out;
    }
    for (const auto& entry : it) {
        const std::string node = entry.path().filename().string();
        const fs::path hid_dir = entry.path() / "device";

        DeviceInfo info;
        info.path = "/dev/" + node;
        if (!parse_hid_uevent(read_text_file(hid_dir / "uevent"), info)) continue;

        std::ifstream rd(hid_dir / "report_descriptor", std::ios::binary);
        std::vector<uint8_t> desc((std::istreambuf_iterator<char>(rd)), std::istreambuf_iterator<char>());
        read_top_level_usage(desc, info.usage_page, info.usage);

        // USB parents: <usb-device>/<interface>/<hid-device>
        fs::path real = fs::canonical(hid_dir, ec);
        if (!ec) {
            fs::path intf = real.parent_path();
            fs::path usb_dev = intf.parent_path();
            uint32_t v = 0;
            if (parse_hex_u32(first_line(intf / "bInterfaceNumber"), v)) info.interface_number = static_cast<int>(v);
            std::string manufacturer = first_line(usb_dev / "manufacturer");
            std::string product = first_line(usb_dev / "product");
            if (!manufacturer.empty()) info.manufacturer = manufacturer;
            if (!product.empty()) info.product = product;
            if (parse_hex_u32(first_line(usb_dev / "bcdDevice"), v)) info.release = static_cast<uint16_t>(v);
        }
        out.push_back(std::move(info));
    }
    std::sort(out.begin(), out.end(), [](const DeviceInfo& a, const DeviceInfo& b){ return a.path < b.path; });
    return out;
}

namespace {

// Handlers live here so queued tasks can outlive the device object
struct HandlerSlot {
    std::mutex mtx;
    bool closed = false;
    HidDevice::DataHandler on_data;
    HidDevice::ErrorHandler on_error;
};

class HidrawDevice : public HidDevice {
public:
    HidrawDevice(EventLoop& loop, int fd, std::string path)
        : _loop(loop), _fd(fd), _path(std::move(path)), _slot(std::make_shared<HandlerSlot>()) {
        _running.store(true);
        _reader = std::thread([this]() { read_loop(); });
    }
    ~HidrawDevice() override { close(); }

    void set_handlers(DataHandler on_data, ErrorHandler on_error) override {
        std::lock_guard<std::mutex> g(_slot->mtx);
        _slot->on_data = std::move(on_data);
        _slot->on_error = std::move(on_error);
    }

    void close() override {
        {
            std::lock_guard<std::mutex> g(_slot->mtx);
            if (_slot->closed) return;
            _slot->closed = true;
            _slot->on_data = nullptr;
            _slot->on_error = nullptr;
        }
        _running.store(false);
        if (_reader.joinable()) _reader.join();
        if (_fd >= 0) { ::close(_fd); _fd = -1; }
    }

private:
    void read_loop() {
        std::vector<uint8_t> rbuf(4096);
        while (_running.load()) {
            pollfd pfd{ _fd, POLLIN, 0 };
            int r = ::poll(&pfd, 1, 200);
            if (r == 0) continue;
            if (r < 0) {
                if (errno == EINTR) continue;
                post_error(std::string("poll failed: ") + std::strerror(errno));
                return;
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                post_error("device " + _path + " disconnected");
                return;
            }
            ssize_t n = ::read(_fd, rbuf.data(), rbuf.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                post_error(std::string("read failed: ") + std::strerror(errno));
                return;
            }
            if (n == 0) {
                post_error("device " + _path + " disconnected");
                return;
            }
            post_data(std::vector<uint8_t>(rbuf.begin(), rbuf.begin() + n));
        }
    }

    void post_data(std::vector<uint8_t> bytes) {
        std::shared_ptr<HandlerSlot> slot = _slot;
        _loop.post([slot, bytes = std::move(bytes)]() {
            DataHandler h;
            {
                std::lock_guard<std::mutex> g(slot->mtx);
                if (slot->closed) return;
                h = slot->on_data;
            }
            if (h) h(bytes);
        });
    }

    void post_error(std::string message) {
        std::shared_ptr<HandlerSlot> slot = _slot;
        _loop.post([slot, message = std::move(message)]() {
            ErrorHandler h;
            {
                std::lock_guard<std::mutex> g(slot->mtx);
                if (slot->closed) return;
                h = slot->on_error;
            }
            if (h) h(message);
        });
    }

    EventLoop& _loop;
    int _fd;
    std::string _path;
    std::shared_ptr<HandlerSlot> _slot;
    std::atomic<bool> _running{false};
    std::thread _reader;
};

} // namespace

std::unique_ptr<HidDevice> HidrawBackend::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        log_warn("Cannot open " + path + ": " + std::strerror(errno));
        return nullptr;
    }
    return std::make_unique<HidrawDevice>(_loop, fd, path);
}
