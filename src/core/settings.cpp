#include "settings.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_map>

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool load_settings(const std::string& path, FlightSettings& fs) {
    std::ifstream in(path, std::ios::in); if (!in) return false;
    std::string line; std::unordered_map<std::string,std::string> kv; kv.reserve(8);

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('='); if (pos==std::string::npos) continue;
        kv[trim(line.substr(0,pos))] = trim(line.substr(pos+1));
    }

    auto getb = [&](const char* k, bool d) -> bool {
        auto it = kv.find(k);
        if (it == kv.end()) return d;
        const std::string& v = it->second;
        if (v == "1" || v == "true" || v == "TRUE") return true;
        if (v == "0" || v == "false" || v == "FALSE") return false;
        return d;
    };
    auto geti = [&](const char* k, int d) -> int {
        auto it = kv.find(k);
        if (it == kv.end()) return d;
        try { return std::stoi(it->second); }
        catch (const std::exception&) { return d; }
    };
    auto gets = [&](const char* k, const std::string& d) -> std::string {
        auto it = kv.find(k);
        return it == kv.end() ? d : it->second;
    };

    fs.enabled = getb("enabled", fs.enabled);
    fs.controller_slot = geti("controller_slot", fs.controller_slot);
    if (fs.controller_slot < 0) fs.controller_slot = 0;
    if (fs.controller_slot > 3) fs.controller_slot = 3;
    fs.hotplug_interval_ms = geti("hotplug_interval_ms", fs.hotplug_interval_ms);
    if (fs.hotplug_interval_ms < 100) fs.hotplug_interval_ms = 100; // sensible floor
    fs.profiles_path = gets("profiles_path", fs.profiles_path);
    fs.verbose = getb("verbose", fs.verbose);
    fs.log_file = gets("log_file", fs.log_file);
    return true;
}

bool save_settings(const std::string& path, const FlightSettings& fs) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) return false;
    out << "# Flight controls settings\n";
    out << "enabled=" << (fs.enabled?1:0) << "\n";
    out << "controller_slot=" << fs.controller_slot << "\n";
    out << "hotplug_interval_ms=" << fs.hotplug_interval_ms << "\n";
    out << "profiles_path=" << fs.profiles_path << "\n";
    out << "verbose=" << (fs.verbose?1:0) << "\n";
    out << "log_file=" << fs.log_file << "\n";
    return static_cast<bool>(out);
}
