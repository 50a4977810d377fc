#include "json_profile_store.hpp"
#include "device_defaults.hpp"
#include "core/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

using nlohmann::json;

static json layout_to_json(const ReportLayout& l) {
    json jl;
    jl["skip_report_id"] = l.skip_report_id;
    jl["axes"] = json::array();
    for (const auto& a : l.axes) {
        json ja;
        ja["byte_offset"] = a.byte_offset;
        ja["byte_count"] = a.byte_count;
        ja["little_endian"] = a.little_endian;
        ja["unsigned"] = a.is_unsigned;
        ja["range_min"] = a.range_min;
        ja["range_max"] = a.range_max;
        jl["axes"].push_back(ja);
    }
    jl["buttons"] = json::array();
    for (const auto& b : l.buttons) jl["buttons"].push_back({{"byte_offset", b.byte_offset}, {"bit_index", b.bit_index}});
    if (l.hat) {
        jl["hat"] = {{"byte_offset", l.hat->byte_offset}, {"bit_offset", l.hat->bit_offset},
                     {"bit_count", l.hat->bit_count}, {"center_value", l.hat->center_value}};
    }
    return jl;
}

static uint8_t small_field(const json& j, const char* key, int def, int lo, int hi) {
    int v = j.value(key, def);
    return static_cast<uint8_t>(std::clamp(v, lo, hi));
}

static ReportLayout layout_from_json(const json& jl) {
    ReportLayout l;
    l.skip_report_id = jl.value("skip_report_id", false);
    if (jl.contains("axes") && jl["axes"].is_array()) {
        for (const auto& ja : jl["axes"]) {
            AxisField a;
            a.byte_offset = ja.value("byte_offset", 0u);
            a.byte_count = ja.value("byte_count", 2) == 2 ? 2 : 1;
            a.little_endian = ja.value("little_endian", true);
            a.is_unsigned = ja.value("unsigned", true);
            a.range_min = ja.value("range_min", 0);
            a.range_max = ja.value("range_max", 65535);
            l.axes.push_back(a);
        }
    }
    if (jl.contains("buttons") && jl["buttons"].is_array()) {
        for (const auto& jb : jl["buttons"]) {
            ButtonField b;
            b.byte_offset = jb.value("byte_offset", 0u);
            b.bit_index = small_field(jb, "bit_index", 0, 0, 255); // >7 decodes as released
            l.buttons.push_back(b);
        }
    }
    if (jl.contains("hat") && jl["hat"].is_object()) {
        const json& jh = jl["hat"];
        HatField h;
        h.byte_offset = jh.value("byte_offset", 0u);
        h.bit_offset = small_field(jh, "bit_offset", 0, 0, 255);
        h.bit_count = small_field(jh, "bit_count", 4, 0, 8);
        h.center_value = jh.value("center_value", 8);
        l.hat = h;
    }
    return l;
}

static json profile_to_json(const FlightProfile& p) {
    json jp;
    jp["vid_pid"] = p.vid_pid;
    if (p.game_id) jp["game_id"] = *p.game_id; else jp["game_id"] = nullptr;
    jp["name"] = p.name;
    if (p.report_layout) jp["report_layout"] = layout_to_json(*p.report_layout);
    jp["axis_mappings"] = json::array();
    for (const auto& m : p.axis_mappings) {
        json jm;
        jm["source_index"] = m.source_index;
        jm["target"] = axis_target_name(m.target);
        jm["inverted"] = m.inverted;
        jm["deadzone"] = m.deadzone;
        jm["sensitivity"] = m.sensitivity;
        jm["curve"] = response_curve_name(m.curve);
        jp["axis_mappings"].push_back(jm);
    }
    jp["button_mappings"] = json::array();
    for (const auto& b : p.button_mappings)
        jp["button_mappings"].push_back({{"source_index", b.source_index}, {"target_button", b.target_button}});
    return jp;
}

static bool profile_from_json(const json& jp, FlightProfile& p) {
    if (!jp.is_object() || !jp.contains("vid_pid") || !jp["vid_pid"].is_string()) return false;
    p.vid_pid = jp["vid_pid"].get<std::string>();
    if (jp.contains("game_id") && jp["game_id"].is_string()) p.game_id = jp["game_id"].get<std::string>();
    p.name = jp.value("name", std::string());
    if (jp.contains("report_layout") && jp["report_layout"].is_object()) p.report_layout = layout_from_json(jp["report_layout"]);

    if (jp.contains("axis_mappings") && jp["axis_mappings"].is_array()) {
        for (const auto& jm : jp["axis_mappings"]) {
            auto target = parse_axis_target(jm.value("target", std::string()));
            auto curve = parse_response_curve(jm.value("curve", std::string("linear")));
            if (!target || !curve) {
                log_warn("Skipping axis mapping with unknown target/curve in profile " + p.vid_pid);
                continue;
            }
            AxisMapping m;
            m.source_index = jm.value("source_index", 0u);
            m.target = *target;
            m.inverted = jm.value("inverted", false);
            m.deadzone = std::clamp(jm.value("deadzone", 0.05), MinDeadzone, MaxDeadzone);
            m.sensitivity = std::clamp(jm.value("sensitivity", 1.0), MinSensitivity, MaxSensitivity);
            m.curve = *curve;
            p.axis_mappings.push_back(m);
        }
    }
    if (jp.contains("button_mappings") && jp["button_mappings"].is_array()) {
        for (const auto& jb : jp["button_mappings"]) {
            ButtonMapping b;
            b.source_index = jb.value("source_index", 0u);
            b.target_button = static_cast<uint16_t>(jb.value("target_button", 0u) & 0xFFFFu);
            p.button_mappings.push_back(b);
        }
    }
    return true;
}

static bool same_scope(const FlightProfile& p, const std::string& vid_pid, const std::optional<std::string>& game_id) {
    return p.vid_pid == vid_pid && p.game_id == game_id;
}

std::string JsonProfileStore::to_json_text(const std::vector<FlightProfile>& profiles) {
    json j;
    j["profiles"] = json::array();
    for (const auto& p : profiles) j["profiles"].push_back(profile_to_json(p));
    return j.dump(2);
}

bool JsonProfileStore::from_json_text(const std::string& text, std::vector<FlightProfile>& out) {
    try {
        json j = json::parse(text);
        if (!j.contains("profiles") || !j["profiles"].is_array()) return false;
        std::vector<FlightProfile> loaded;
        for (const auto& jp : j["profiles"]) {
            FlightProfile p;
            if (profile_from_json(jp, p)) loaded.push_back(std::move(p));
        }
        out = std::move(loaded);
        return true;
    } catch (const json::exception& e) {
        log_warn(std::string("Failed to parse flight profiles: ") + e.what());
        return false;
    }
}

JsonProfileStore::JsonProfileStore(std::string path) : _path(std::move(path)) {
    load();
}

bool JsonProfileStore::load() {
    std::ifstream in(_path);
    if (!in) return false;
    std::stringstream ss; ss << in.rdbuf();
    std::vector<FlightProfile> loaded;
    if (!from_json_text(ss.str(), loaded)) return false;
    std::lock_guard<std::mutex> lk(_mtx);
    _profiles = std::move(loaded);
    log_info("Loaded " + std::to_string(_profiles.size()) + " flight profile(s) from " + _path);
    return true;
}

bool JsonProfileStore::write_locked() const {
    std::ofstream out(_path, std::ios::out | std::ios::trunc);
    if (!out) {
        log_warn("Failed to write flight profiles to " + _path);
        return false;
    }
    out << to_json_text(_profiles);
    if (!out) {
        log_warn("Short write on " + _path);
        return false;
    }
    return true;
}

std::vector<FlightProfile>::iterator JsonProfileStore::find_exact_locked(const std::string& vid_pid, const std::optional<std::string>& game_id) {
    return std::find_if(_profiles.begin(), _profiles.end(),
                        [&](const FlightProfile& p){ return same_scope(p, vid_pid, game_id); });
}

FlightProfile JsonProfileStore::get_or_create_profile(uint16_t vendor_id, uint16_t product_id, const std::string& name) {
    std::lock_guard<std::mutex> lk(_mtx);
    const std::string vid_pid = make_vid_pid(vendor_id, product_id);
    auto it = find_exact_locked(vid_pid, std::nullopt);
    if (it != _profiles.end()) return *it;

    FlightProfile p = default_profile_for(vendor_id, product_id, name);
    _profiles.push_back(p);
    if (!write_locked()) log_warn("Default profile for " + vid_pid + " kept in memory only");
    log_info("Created default flight profile for " + vid_pid);
    return p;
}

std::optional<FlightProfile> JsonProfileStore::find(const std::string& vid_pid, const std::optional<std::string>& game_id) const {
    std::lock_guard<std::mutex> lk(_mtx);
    const FlightProfile* device_wide = nullptr;
    for (const auto& p : _profiles) {
        if (p.vid_pid != vid_pid) continue;
        if (game_id && p.game_id == game_id) return p;
        if (!p.game_id) device_wide = &p;
    }
    if (device_wide) return *device_wide;
    return std::nullopt;
}

bool JsonProfileStore::save(const FlightProfile& profile) {
    uint16_t vid, pid;
    if (!parse_vid_pid(profile.vid_pid, vid, pid)) {
        log_warn("Refusing to save flight profile with malformed id '" + profile.vid_pid + "'");
        return false;
    }
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = find_exact_locked(profile.vid_pid, profile.game_id);
    if (it != _profiles.end()) *it = profile;
    else _profiles.push_back(profile);
    return write_locked();
}

std::optional<FlightProfile> JsonProfileStore::reset(const std::string& vid_pid) {
    uint16_t vid, pid;
    if (!parse_vid_pid(vid_pid, vid, pid)) return std::nullopt;
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = find_exact_locked(vid_pid, std::nullopt);
    if (it == _profiles.end()) return std::nullopt;
    // Keep the user's display name; everything else goes back to defaults
    FlightProfile fresh = default_profile_for(vid, pid, it->name);
    *it = fresh;
    if (!write_locked()) log_warn("Reset of " + vid_pid + " kept in memory only");
    return fresh;
}

bool JsonProfileStore::remove(const std::string& vid_pid, const std::optional<std::string>& game_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = find_exact_locked(vid_pid, game_id);
    if (it == _profiles.end()) return false;
    _profiles.erase(it);
    return write_locked();
}

std::vector<FlightProfile> JsonProfileStore::list_all() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _profiles;
}
