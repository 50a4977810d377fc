#pragma once
#include <string>

// Runtime settings persisted as a plain key=value file ('#' starts a comment).
struct FlightSettings {
    bool enabled = true;
    int controller_slot = 0;           // clamped to 0..3 on load
    int hotplug_interval_ms = 3000;
    std::string profiles_path = "flight_profiles.json";
    bool verbose = false;
    std::string log_file;              // empty: stderr only
};

// Returns false when the file cannot be opened; fields absent from the file or
// with unparsable values keep whatever `fs` already holds.
bool load_settings(const std::string& path, FlightSettings& fs);
bool save_settings(const std::string& path, const FlightSettings& fs);
