#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "flight_profile.hpp"

// Persistence of flight profiles, keyed by device identity and optional game.
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    // Device-wide profile for the identity, created from defaults when absent
    virtual FlightProfile get_or_create_profile(uint16_t vendor_id, uint16_t product_id, const std::string& name) = 0;
    // Game-scoped profile when one exists, else the device-wide one
    virtual std::optional<FlightProfile> find(const std::string& vid_pid, const std::optional<std::string>& game_id = std::nullopt) const = 0;
    virtual bool save(const FlightProfile& profile) = 0;
    // Replace the device-wide profile with defaults; nothing when there is none
    virtual std::optional<FlightProfile> reset(const std::string& vid_pid) = 0;
    virtual bool remove(const std::string& vid_pid, const std::optional<std::string>& game_id = std::nullopt) = 0;
    virtual std::vector<FlightProfile> list_all() const = 0;
};
