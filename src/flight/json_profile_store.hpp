#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "profile_store.hpp"

// Profile store backed by a single JSON document ({"profiles": [...]}).
// The file is read once at construction and rewritten after every change.
class JsonProfileStore : public ProfileStore {
public:
    explicit JsonProfileStore(std::string path);

    FlightProfile get_or_create_profile(uint16_t vendor_id, uint16_t product_id, const std::string& name) override;
    std::optional<FlightProfile> find(const std::string& vid_pid, const std::optional<std::string>& game_id = std::nullopt) const override;
    bool save(const FlightProfile& profile) override;
    std::optional<FlightProfile> reset(const std::string& vid_pid) override;
    bool remove(const std::string& vid_pid, const std::optional<std::string>& game_id = std::nullopt) override;
    std::vector<FlightProfile> list_all() const override;

    // Re-read the file, replacing in-memory profiles. False when missing or malformed.
    bool load();
    const std::string& path() const { return _path; }

    // Serialization helpers (exposed for tests)
    static std::string to_json_text(const std::vector<FlightProfile>& profiles);
    static bool from_json_text(const std::string& text, std::vector<FlightProfile>& out);

private:
    bool write_locked() const;
    std::vector<FlightProfile>::iterator find_exact_locked(const std::string& vid_pid, const std::optional<std::string>& game_id);

    std::string _path;
    mutable std::mutex _mtx;
    std::vector<FlightProfile> _profiles;
};
