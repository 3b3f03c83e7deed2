#pragma once

#include "tribe/service/ProfileStore.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace tribe::io {

// IProfileStore over an in-memory snapshot: { "profiles": [...], "tribes": [...] }.
class JsonSnapshotStore : public IProfileStore
{
public:
    JsonSnapshotStore() = default;
    JsonSnapshotStore(std::vector<Profile> profiles, std::vector<Tribe> tribes);

    // Throws std::runtime_error when the file cannot be opened or parsed.
    static JsonSnapshotStore Load(const std::filesystem::path& path);
    static JsonSnapshotStore FromJson(const nlohmann::json& j);

    std::optional<Profile> loadProfile(const std::string& userId) const override;
    std::optional<Tribe> loadTribe(const std::string& tribeId) const override;
    std::vector<Tribe> loadTribesWithCapacity(const std::optional<std::string>& region) const override;
    std::vector<Profile> loadMemberProfiles(const std::string& tribeId) const override;
    std::vector<Profile> loadProfiles() const override { return profiles_; }
    std::vector<std::string> loadUserTribeIds(const std::string& userId) const override;

    const std::vector<Profile>& profiles() const noexcept { return profiles_; }
    const std::vector<Tribe>& tribes() const noexcept { return tribes_; }

    // Profiles without a seat in any tribe, in snapshot order.
    std::vector<std::string> unseatedUserIds() const;

private:
    void reindex();

    std::vector<Profile>                         profiles_;
    std::vector<Tribe>                           tribes_;
    std::unordered_map<std::string, std::size_t> profileIndex_;
    std::unordered_map<std::string, std::size_t> tribeIndex_;
};

} // namespace tribe::io
