#include "tribe/io/SnapshotStore.hpp"

#include "tribe/io/JsonCodec.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <stdexcept>

namespace tribe::io {

using nlohmann::json;

JsonSnapshotStore::JsonSnapshotStore(std::vector<Profile> profiles, std::vector<Tribe> tribes)
    : profiles_(std::move(profiles))
    , tribes_(std::move(tribes))
{
    reindex();
}

JsonSnapshotStore JsonSnapshotStore::Load(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Failed to open snapshot: " + path.string());

    json j;
    try
    {
        in >> j;
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error("Failed to parse snapshot " + path.string() + ": " + e.what());
    }

    JsonSnapshotStore store = FromJson(j);
    spdlog::info("snapshot {}: {} profiles, {} tribes", path.string(), store.profiles_.size(), store.tribes_.size());
    return store;
}

JsonSnapshotStore JsonSnapshotStore::FromJson(const json& j)
{
    std::vector<Profile> profiles;
    std::vector<Tribe> tribes;

    if (j.contains("profiles"))
        for (const auto& p : j.at("profiles"))
            profiles.push_back(ProfileFromJson(p));
    if (j.contains("tribes"))
        for (const auto& t : j.at("tribes"))
            tribes.push_back(TribeFromJson(t));

    return JsonSnapshotStore(std::move(profiles), std::move(tribes));
}

void JsonSnapshotStore::reindex()
{
    profileIndex_.clear();
    tribeIndex_.clear();
    for (std::size_t i = 0; i < profiles_.size(); ++i)
        if (!profileIndex_.emplace(profiles_[i].id, i).second)
            spdlog::warn("snapshot: duplicate profile id {} ignored", profiles_[i].id);
    for (std::size_t i = 0; i < tribes_.size(); ++i)
        if (!tribeIndex_.emplace(tribes_[i].id, i).second)
            spdlog::warn("snapshot: duplicate tribe id {} ignored", tribes_[i].id);
}

std::optional<Profile> JsonSnapshotStore::loadProfile(const std::string& userId) const
{
    const auto it = profileIndex_.find(userId);
    if (it == profileIndex_.end())
        return std::nullopt;
    return profiles_[it->second];
}

std::optional<Tribe> JsonSnapshotStore::loadTribe(const std::string& tribeId) const
{
    const auto it = tribeIndex_.find(tribeId);
    if (it == tribeIndex_.end())
        return std::nullopt;
    return tribes_[it->second];
}

std::vector<Tribe> JsonSnapshotStore::loadTribesWithCapacity(const std::optional<std::string>& region) const
{
    std::vector<Tribe> out;
    for (const auto& t : tribes_)
    {
        if (region && t.region != *region)
            continue;
        if (t.hasCapacity())
            out.push_back(t);
    }
    return out;
}

std::vector<Profile> JsonSnapshotStore::loadMemberProfiles(const std::string& tribeId) const
{
    std::vector<Profile> out;
    const auto t = tribeIndex_.find(tribeId);
    if (t == tribeIndex_.end())
        return out;

    for (const auto& m : tribes_[t->second].members)
    {
        const auto p = profileIndex_.find(m.userId);
        if (p != profileIndex_.end())
            out.push_back(profiles_[p->second]);
    }
    return out;
}

std::vector<std::string> JsonSnapshotStore::loadUserTribeIds(const std::string& userId) const
{
    std::vector<std::string> out;
    for (const auto& t : tribes_)
        for (const auto& m : t.members)
            if (m.userId == userId && m.occupiesSeat())
            {
                out.push_back(t.id);
                break;
            }
    return out;
}

std::vector<std::string> JsonSnapshotStore::unseatedUserIds() const
{
    std::set<std::string> seated;
    for (const auto& t : tribes_)
        for (const auto& m : t.members)
            if (m.occupiesSeat())
                seated.insert(m.userId);

    std::vector<std::string> out;
    for (const auto& p : profiles_)
        if (!seated.count(p.id))
            out.push_back(p.id);
    return out;
}

} // namespace tribe::io
