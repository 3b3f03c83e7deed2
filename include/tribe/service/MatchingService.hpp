#pragma once

#include "tribe/core/Config.hpp"
#include "tribe/formation/TribeFormation.hpp"
#include "tribe/match/CompatibilityEngine.hpp"
#include "tribe/service/CompatibilityCache.hpp"
#include "tribe/service/ProfileStore.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tribe {

enum class ItemStatus
{
    Ok,
    NotFound,
    Skipped, // duplicate, self-reference or beyond maxBatchSize
};

std::string_view ToString(ItemStatus s) noexcept;

struct ItemResult
{
    std::string id;
    ItemStatus  status = ItemStatus::Ok;
};

struct RankedUser
{
    std::string       userId;
    double            score = 0.0;
    UserCompatibility detail;
};

struct RankedTribe
{
    std::string        tribeId;
    double             score = 0.0;
    TribeCompatibility detail;
};

// Best first; statuses follow request order.
template <typename Entry>
struct RankedList
{
    std::vector<Entry>      entries;
    std::vector<ItemResult> statuses;
};

inline constexpr std::size_t kDefaultSuggestionLimit = 10;

struct FormationReport
{
    FormationResult         result;
    std::vector<ItemResult> statuses;
    bool                    published = false;
};

// Collaborator-facing entry points: resolves ids through the profile store,
// caches pair scores, and publishes formation results.
class MatchingService
{
public:
    MatchingService(const IProfileStore& store,
                    MatchingConfig config,
                    std::shared_ptr<IScoringAdvisor> advisor = nullptr,
                    IAssignmentSink* sink = nullptr,
                    jobs::JobSystem* jobs = nullptr);

    const MatchingConfig& config() const noexcept { return config_; }
    const CompatibilityEngine& engine() const noexcept { return engine_; }

    // Throws NotFoundError if userId itself is unknown.
    RankedList<RankedUser> scoreUsers(const std::string& userId,
                                      const std::vector<std::string>& candidateIds,
                                      const std::optional<FactorWeights>& weights = std::nullopt);

    RankedList<RankedTribe> scoreTribes(const std::string& userId,
                                        const std::vector<std::string>& candidateTribeIds,
                                        const std::optional<FactorWeights>& weights = std::nullopt);

    // Stored profiles scoring at least compatibilityThreshold x 100 against
    // userId, best first, at most limit. Throws NotFoundError if userId is unknown.
    std::vector<RankedUser> suggestUsers(const std::string& userId,
                                         std::size_t limit = kDefaultSuggestionLimit,
                                         const std::optional<FactorWeights>& weights = std::nullopt) const;

    // Same for tribes with a free seat, skipping tribes the user already sits in.
    std::vector<RankedTribe> suggestTribes(const std::string& userId,
                                           std::size_t limit = kDefaultSuggestionLimit,
                                           const std::optional<std::string>& region = std::nullopt,
                                           const std::optional<FactorWeights>& weights = std::nullopt) const;

    FormationReport formTribes(const std::vector<std::string>& userIds,
                               const std::optional<std::string>& region = std::nullopt,
                               const std::optional<FormationOptions>& options = std::nullopt);

    // Drops cached scores that mention the id (user or tribe).
    void invalidate(const std::string& id);

private:
    // Request ids trimmed to maxBatchSize with duplicates marked Skipped.
    std::vector<std::string> admit(const std::vector<std::string>& ids,
                                   std::vector<ItemResult>& statuses,
                                   const std::string& self) const;

    void publish(FormationReport& report);

    const IProfileStore&          store_;
    MatchingConfig                config_;
    IAssignmentSink*              sink_ = nullptr;
    CompatibilityEngine           engine_;
    TribeFormation                formation_;
    TtlCache<UserCompatibility>   userCache_;
    TtlCache<TribeCompatibility>  tribeCache_;
};

} // namespace tribe
