#pragma once

#include "tribe/match/Advisor.hpp"
#include "tribe/model/Compatibility.hpp"
#include "tribe/model/Profile.hpp"
#include "tribe/model/Tribe.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tribe::jobs { class JobSystem; }

namespace tribe {

// Member profiles keyed by user id.
using ProfileIndex = std::unordered_map<std::string, Profile>;

inline constexpr double kAlgorithmicBlend = 0.7;
inline constexpr double kAdvisorBlend     = 0.3;
inline constexpr double kBalanceScale     = 50.0;
inline constexpr double kComplementaryAt  = 70.0;
inline constexpr double kConflictingAt    = 40.0;
inline constexpr double kPrimaryBonus     = 20.0;

struct EngineSettings
{
    double                    maxDistanceMiles = 25.0;
    std::chrono::milliseconds advisorTimeout{2000};
};

// Five-factor compatibility scoring. The factor functions are pure; the
// composite calls add an optional advisor blend and a parallel fan-out for
// the batch queries.
class CompatibilityEngine
{
public:
    CompatibilityEngine();
    explicit CompatibilityEngine(EngineSettings settings,
                                 std::shared_ptr<IScoringAdvisor> advisor = nullptr,
                                 jobs::JobSystem* jobs = nullptr);

    const EngineSettings& settings() const noexcept { return settings_; }

    static PersonalityResult   Personality(const std::vector<TraitScore>& a, const std::vector<TraitScore>& b);
    static InterestResult      Interests(const std::vector<Interest>& a, const std::vector<Interest>& b);
    static CommunicationResult Communication(CommunicationStyle a, CommunicationStyle b) noexcept;
    static LocationResult      Location(const Coordinates& a, const Coordinates& b, double maxDistanceMiles) noexcept;
    static BalanceResult       GroupBalance(const std::vector<TraitScore>& candidate,
                                            const std::vector<std::vector<TraitScore>>& members);

    // Raw matrix lookup, 0..1.
    static double StyleMatrix(CommunicationStyle a, CommunicationStyle b) noexcept;
    static bool   IsComplementaryStyle(CommunicationStyle a, CommunicationStyle b) noexcept;

    UserCompatibility userCompatibility(const Profile& a, const Profile& b,
                                        const FactorWeights& weights = {}) const;

    TribeCompatibility tribeCompatibility(const Profile& user, const Tribe& tribe,
                                          const std::vector<Profile>& members,
                                          const FactorWeights& weights = {}) const;

    // Candidates scoring >= minScore, best first, ties in pool order; the
    // user itself is skipped.
    std::vector<UserCompatibility> findMostCompatibleUsers(const Profile& user,
                                                           const std::vector<Profile>& pool,
                                                           const FactorWeights& weights = {},
                                                           std::size_t limit = 10,
                                                           double minScore = 70.0) const;

    std::vector<TribeCompatibility> findMostCompatibleTribes(const Profile& user,
                                                             const std::vector<Tribe>& tribes,
                                                             const ProfileIndex& memberProfiles,
                                                             const FactorWeights& weights = {},
                                                             std::size_t limit = 10,
                                                             double minScore = 70.0) const;

    jobs::JobSystem& jobs() const noexcept { return *jobs_; }

private:
    std::string buildAdvisorPrompt(const Profile& a, const Profile& b, double algorithmic) const;

    EngineSettings               settings_;
    std::unique_ptr<AdvisorGate> advisor_;
    jobs::JobSystem*             jobs_ = nullptr;
};

// Seated members of a tribe that have a profile in the index.
std::vector<Profile> SeatedProfiles(const Tribe& tribe, const ProfileIndex& index);

} // namespace tribe
