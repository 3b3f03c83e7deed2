#pragma once

#include "tribe/cluster/ClusteringEngine.hpp"
#include "tribe/match/Advisor.hpp"
#include "tribe/match/CompatibilityEngine.hpp"
#include "tribe/model/Activity.hpp"
#include "tribe/model/Tribe.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tribe {

struct MatchingConfig;

struct FormationOptions
{
    int           minGroupSize           = 4;
    int           maxGroupSize           = 8;
    double        maxDistanceMiles       = 25.0;
    double        compatibilityThreshold = 0.70; // 0..1; compared against score / 100
    FactorWeights weights;
    bool          requestAdvice          = true;

    static FormationOptions FromConfig(const MatchingConfig& cfg);

    // Same repairs as the config loader; returns the number of fixes.
    int Validate();

    ClusteringOptions clustering() const;
};

struct ExistingAssignment
{
    std::string userId;
    std::string tribeId;
    double      score = 0.0;
};

struct AdvisoryNote
{
    std::string                    insights;
    std::vector<AdvisorSuggestion> suggestions;
};

struct FormationResult
{
    // In assignment order (best score first before optimization swaps).
    std::vector<ExistingAssignment> existingAssignments;
    std::vector<NewTribe>           newTribes;
    std::optional<AdvisoryNote>     advisory;
    int                             optimizationSwaps = 0;

    const ExistingAssignment* findAssignment(const std::string& userId) const;
};

// Places users into existing tribes with spare seats, clusters the rest
// into new tribes, then runs a bounded swap pass over the placements.
class TribeFormation
{
public:
    explicit TribeFormation(const CompatibilityEngine& engine,
                            std::shared_ptr<IScoringAdvisor> advisor = nullptr);

    FormationResult formTribes(const std::vector<Profile>& users,
                               const std::vector<Tribe>& existingTribes,
                               const ProfileIndex& memberProfiles,
                               FormationOptions options = {}) const;

    // Throws InvariantViolation on capacity overflow, an oversized or
    // unflagged undersized group, two provisional remainders that fit
    // together within range, or users lost/duplicated.
    static void VerifyInvariants(const FormationResult& result,
                                 const std::vector<Profile>& users,
                                 const std::vector<Tribe>& existingTribes,
                                 const FormationOptions& options);

    // "1. Move alice from t1 to t2 - reason" lines.
    static std::vector<AdvisorSuggestion> ParseAdjustments(const std::string& text);
    static std::string ParseInsights(const std::string& text);

    // Score (0..100) of userId placed in tribeId while vacatingUserId leaves it.
    using PlacementScore = std::function<double(const std::string& userId, const std::string& tribeId,
                                                const std::string& vacatingUserId)>;

    // Up to kMaxSwapRounds rounds over pairs of assignments in different
    // tribes; each round commits the first swap whose summed score strictly
    // exceeds the current sum. A pair of users is evaluated at most once.
    // Returns the number of committed swaps.
    static int OptimizeAssignments(std::vector<ExistingAssignment>& assignments, const PlacementScore& score);

private:
    std::optional<AdvisoryNote> requestAdvice(const FormationResult& result) const;

    const CompatibilityEngine&   engine_;
    ClusteringEngine             clustering_;
    std::unique_ptr<AdvisorGate> advisor_;
};

} // namespace tribe
