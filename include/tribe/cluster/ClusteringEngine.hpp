#pragma once

#include "tribe/match/CompatibilityEngine.hpp"
#include "tribe/model/Compatibility.hpp"
#include "tribe/model/Profile.hpp"

#include <cstddef>
#include <vector>

namespace tribe {

inline constexpr int kMaxSwapRounds = 5;

struct ClusteringOptions
{
    int           minGroupSize           = 4;
    int           maxGroupSize           = 8;
    double        maxDistanceMiles       = 25.0;
    double        compatibilityThreshold = 0.70; // 0..1, pairwise
    FactorWeights weights;
};

struct NewTribe
{
    std::vector<MemberScore> members;
    // Set on a remainder that could not be brought within size bounds. Two
    // provisional tribes never lie within range of each other while still
    // fitting into one tribe.
    bool provisional = false;
};

using IndexGroup = std::vector<std::size_t>;

// Partitions a pool of unassigned users into candidate tribes:
//   1. proximity grouping (greedy, input order)
//   2. personality refinement of oversized groups, size repair
//   3. interest cohesion swaps
//   4. trait balance swaps
//   5. per-member scoring
class ClusteringEngine
{
public:
    explicit ClusteringEngine(const CompatibilityEngine& engine) : engine_(engine) {}

    std::vector<NewTribe> formGroups(const std::vector<Profile>& users, const ClusteringOptions& options) const;

    // Stage 1. Each user joins the first group whose every member lies within
    // maxDistanceMiles, otherwise opens a new group. Order-sensitive.
    static std::vector<IndexGroup> ProximityGroups(const std::vector<Profile>& users, double maxDistanceMiles);

    // Mean pairwise interest Jaccard; groups of 0 or 1 member score 1.
    static double InterestCohesion(const std::vector<const Profile*>& group);

    // Population variance of the group's per-trait means (traits present only).
    static double TraitVariance(const std::vector<const Profile*>& group);

    // Group sizes for pooling n users: all within [min,max] when possible,
    // otherwise max-sized chunks plus one smaller remainder.
    static std::vector<int> PartitionSizes(int n, int minSize, int maxSize);

    // Stages 3 and 4. Up to kMaxSwapRounds rounds; each round commits the
    // first single-member swap between two groups larger than minGroupSize
    // that strictly improves the pair's objective and keeps both moved
    // members within maxDistanceMiles of their new group. Returns the number
    // of committed swaps. Interest swaps maximize InterestCohesion, balance
    // swaps minimize TraitVariance.
    static int InterestSwaps(std::vector<IndexGroup>& groups, const std::vector<Profile>& users,
                             const ClusteringOptions& options);
    static int BalanceSwaps(std::vector<IndexGroup>& groups, const std::vector<Profile>& users,
                            const ClusteringOptions& options);

private:
    const CompatibilityEngine& engine_;
};

} // namespace tribe
