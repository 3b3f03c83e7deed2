#include "tribe/cluster/ClusteringEngine.hpp"

#include "tribe/geo/GeoMath.hpp"
#include "tribe/jobs/JobSystem.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace tribe {

namespace {

constexpr double kEpsilon = 1e-9;
constexpr std::size_t kNone = std::numeric_limits<std::size_t>::max();

// Symmetric pairwise compatibility on a 0..1 scale, filled on demand.
class PairScores
{
public:
    PairScores(const CompatibilityEngine& engine, const std::vector<Profile>& users, const FactorWeights& weights)
        : engine_(engine)
        , users_(users)
        , weights_(weights)
        , n_(users.size())
        , values_(n_ * n_, kUnknown)
    {}

    double get(std::size_t a, std::size_t b)
    {
        if (a == b)
            return 1.0;
        double& v = values_[slot(a, b)];
        if (v < 0.0)
            v = compute(a, b);
        return v;
    }

    // Scores every unknown pair inside each group on the worker pool.
    void prefill(const std::vector<IndexGroup>& groups)
    {
        std::vector<std::pair<std::size_t, std::size_t>> pending;
        for (const auto& g : groups)
            for (std::size_t i = 0; i < g.size(); ++i)
                for (std::size_t j = i + 1; j < g.size(); ++j)
                    if (values_[slot(g[i], g[j])] < 0.0)
                        pending.emplace_back(g[i], g[j]);

        engine_.jobs().ParallelForIndex(std::size_t{0}, pending.size(), std::size_t{1}, [&](std::size_t k) {
            values_[slot(pending[k].first, pending[k].second)] = compute(pending[k].first, pending[k].second);
        });
    }

private:
    static constexpr double kUnknown = -1.0;

    std::size_t slot(std::size_t a, std::size_t b) const noexcept
    {
        return std::min(a, b) * n_ + std::max(a, b);
    }

    double compute(std::size_t a, std::size_t b) const
    {
        const std::size_t lo = std::min(a, b);
        const std::size_t hi = std::max(a, b);
        return engine_.userCompatibility(users_[lo], users_[hi], weights_).overall / 100.0;
    }

    const CompatibilityEngine&  engine_;
    const std::vector<Profile>& users_;
    FactorWeights               weights_;
    std::size_t                 n_;
    std::vector<double>         values_;
};

struct Group
{
    IndexGroup members;
    int        region      = -1; // proximity group index, -1 once pooled
    bool       provisional = false;

    int size() const noexcept { return static_cast<int>(members.size()); }
};

bool AllCompatible(PairScores& scores, const IndexGroup& a, const IndexGroup& b, double threshold)
{
    for (std::size_t x : a)
        for (std::size_t y : b)
            if (scores.get(x, y) < threshold)
                return false;
    return true;
}

bool WithinRange(const std::vector<Profile>& users, std::size_t x, const IndexGroup& group,
                 double maxMiles, std::size_t skip = kNone)
{
    for (std::size_t m : group)
    {
        if (m == skip || m == x)
            continue;
        if (geo::DistanceMiles(users[x].coordinates, users[m].coordinates) > maxMiles)
            return false;
    }
    return true;
}

bool AllWithinRange(const std::vector<Profile>& users, const IndexGroup& a, const IndexGroup& b, double maxMiles)
{
    for (std::size_t x : a)
        if (!WithinRange(users, x, b, maxMiles))
            return false;
    return true;
}

double AverageCompat(PairScores& scores, std::size_t x, const IndexGroup& group)
{
    double sum = 0.0;
    int n = 0;
    for (std::size_t m : group)
    {
        if (m == x)
            continue;
        sum += scores.get(x, m);
        ++n;
    }
    return n > 0 ? sum / n : 0.0;
}

std::vector<const Profile*> Resolve(const std::vector<Profile>& users, const IndexGroup& g)
{
    std::vector<const Profile*> out;
    out.reserve(g.size());
    for (std::size_t i : g)
        out.push_back(&users[i]);
    return out;
}

// Seed-and-grow split of an oversized proximity group.
std::vector<IndexGroup> RefineOversized(const IndexGroup& region, const ClusteringOptions& opt, PairScores& scores)
{
    const std::size_t minSize = static_cast<std::size_t>(opt.minGroupSize);
    const std::size_t maxSize = static_cast<std::size_t>(opt.maxGroupSize);
    const double threshold = opt.compatibilityThreshold;

    IndexGroup remaining = region;
    std::vector<IndexGroup> refined;
    std::vector<IndexGroup> tooSmall;

    while (!remaining.empty())
    {
        IndexGroup sub{remaining.front()};
        remaining.erase(remaining.begin());

        for (std::size_t k = remaining.size(); k-- > 0 && sub.size() < maxSize;)
        {
            const std::size_t cand = remaining[k];
            if (AllCompatible(scores, {cand}, sub, threshold))
            {
                sub.push_back(cand);
                remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(k));
            }
        }

        if (sub.size() >= minSize)
        {
            refined.push_back(std::move(sub));
            continue;
        }

        bool merged = false;
        for (auto& g : refined)
        {
            if (g.size() + sub.size() <= maxSize && AllCompatible(scores, sub, g, threshold))
            {
                g.insert(g.end(), sub.begin(), sub.end());
                merged = true;
                break;
            }
        }
        if (!merged)
            tooSmall.push_back(std::move(sub));
    }

    // Second pass: undersized subgroups against each other.
    while (tooSmall.size() > 1)
    {
        IndexGroup cur = std::move(tooSmall.front());
        tooSmall.erase(tooSmall.begin());

        for (std::size_t j = 0; j < tooSmall.size(); ++j)
        {
            const std::size_t combined = cur.size() + tooSmall[j].size();
            if (combined >= minSize && combined <= maxSize && AllCompatible(scores, cur, tooSmall[j], threshold))
            {
                cur.insert(cur.end(), tooSmall[j].begin(), tooSmall[j].end());
                tooSmall.erase(tooSmall.begin() + static_cast<std::ptrdiff_t>(j));
                break;
            }
        }
        // Unmerged subgroups stay undersized; size repair handles them.
        refined.push_back(std::move(cur));
    }
    if (!tooSmall.empty())
        refined.push_back(std::move(tooSmall.front()));

    return refined;
}

// Brings undersized groups of one proximity region within bounds using
// only the region's users.
void RepairRegion(std::vector<Group>& groups, int region, const ClusteringOptions& opt, PairScores& scores)
{
    const int minSize = opt.minGroupSize;
    const int maxSize = opt.maxGroupSize;

    auto inRegion = [&](const Group& g) { return g.region == region && !g.members.empty(); };

    bool changed = true;
    while (changed)
    {
        changed = false;
        for (std::size_t u = 0; u < groups.size() && !changed; ++u)
        {
            Group& small = groups[u];
            if (!inRegion(small) || small.size() >= minSize)
                continue;

            // Another undersized group of the region that fits alongside.
            for (std::size_t v = 0; v < groups.size(); ++v)
            {
                if (v == u || !inRegion(groups[v]) || groups[v].size() >= minSize)
                    continue;
                if (small.size() + groups[v].size() <= maxSize)
                {
                    small.members.insert(small.members.end(), groups[v].members.begin(), groups[v].members.end());
                    groups[v].members.clear();
                    changed = true;
                    break;
                }
            }
            if (changed)
                break;

            // Dissolve into region groups with spare seats.
            int spare = 0;
            for (std::size_t v = 0; v < groups.size(); ++v)
                if (v != u && inRegion(groups[v]) && groups[v].size() >= minSize)
                    spare += maxSize - groups[v].size();

            if (spare >= small.size())
            {
                for (std::size_t x : small.members)
                {
                    std::size_t best = kNone;
                    double bestScore = -1.0;
                    for (std::size_t v = 0; v < groups.size(); ++v)
                    {
                        if (v == u || !inRegion(groups[v]) || groups[v].size() < minSize || groups[v].size() >= maxSize)
                            continue;
                        const double s = AverageCompat(scores, x, groups[v].members);
                        if (s > bestScore)
                        {
                            bestScore = s;
                            best = v;
                        }
                    }
                    groups[best].members.push_back(x);
                }
                small.members.clear();
                changed = true;
                break;
            }

            // Fill from region groups above the minimum.
            const int need = minSize - small.size();
            int surplus = 0;
            for (std::size_t v = 0; v < groups.size(); ++v)
                if (v != u && inRegion(groups[v]) && groups[v].size() > minSize)
                    surplus += groups[v].size() - minSize;

            if (surplus >= need)
            {
                while (small.size() < minSize)
                {
                    std::size_t donor = kNone;
                    std::size_t pick = 0;
                    double bestScore = -1.0;
                    for (std::size_t v = 0; v < groups.size(); ++v)
                    {
                        if (v == u || !inRegion(groups[v]) || groups[v].size() <= minSize)
                            continue;
                        for (std::size_t k = 0; k < groups[v].members.size(); ++k)
                        {
                            const double s = AverageCompat(scores, groups[v].members[k], small.members);
                            if (s > bestScore)
                            {
                                bestScore = s;
                                donor = v;
                                pick = k;
                            }
                        }
                    }
                    auto& from = groups[donor].members;
                    small.members.push_back(from[pick]);
                    from.erase(from.begin() + static_cast<std::ptrdiff_t>(pick));
                }
                changed = true;
            }
        }
    }
}

// Greedy proximity grouping over a subset of users, in subset order.
std::vector<IndexGroup> ProximityGroupsOf(const std::vector<Profile>& users, const IndexGroup& subset, double maxMiles)
{
    std::vector<IndexGroup> groups;
    for (std::size_t x : subset)
    {
        bool placed = false;
        for (auto& g : groups)
        {
            if (WithinRange(users, x, g, maxMiles))
            {
                g.push_back(x);
                placed = true;
                break;
            }
        }
        if (!placed)
            groups.push_back({x});
    }
    return groups;
}

// Merges pairs of undersized groups that fit together and lie within range.
void MergeWithinRange(std::vector<Group>& groups, const std::vector<Profile>& users, const ClusteringOptions& opt)
{
    auto undersized = [&](const Group& g) { return !g.members.empty() && g.size() < opt.minGroupSize; };

    for (std::size_t u = 0; u < groups.size(); ++u)
    {
        if (!undersized(groups[u]))
            continue;
        for (std::size_t v = u + 1; v < groups.size(); ++v)
        {
            if (!undersized(groups[v]) || groups[u].size() + groups[v].size() > opt.maxGroupSize)
                continue;
            if (!AllWithinRange(users, groups[u].members, groups[v].members, opt.maxDistanceMiles))
                continue;
            groups[u].members.insert(groups[u].members.end(), groups[v].members.begin(), groups[v].members.end());
            groups[u].provisional = groups[u].provisional || groups[v].provisional;
            groups[v].members.clear();
            if (!undersized(groups[u]))
                break;
        }
    }
}

// Leftovers after regional repair: absorb within range, merge within range,
// then pool what is left per proximity group. Users out of range of each
// other never share a pool; every undersized remainder is provisional.
void RepairLeftovers(std::vector<Group>& groups, const std::vector<Profile>& users,
                     const ClusteringOptions& opt, PairScores& scores)
{
    const int minSize = opt.minGroupSize;
    const int maxSize = opt.maxGroupSize;
    const double maxMiles = opt.maxDistanceMiles;

    auto undersized = [&](const Group& g) { return !g.members.empty() && g.size() < minSize; };

    for (std::size_t u = 0; u < groups.size(); ++u)
    {
        if (!undersized(groups[u]))
            continue;

        IndexGroup keep;
        for (std::size_t x : groups[u].members)
        {
            std::size_t best = kNone;
            double bestScore = -1.0;
            for (std::size_t v = 0; v < groups.size(); ++v)
            {
                if (v == u || groups[v].size() < minSize || groups[v].size() >= maxSize)
                    continue;
                if (!WithinRange(users, x, groups[v].members, maxMiles))
                    continue;
                const double s = AverageCompat(scores, x, groups[v].members);
                if (s > bestScore)
                {
                    bestScore = s;
                    best = v;
                }
            }
            if (best == kNone)
                keep.push_back(x);
            else
                groups[best].members.push_back(x);
        }
        groups[u].members = std::move(keep);
    }

    MergeWithinRange(groups, users, opt);

    std::vector<std::size_t> leftovers;
    for (std::size_t u = 0; u < groups.size(); ++u)
        if (undersized(groups[u]))
            leftovers.push_back(u);

    if (leftovers.empty())
        return;
    if (leftovers.size() == 1)
    {
        groups[leftovers.front()].provisional = true;
        return;
    }

    IndexGroup stranded;
    for (std::size_t u : leftovers)
    {
        stranded.insert(stranded.end(), groups[u].members.begin(), groups[u].members.end());
        groups[u].members.clear();
    }

    const std::vector<IndexGroup> pools = ProximityGroupsOf(users, stranded, maxMiles);
    spdlog::info("clustering: pooling {} users from {} isolated groups into {} proximity pools",
                 stranded.size(), leftovers.size(), pools.size());

    for (const IndexGroup& pool : pools)
    {
        std::size_t offset = 0;
        for (int size : ClusteringEngine::PartitionSizes(static_cast<int>(pool.size()), minSize, maxSize))
        {
            Group g;
            g.members.assign(pool.begin() + static_cast<std::ptrdiff_t>(offset),
                             pool.begin() + static_cast<std::ptrdiff_t>(offset + static_cast<std::size_t>(size)));
            g.provisional = true;
            offset += static_cast<std::size_t>(size);
            groups.push_back(std::move(g));
        }
    }

    // Remainders of different pools may still fit together.
    MergeWithinRange(groups, users, opt);
}

// Bounded hill-climbing over single member swaps. The first improving swap
// is committed and the round restarts.
template <typename Objective>
int SwapPass(std::vector<IndexGroup>& groups, const std::vector<Profile>& users,
             const ClusteringOptions& opt, Objective objective, bool maximize)
{
    int committed = 0;
    for (int round = 0; round < kMaxSwapRounds; ++round)
    {
        bool swapped = false;
        for (std::size_t i = 0; i < groups.size() && !swapped; ++i)
        {
            for (std::size_t j = i + 1; j < groups.size() && !swapped; ++j)
            {
                IndexGroup& gi = groups[i];
                IndexGroup& gj = groups[j];
                if (static_cast<int>(gi.size()) <= opt.minGroupSize || static_cast<int>(gj.size()) <= opt.minGroupSize)
                    continue;

                const double before = objective(gi) + objective(gj);

                for (std::size_t a = 0; a < gi.size() && !swapped; ++a)
                {
                    for (std::size_t b = 0; b < gj.size() && !swapped; ++b)
                    {
                        const std::size_t x = gi[a];
                        const std::size_t y = gj[b];
                        if (!WithinRange(users, x, gj, opt.maxDistanceMiles, y) ||
                            !WithinRange(users, y, gi, opt.maxDistanceMiles, x))
                            continue;

                        IndexGroup ni = gi;
                        IndexGroup nj = gj;
                        ni[a] = y;
                        nj[b] = x;

                        const double after = objective(ni) + objective(nj);
                        const bool better = maximize ? after > before + kEpsilon : after < before - kEpsilon;
                        if (better)
                        {
                            gi = std::move(ni);
                            gj = std::move(nj);
                            swapped = true;
                        }
                    }
                }
            }
        }
        if (!swapped)
            break;
        ++committed;
    }
    return committed;
}

} // namespace

std::vector<IndexGroup> ClusteringEngine::ProximityGroups(const std::vector<Profile>& users, double maxDistanceMiles)
{
    IndexGroup all(users.size());
    for (std::size_t i = 0; i < users.size(); ++i)
        all[i] = i;
    return ProximityGroupsOf(users, all, maxDistanceMiles);
}

double ClusteringEngine::InterestCohesion(const std::vector<const Profile*>& group)
{
    if (group.size() <= 1)
        return 1.0;

    double sum = 0.0;
    int pairs = 0;
    for (std::size_t i = 0; i < group.size(); ++i)
        for (std::size_t j = i + 1; j < group.size(); ++j)
        {
            sum += geo::InterestSimilarity(group[i]->interests, group[j]->interests);
            ++pairs;
        }
    return sum / pairs;
}

double ClusteringEngine::TraitVariance(const std::vector<const Profile*>& group)
{
    std::vector<double> means;
    for (std::size_t t = 0; t < kTraitCount; ++t)
    {
        const auto trait = static_cast<PersonalityTrait>(t);
        double sum = 0.0;
        int n = 0;
        for (const Profile* p : group)
        {
            if (const auto s = p->traitScore(trait))
            {
                sum += *s;
                ++n;
            }
        }
        if (n > 0)
            means.push_back(sum / n);
    }
    if (means.empty())
        return 0.0;

    double mean = 0.0;
    for (double m : means) mean += m;
    mean /= static_cast<double>(means.size());

    double var = 0.0;
    for (double m : means) var += (m - mean) * (m - mean);
    return var / static_cast<double>(means.size());
}

int ClusteringEngine::InterestSwaps(std::vector<IndexGroup>& groups, const std::vector<Profile>& users,
                                    const ClusteringOptions& options)
{
    return SwapPass(groups, users, options,
        [&](const IndexGroup& g) { return InterestCohesion(Resolve(users, g)); }, true);
}

int ClusteringEngine::BalanceSwaps(std::vector<IndexGroup>& groups, const std::vector<Profile>& users,
                                   const ClusteringOptions& options)
{
    return SwapPass(groups, users, options,
        [&](const IndexGroup& g) { return TraitVariance(Resolve(users, g)); }, false);
}

std::vector<int> ClusteringEngine::PartitionSizes(int n, int minSize, int maxSize)
{
    std::vector<int> sizes;
    if (n <= 0)
        return sizes;
    if (n < minSize || maxSize <= 0)
    {
        sizes.push_back(n);
        return sizes;
    }

    const int k = (n + maxSize - 1) / maxSize;
    if (n / k >= minSize)
    {
        for (int i = 0; i < k; ++i)
            sizes.push_back(n / k + (i < n % k ? 1 : 0));
        return sizes;
    }

    int left = n;
    while (left > 0)
    {
        const int take = std::min(left, maxSize);
        sizes.push_back(take);
        left -= take;
    }
    return sizes;
}

std::vector<NewTribe> ClusteringEngine::formGroups(const std::vector<Profile>& users, const ClusteringOptions& opt) const
{
    if (users.empty())
        return {};

    PairScores scores(engine_, users, opt.weights);

    const std::vector<IndexGroup> regions = ProximityGroups(users, opt.maxDistanceMiles);
    spdlog::debug("clustering: {} users in {} proximity groups", users.size(), regions.size());

    std::vector<Group> groups;
    for (std::size_t r = 0; r < regions.size(); ++r)
    {
        const int region = static_cast<int>(r);
        const int size = static_cast<int>(regions[r].size());
        if (size > opt.maxGroupSize)
        {
            scores.prefill({regions[r]});
            for (auto& sub : RefineOversized(regions[r], opt, scores))
                groups.push_back({std::move(sub), region, false});
        }
        else
        {
            groups.push_back({regions[r], region, false});
        }
    }

    for (std::size_t r = 0; r < regions.size(); ++r)
        RepairRegion(groups, static_cast<int>(r), opt, scores);
    RepairLeftovers(groups, users, opt, scores);

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const Group& g) { return g.members.empty(); }),
                 groups.end());

    // Swaps keep group sizes, so provisional flags stay with their slot.
    std::vector<IndexGroup> finals;
    finals.reserve(groups.size());
    for (const auto& g : groups)
        finals.push_back(g.members);

    const int interestSwaps = InterestSwaps(finals, users, opt);
    const int balanceSwaps = BalanceSwaps(finals, users, opt);
    spdlog::debug("clustering: {} interest swaps, {} balance swaps", interestSwaps, balanceSwaps);

    for (std::size_t i = 0; i < groups.size(); ++i)
        groups[i].members = finals[i];
    scores.prefill(finals);

    std::vector<NewTribe> out;
    out.reserve(groups.size());
    for (const auto& g : groups)
    {
        NewTribe tribe;
        tribe.provisional = g.provisional && g.size() < opt.minGroupSize;
        for (std::size_t x : g.members)
        {
            const double score = g.members.size() > 1 ? AverageCompat(scores, x, g.members) * 100.0 : 0.0;
            tribe.members.push_back({users[x].id, std::clamp(score, 0.0, 100.0)});
        }
        out.push_back(std::move(tribe));
    }
    return out;
}

} // namespace tribe
