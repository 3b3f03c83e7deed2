#include "tribe/formation/TribeFormation.hpp"

#include "tribe/core/Config.hpp"
#include "tribe/core/Errors.hpp"
#include "tribe/geo/GeoMath.hpp"
#include "tribe/jobs/JobSystem.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>

namespace tribe {

namespace {

constexpr double kEpsilon = 1e-9;

std::string Trim(std::string s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// FormationOptions
// ---------------------------------------------------------------------------

FormationOptions FormationOptions::FromConfig(const MatchingConfig& cfg)
{
    FormationOptions o;
    o.minGroupSize           = cfg.minGroupSize;
    o.maxGroupSize           = cfg.maxGroupSize;
    o.maxDistanceMiles       = cfg.maxDistanceMiles;
    o.compatibilityThreshold = cfg.compatibilityThreshold;
    o.weights                = cfg.weights;
    return o;
}

int FormationOptions::Validate()
{
    MatchingConfig cfg;
    cfg.minGroupSize           = minGroupSize;
    cfg.maxGroupSize           = maxGroupSize;
    cfg.maxDistanceMiles       = maxDistanceMiles;
    cfg.compatibilityThreshold = compatibilityThreshold;
    cfg.weights                = weights;

    const int fixes = Repair(cfg);

    minGroupSize           = cfg.minGroupSize;
    maxGroupSize           = cfg.maxGroupSize;
    maxDistanceMiles       = cfg.maxDistanceMiles;
    compatibilityThreshold = cfg.compatibilityThreshold;
    weights                = cfg.weights;
    return fixes;
}

ClusteringOptions FormationOptions::clustering() const
{
    ClusteringOptions c;
    c.minGroupSize           = minGroupSize;
    c.maxGroupSize           = maxGroupSize;
    c.maxDistanceMiles       = maxDistanceMiles;
    c.compatibilityThreshold = compatibilityThreshold;
    c.weights                = weights;
    return c;
}

const ExistingAssignment* FormationResult::findAssignment(const std::string& userId) const
{
    for (const auto& a : existingAssignments)
        if (a.userId == userId)
            return &a;
    return nullptr;
}

// ---------------------------------------------------------------------------
// TribeFormation
// ---------------------------------------------------------------------------

TribeFormation::TribeFormation(const CompatibilityEngine& engine, std::shared_ptr<IScoringAdvisor> advisor)
    : engine_(engine)
    , clustering_(engine)
    , advisor_(std::make_unique<AdvisorGate>(std::move(advisor), engine.settings().advisorTimeout))
{}

FormationResult TribeFormation::formTribes(const std::vector<Profile>& users,
                                           const std::vector<Tribe>& existingTribes,
                                           const ProfileIndex& memberProfiles,
                                           FormationOptions options) const
{
    if (const int fixes = options.Validate())
        spdlog::warn("formation: {} option(s) repaired", fixes);

    FormationResult result;

    // Tribes with a free seat, their seated member profiles and remaining seats.
    std::vector<const Tribe*> open;
    for (const auto& t : existingTribes)
        if (t.hasCapacity())
            open.push_back(&t);

    std::vector<std::vector<Profile>> seated;
    std::vector<int> capacity;
    seated.reserve(open.size());
    capacity.reserve(open.size());
    for (const Tribe* t : open)
    {
        seated.push_back(SeatedProfiles(*t, memberProfiles));
        capacity.push_back(t->spareSeats());
    }

    // Score every user against every open tribe.
    const std::size_t tribeCount = open.size();
    std::vector<double> scores(users.size() * tribeCount, 0.0);
    engine_.jobs().ParallelForIndex(std::size_t{0}, scores.size(), std::size_t{1}, [&](std::size_t k) {
        const std::size_t u = k / tribeCount;
        const std::size_t t = k % tribeCount;
        scores[k] = engine_.tribeCompatibility(users[u], *open[t], seated[t], options.weights).overall;
    });

    // Each user's open tribes, best first. Users are placed in order of
    // their best score, into the best tribe that still has a seat.
    struct Choice
    {
        std::size_t      user = 0;
        std::vector<int> tribes;
        double           best = -1.0;
    };
    std::vector<Choice> choices(users.size());
    for (std::size_t u = 0; u < users.size(); ++u)
    {
        Choice& c = choices[u];
        c.user = u;
        for (std::size_t t = 0; t < tribeCount; ++t)
            c.tribes.push_back(static_cast<int>(t));
        const double* row = scores.data() + u * tribeCount;
        std::stable_sort(c.tribes.begin(), c.tribes.end(), [row](int a, int b) { return row[a] > row[b]; });
        if (!c.tribes.empty())
            c.best = row[c.tribes.front()];
    }
    std::stable_sort(choices.begin(), choices.end(), [](const Choice& a, const Choice& b) { return a.best > b.best; });

    const double minScore = options.compatibilityThreshold * 100.0;
    std::vector<std::size_t> leftover;
    for (const Choice& c : choices)
    {
        bool placed = false;
        for (int t : c.tribes)
        {
            const double score = scores[c.user * tribeCount + static_cast<std::size_t>(t)];
            if (score < minScore)
                break;
            if (capacity[static_cast<std::size_t>(t)] > 0)
            {
                --capacity[static_cast<std::size_t>(t)];
                result.existingAssignments.push_back({users[c.user].id, open[static_cast<std::size_t>(t)]->id, score});
                placed = true;
                break;
            }
        }
        if (!placed)
            leftover.push_back(c.user);
    }

    // Clustering sees the leftover users in pool order.
    std::sort(leftover.begin(), leftover.end());
    std::vector<Profile> unassigned;
    unassigned.reserve(leftover.size());
    for (std::size_t u : leftover)
        unassigned.push_back(users[u]);

    spdlog::info("formation: {} users placed in existing tribes, {} left for clustering",
                 result.existingAssignments.size(), unassigned.size());

    std::unordered_map<std::string, std::size_t> userIndex;
    for (std::size_t i = 0; i < users.size(); ++i)
        userIndex.emplace(users[i].id, i);
    std::unordered_map<std::string, std::size_t> tribeIndex;
    for (std::size_t i = 0; i < open.size(); ++i)
        tribeIndex.emplace(open[i]->id, i);

    // Seated members of the target tribe, minus the user moving out of it.
    auto placementScore = [&](const std::string& userId, const std::string& tribeId, const std::string& vacating) {
        const std::size_t t = tribeIndex.at(tribeId);
        std::vector<Profile> members;
        members.reserve(seated[t].size());
        for (const auto& m : seated[t])
            if (m.id != vacating)
                members.push_back(m);
        return engine_.tribeCompatibility(users[userIndex.at(userId)], *open[t], members, options.weights).overall;
    };
    result.optimizationSwaps = OptimizeAssignments(result.existingAssignments, placementScore);

    result.newTribes = clustering_.formGroups(unassigned, options.clustering());
    spdlog::info("formation: {} new tribes formed", result.newTribes.size());

    if (options.requestAdvice && advisor_->enabled())
        result.advisory = requestAdvice(result);

    VerifyInvariants(result, users, existingTribes, options);
    return result;
}

int TribeFormation::OptimizeAssignments(std::vector<ExistingAssignment>& assignments, const PlacementScore& score)
{
    std::set<std::string> processed;
    int swaps = 0;
    for (int round = 0; round < kMaxSwapRounds; ++round)
    {
        bool swapped = false;
        for (std::size_t i = 0; i < assignments.size() && !swapped; ++i)
        {
            for (std::size_t j = i + 1; j < assignments.size() && !swapped; ++j)
            {
                ExistingAssignment& a = assignments[i];
                ExistingAssignment& b = assignments[j];
                if (a.tribeId == b.tribeId)
                    continue;

                const std::string key = a.userId + ":" + b.userId;
                if (!processed.insert(key).second)
                    continue;

                const double aInB = score(a.userId, b.tribeId, b.userId);
                const double bInA = score(b.userId, a.tribeId, a.userId);
                if (aInB + bInA > a.score + b.score + kEpsilon)
                {
                    spdlog::debug("formation: swap {} ({}) <-> {} ({}) {:.1f} -> {:.1f}",
                                  a.userId, a.tribeId, b.userId, b.tribeId, a.score + b.score, aInB + bInA);
                    std::swap(a.tribeId, b.tribeId);
                    a.score = aInB;
                    b.score = bInA;
                    swapped = true;
                }
            }
        }
        if (!swapped)
            break;
        ++swaps;
    }
    return swaps;
}

std::optional<AdvisoryNote> TribeFormation::requestAdvice(const FormationResult& result) const
{
    std::ostringstream oss;
    oss << "Review these tribe assignments and suggest improvements.\n";
    oss << "Existing tribe placements:\n";
    for (const auto& a : result.existingAssignments)
        oss << "  " << a.userId << " -> " << a.tribeId << " (" << static_cast<int>(a.score) << ")\n";
    oss << "New tribes:\n";
    for (std::size_t i = 0; i < result.newTribes.size(); ++i)
    {
        oss << "  new-" << (i + 1) << ":";
        for (const auto& m : result.newTribes[i].members)
            oss << " " << m.userId << "(" << static_cast<int>(m.score) << ")";
        oss << "\n";
    }
    oss << "Answer in the form:\nINSIGHTS: <one paragraph>\nADJUSTMENTS:\n"
           "1. Move <userId> from <tribeId> to <tribeId> - <reason>\n";

    const auto text = advisor_->ask(oss.str());
    if (!text)
        return std::nullopt;

    AdvisoryNote note;
    note.insights = ParseInsights(*text);
    note.suggestions = ParseAdjustments(*text);

    if (!note.insights.empty())
        spdlog::info("advisor insights: {}", note.insights);
    for (const auto& s : note.suggestions)
        spdlog::info("advisor suggests moving {} from {} to {}: {}", s.userId, s.fromTribe, s.toTribe, s.reason);
    return note;
}

std::vector<AdvisorSuggestion> TribeFormation::ParseAdjustments(const std::string& text)
{
    static const std::regex kLine(R"(\d+\.\s*Move\s+(\S+)\s+from\s+(\S+)\s+to\s+(\S+)\s*-\s*(.+))",
                                  std::regex::icase);

    std::vector<AdvisorSuggestion> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::smatch m;
        if (std::regex_search(line, m, kLine))
            out.push_back({m[1].str(), m[2].str(), m[3].str(), Trim(m[4].str())});
    }
    return out;
}

std::string TribeFormation::ParseInsights(const std::string& text)
{
    const auto start = text.find("INSIGHTS:");
    if (start == std::string::npos)
        return {};
    const auto begin = start + 9;
    const auto end = text.find("ADJUSTMENTS:", begin);
    return Trim(text.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
}

void TribeFormation::VerifyInvariants(const FormationResult& result,
                                      const std::vector<Profile>& users,
                                      const std::vector<Tribe>& existingTribes,
                                      const FormationOptions& options)
{
    std::map<std::string, int> spare;
    for (const auto& t : existingTribes)
        spare[t.id] = t.spareSeats();

    std::multiset<std::string> seen;
    for (const auto& a : result.existingAssignments)
    {
        const auto it = spare.find(a.tribeId);
        if (it == spare.end())
            throw InvariantViolation("assignment to unknown tribe " + a.tribeId);
        if (--it->second < 0)
            throw InvariantViolation("tribe " + a.tribeId + " assigned beyond its capacity");
        seen.insert(a.userId);
    }

    std::unordered_map<std::string, const Profile*> byId;
    for (const auto& u : users)
        byId.emplace(u.id, &u);

    std::vector<const NewTribe*> undersized;
    for (const auto& g : result.newTribes)
    {
        const int size = static_cast<int>(g.members.size());
        if (size == 0 || size > options.maxGroupSize)
            throw InvariantViolation("new tribe of size " + std::to_string(size) + " outside bounds");
        if (size < options.minGroupSize)
        {
            if (!g.provisional)
                throw InvariantViolation("undersized new tribe of size " + std::to_string(size));
            undersized.push_back(&g);
        }
        for (const auto& m : g.members)
            seen.insert(m.userId);
    }

    // Two remainders that fit together and lie within range should have been merged.
    auto withinRange = [&](const NewTribe& a, const NewTribe& b) {
        for (const auto& x : a.members)
            for (const auto& y : b.members)
            {
                const auto px = byId.find(x.userId);
                const auto py = byId.find(y.userId);
                if (px == byId.end() || py == byId.end())
                    return false;
                if (geo::DistanceMiles(px->second->coordinates, py->second->coordinates) > options.maxDistanceMiles)
                    return false;
            }
        return true;
    };
    for (std::size_t i = 0; i < undersized.size(); ++i)
        for (std::size_t j = i + 1; j < undersized.size(); ++j)
        {
            const std::size_t combined = undersized[i]->members.size() + undersized[j]->members.size();
            if (combined <= static_cast<std::size_t>(options.maxGroupSize) && withinRange(*undersized[i], *undersized[j]))
                throw InvariantViolation("mergeable provisional tribes left apart");
        }

    std::multiset<std::string> expected;
    for (const auto& u : users)
        expected.insert(u.id);
    if (seen != expected)
        throw InvariantViolation("formation output does not cover the input users exactly once");
}

} // namespace tribe
