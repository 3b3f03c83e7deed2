#include "tribe/match/CompatibilityEngine.hpp"

#include "tribe/geo/GeoMath.hpp"
#include "tribe/jobs/JobSystem.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <sstream>

namespace tribe {

namespace {

constexpr double kTraitWeight = 1.0 / static_cast<double>(kTraitCount);

// Similarity traits are scaled by these; extraversion is scored as a
// complementary pairing instead and ignores its entry.
constexpr std::array<double, kTraitCount> kTraitBase{
    1.00, // openness
    0.95, // conscientiousness
    1.00, // extraversion (unused)
    1.00, // agreeableness
    0.95, // neuroticism
};

// Rows/cols: direct, thoughtful, expressive, supportive, analytical.
constexpr std::array<std::array<double, kStyleCount>, kStyleCount> kStyleMatrix{{
    {0.9, 0.6, 0.7, 0.5, 0.8},
    {0.6, 0.9, 0.5, 0.8, 0.7},
    {0.7, 0.5, 0.9, 0.7, 0.4},
    {0.5, 0.8, 0.7, 0.9, 0.6},
    {0.8, 0.7, 0.4, 0.6, 0.9},
}};

constexpr std::size_t Index(PersonalityTrait t) noexcept { return static_cast<std::size_t>(t); }
constexpr std::size_t Index(CommunicationStyle s) noexcept { return static_cast<std::size_t>(s); }

double Clamp100(double v) noexcept
{
    if (!std::isfinite(v))
        return 0.0;
    return std::clamp(v, 0.0, 100.0);
}

std::optional<double> FindTrait(const std::vector<TraitScore>& traits, PersonalityTrait t) noexcept
{
    for (const auto& ts : traits)
        if (ts.trait == t)
            return ts.score;
    return std::nullopt;
}

double PopulationStdDev(const std::array<double, kTraitCount>& v) noexcept
{
    double mean = 0.0;
    for (double x : v) mean += x;
    mean /= static_cast<double>(v.size());

    double var = 0.0;
    for (double x : v) var += (x - mean) * (x - mean);
    var /= static_cast<double>(v.size());
    return std::sqrt(var);
}

std::string JoinTraits(const std::vector<PersonalityTrait>& traits)
{
    std::string out;
    for (std::size_t i = 0; i < traits.size(); ++i)
    {
        if (i) out += ", ";
        out += ToString(traits[i]);
    }
    return out;
}

std::string DescribePersonality(const PersonalityResult& p)
{
    std::string s = fmt::format("Personality compatibility: {:.0f}%.", p.overall);
    if (!p.complementary.empty())
        s += " Complementary traits: " + JoinTraits(p.complementary) + ".";
    if (!p.conflicting.empty())
        s += " Potential conflicts in: " + JoinTraits(p.conflicting) + ".";
    return s;
}

std::string DescribeInterests(const InterestResult& r)
{
    if (r.shared.empty())
        return "No shared interests.";

    std::string s = "Shared interests: ";
    const std::size_t shown = std::min<std::size_t>(r.shared.size(), 5);
    for (std::size_t i = 0; i < shown; ++i)
    {
        if (i) s += ", ";
        s += r.shared[i];
    }
    if (r.shared.size() > shown)
        s += fmt::format(" and {} more", r.shared.size() - shown);
    s += ".";
    if (r.primaryMatch)
        s += " Primary interests align.";
    return s;
}

std::string DescribeCommunication(CommunicationStyle a, CommunicationStyle b, const CommunicationResult& r)
{
    if (r.match)
        return fmt::format("Same communication style ({}).", ToString(a));
    if (r.complementary)
        return fmt::format("Complementary communication styles ({} and {}).", ToString(a), ToString(b));
    return fmt::format("Communication styles {} and {}: {:.0f}% compatible.", ToString(a), ToString(b), r.overall);
}

std::string DescribeLocation(const LocationResult& r, double maxMiles)
{
    return fmt::format("{:.1f} miles apart ({} the {:.0f} mile range).",
                       r.distanceMiles, r.withinRange ? "within" : "outside", maxMiles);
}

std::string DescribeBalance(const BalanceResult& b)
{
    if (b.improves)
        return fmt::format("Joining evens out the group's trait profile (impact {:.1f}).", b.impact);
    return fmt::format("Joining skews the group's trait profile (impact {:.1f}).", b.impact);
}

std::vector<std::vector<TraitScore>> TraitLists(const std::vector<Profile>& members)
{
    std::vector<std::vector<TraitScore>> out;
    out.reserve(members.size());
    for (const auto& m : members)
        out.push_back(m.traits);
    return out;
}

} // namespace

CompatibilityEngine::CompatibilityEngine()
    : CompatibilityEngine(EngineSettings{})
{}

CompatibilityEngine::CompatibilityEngine(EngineSettings settings,
                                         std::shared_ptr<IScoringAdvisor> advisor,
                                         jobs::JobSystem* jobs)
    : settings_(settings)
    , advisor_(std::make_unique<AdvisorGate>(std::move(advisor), settings.advisorTimeout))
    , jobs_(jobs ? jobs : &jobs::JobSystem::Instance())
{}

PersonalityResult CompatibilityEngine::Personality(const std::vector<TraitScore>& a, const std::vector<TraitScore>& b)
{
    PersonalityResult r;
    double total = 0.0;
    double totalWeight = 0.0;

    for (std::size_t i = 0; i < kTraitCount; ++i)
    {
        const auto trait = static_cast<PersonalityTrait>(i);
        const auto sa = FindTrait(a, trait);
        const auto sb = FindTrait(b, trait);
        if (!sa || !sb)
            continue;

        const double na = std::clamp(*sa / 100.0, 0.0, 1.0);
        const double nb = std::clamp(*sb / 100.0, 0.0, 1.0);

        double s = 0.0;
        if (trait == PersonalityTrait::Extraversion)
            s = 1.0 - std::abs(na - (1.0 - nb)) / 2.0;
        else
            s = kTraitBase[i] * (1.0 - std::abs(na - nb));

        const double score = Clamp100(s * 100.0);
        r.perTrait[i] = score;

        if (score >= kComplementaryAt)
            r.complementary.push_back(trait);
        else if (score <= kConflictingAt)
            r.conflicting.push_back(trait);

        total += score * kTraitWeight;
        totalWeight += kTraitWeight;
    }

    r.overall = totalWeight > 0.0 ? Clamp100(total / totalWeight) : 0.0;
    return r;
}

InterestResult CompatibilityEngine::Interests(const std::vector<Interest>& a, const std::vector<Interest>& b)
{
    // key -> primary on that side; order of first appearance kept for output
    std::vector<std::string> orderA;
    std::map<std::string, bool> setA;
    for (const auto& i : a)
    {
        const auto key = i.key();
        auto [it, inserted] = setA.emplace(key, IsPrimaryForUser(i));
        if (inserted)
            orderA.push_back(key);
        else
            it->second = it->second || IsPrimaryForUser(i);
    }

    std::map<std::string, bool> setB;
    for (const auto& i : b)
    {
        auto [it, inserted] = setB.emplace(i.key(), IsPrimaryForUser(i));
        if (!inserted)
            it->second = it->second || IsPrimaryForUser(i);
    }

    InterestResult r;
    for (const auto& key : orderA)
    {
        const auto it = setB.find(key);
        if (it == setB.end())
            continue;
        r.shared.push_back(key);
        if (setA[key] && it->second)
            r.primaryMatch = true;
    }

    const std::size_t uni = setA.size() + setB.size() - r.shared.size();
    double overall = uni > 0 ? 100.0 * static_cast<double>(r.shared.size()) / static_cast<double>(uni) : 0.0;
    if (r.primaryMatch)
        overall += kPrimaryBonus;

    r.overall = Clamp100(overall);
    return r;
}

double CompatibilityEngine::StyleMatrix(CommunicationStyle a, CommunicationStyle b) noexcept
{
    return kStyleMatrix[Index(a)][Index(b)];
}

bool CompatibilityEngine::IsComplementaryStyle(CommunicationStyle a, CommunicationStyle b) noexcept
{
    using S = CommunicationStyle;
    auto pair = [&](S x, S y) { return (a == x && b == y) || (a == y && b == x); };
    return pair(S::Direct, S::Analytical) ||
           pair(S::Thoughtful, S::Supportive) ||
           pair(S::Supportive, S::Expressive);
}

CommunicationResult CompatibilityEngine::Communication(CommunicationStyle a, CommunicationStyle b) noexcept
{
    CommunicationResult r;
    r.match = a == b;
    r.overall = Clamp100(StyleMatrix(a, b) * 100.0);
    r.complementary = IsComplementaryStyle(a, b);
    return r;
}

LocationResult CompatibilityEngine::Location(const Coordinates& a, const Coordinates& b, double maxDistanceMiles) noexcept
{
    LocationResult r;
    r.distanceMiles = geo::DistanceMiles(a, b);
    r.withinRange = r.distanceMiles <= maxDistanceMiles;

    if (maxDistanceMiles > 0.0 && std::isfinite(maxDistanceMiles))
        r.overall = Clamp100(100.0 * (1.0 - r.distanceMiles / maxDistanceMiles));
    else
        r.overall = r.distanceMiles == 0.0 ? 100.0 : 0.0;
    return r;
}

BalanceResult CompatibilityEngine::GroupBalance(const std::vector<TraitScore>& candidate,
                                                const std::vector<std::vector<TraitScore>>& members)
{
    BalanceResult r;
    const double n = static_cast<double>(members.size());

    for (std::size_t i = 0; i < kTraitCount; ++i)
    {
        const auto trait = static_cast<PersonalityTrait>(i);

        double sum = 0.0;
        for (const auto& m : members)
            sum += FindTrait(m, trait).value_or(0.0);
        r.currentBalance[i] = members.empty() ? 0.0 : sum / n;

        const double mine = FindTrait(candidate, trait).value_or(0.0);
        r.projectedBalance[i] = (r.currentBalance[i] * n + mine) / (n + 1.0);
    }

    r.impact = (PopulationStdDev(r.currentBalance) - PopulationStdDev(r.projectedBalance)) * kBalanceScale;
    r.improves = r.impact > 0.0;
    return r;
}

std::string CompatibilityEngine::buildAdvisorPrompt(const Profile& a, const Profile& b, double algorithmic) const
{
    std::ostringstream oss;
    auto describe = [&](const char* label, const Profile& p) {
        oss << label << " (" << p.id << ")\n";
        oss << "  communication: " << ToString(p.communicationStyle) << "\n";
        oss << "  traits:";
        for (const auto& t : p.traits)
            oss << " " << ToString(t.trait) << "=" << t.score;
        oss << "\n  interests:";
        for (const auto& i : p.interests)
            oss << " " << i.key() << "(" << i.level << ")";
        oss << "\n";
    };

    oss << "Rate how well these two people would get along in a small social group.\n";
    describe("Person A", a);
    describe("Person B", b);
    oss << "Algorithmic score: " << fmt::format("{:.0f}", algorithmic) << "\n";
    oss << "Answer in the form:\nSCORE: <0-100>\nINSIGHTS: <one paragraph>\n";
    return oss.str();
}

UserCompatibility CompatibilityEngine::userCompatibility(const Profile& a, const Profile& b,
                                                         const FactorWeights& weights) const
{
    const FactorWeights w = weights.PairNormalized();

    const PersonalityResult   p = Personality(a.traits, b.traits);
    const InterestResult      i = Interests(a.interests, b.interests);
    const CommunicationResult c = Communication(a.communicationStyle, b.communicationStyle);
    const LocationResult      l = Location(a.coordinates, b.coordinates, settings_.maxDistanceMiles);

    UserCompatibility r;
    r.userId = a.id;
    r.targetUserId = b.id;
    r.details = {
        {CompatibilityFactor::Personality,   p.overall, w.personality,   DescribePersonality(p)},
        {CompatibilityFactor::Interests,     i.overall, w.interests,     DescribeInterests(i)},
        {CompatibilityFactor::Communication, c.overall, w.communication, DescribeCommunication(a.communicationStyle, b.communicationStyle, c)},
        {CompatibilityFactor::Location,      l.overall, w.location,      DescribeLocation(l, settings_.maxDistanceMiles)},
    };

    double total = 0.0;
    for (const auto& d : r.details)
        total += d.score * d.weight;

    r.algorithmic = Clamp100(total);
    r.overall = r.algorithmic;

    if (advisor_->enabled())
    {
        if (const auto text = advisor_->ask(buildAdvisorPrompt(a, b, r.algorithmic)))
        {
            if (const auto advised = ParseAdvisorScore(*text))
            {
                r.overall = Clamp100(kAlgorithmicBlend * r.algorithmic + kAdvisorBlend * *advised);
                r.advisorBlended = true;
            }
            else
            {
                spdlog::warn("advisor: answer for {}/{} carried no SCORE line", a.id, b.id);
            }
        }
    }

    return r;
}

TribeCompatibility CompatibilityEngine::tribeCompatibility(const Profile& user, const Tribe& tribe,
                                                           const std::vector<Profile>& members,
                                                           const FactorWeights& weights) const
{
    const FactorWeights w = weights.Normalized();

    TribeCompatibility r;
    r.userId = user.id;
    r.tribeId = tribe.id;

    double personality = 0.0;
    double communication = 0.0;
    r.perMember.reserve(members.size());
    for (const auto& m : members)
    {
        const double p = Personality(user.traits, m.traits).overall;
        const double c = Communication(user.communicationStyle, m.communicationStyle).overall;
        personality += p;
        communication += c;
        r.perMember.push_back({m.id, Clamp100(0.7 * p + 0.3 * c)});
    }
    if (!members.empty())
    {
        personality /= static_cast<double>(members.size());
        communication /= static_cast<double>(members.size());
    }

    std::vector<Interest> tribeInterests = tribe.interests;
    for (const auto& m : members)
        tribeInterests.insert(tribeInterests.end(), m.interests.begin(), m.interests.end());
    const InterestResult interests = Interests(user.interests, tribeInterests);

    const double maxMiles = user.maxTravelDistance > 0.0 ? user.maxTravelDistance : settings_.maxDistanceMiles;
    const LocationResult location = Location(user.coordinates, tribe.coordinates, maxMiles);

    r.balance = GroupBalance(user.traits, TraitLists(members));
    const double balanceScore = Clamp100((r.balance.impact + 100.0) / 2.0);

    r.details = {
        {CompatibilityFactor::Personality, Clamp100(personality), w.personality,
         fmt::format("Average personality compatibility with {} members: {:.0f}%.", members.size(), personality)},
        {CompatibilityFactor::Interests, interests.overall, w.interests, DescribeInterests(interests)},
        {CompatibilityFactor::Communication, Clamp100(communication), w.communication,
         fmt::format("Average communication compatibility: {:.0f}%.", communication)},
        {CompatibilityFactor::Location, location.overall, w.location, DescribeLocation(location, maxMiles)},
        {CompatibilityFactor::Balance, balanceScore, w.balance, DescribeBalance(r.balance)},
    };

    double total = 0.0;
    for (const auto& d : r.details)
        total += d.score * d.weight;
    r.overall = Clamp100(total);
    return r;
}

std::vector<UserCompatibility> CompatibilityEngine::findMostCompatibleUsers(const Profile& user,
                                                                            const std::vector<Profile>& pool,
                                                                            const FactorWeights& weights,
                                                                            std::size_t limit,
                                                                            double minScore) const
{
    std::vector<const Profile*> candidates;
    candidates.reserve(pool.size());
    for (const auto& p : pool)
        if (p.id != user.id)
            candidates.push_back(&p);

    std::vector<UserCompatibility> scored(candidates.size());
    jobs_->ParallelForIndex(std::size_t{0}, candidates.size(), std::size_t{1}, [&](std::size_t k) {
        scored[k] = userCompatibility(user, *candidates[k], weights);
    });

    std::vector<UserCompatibility> out;
    for (auto& s : scored)
        if (s.overall >= minScore)
            out.push_back(std::move(s));

    std::stable_sort(out.begin(), out.end(), [](const UserCompatibility& x, const UserCompatibility& y) {
        return x.overall > y.overall;
    });
    if (out.size() > limit)
        out.resize(limit);
    return out;
}

std::vector<TribeCompatibility> CompatibilityEngine::findMostCompatibleTribes(const Profile& user,
                                                                              const std::vector<Tribe>& tribes,
                                                                              const ProfileIndex& memberProfiles,
                                                                              const FactorWeights& weights,
                                                                              std::size_t limit,
                                                                              double minScore) const
{
    std::vector<TribeCompatibility> scored(tribes.size());
    jobs_->ParallelForIndex(std::size_t{0}, tribes.size(), std::size_t{1}, [&](std::size_t k) {
        scored[k] = tribeCompatibility(user, tribes[k], SeatedProfiles(tribes[k], memberProfiles), weights);
    });

    std::vector<TribeCompatibility> out;
    for (auto& s : scored)
        if (s.overall >= minScore)
            out.push_back(std::move(s));

    std::stable_sort(out.begin(), out.end(), [](const TribeCompatibility& x, const TribeCompatibility& y) {
        return x.overall > y.overall;
    });
    if (out.size() > limit)
        out.resize(limit);
    return out;
}

std::vector<Profile> SeatedProfiles(const Tribe& tribe, const ProfileIndex& index)
{
    std::vector<Profile> out;
    for (const auto& m : tribe.members)
    {
        if (!m.occupiesSeat())
            continue;
        const auto it = index.find(m.userId);
        if (it != index.end())
            out.push_back(it->second);
    }
    return out;
}

} // namespace tribe
