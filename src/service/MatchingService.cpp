#include "tribe/service/MatchingService.hpp"

#include "tribe/core/Errors.hpp"
#include "tribe/jobs/JobSystem.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <exception>
#include <set>

namespace tribe {

namespace {

MatchingConfig Repaired(MatchingConfig cfg)
{
    if (const int fixes = Repair(cfg))
        spdlog::warn("matching service: {} config value(s) repaired", fixes);
    return cfg;
}

// Cache variant for a weight set; equal normalized weights share entries.
std::string Fingerprint(const FactorWeights& weights)
{
    const FactorWeights w = weights.Normalized();
    return fmt::format("{:.6f},{:.6f},{:.6f},{:.6f},{:.6f}",
                       w.personality, w.interests, w.communication, w.location, w.balance);
}

} // namespace

std::string_view ToString(ItemStatus s) noexcept
{
    switch (s)
    {
    case ItemStatus::Ok:       return "ok";
    case ItemStatus::NotFound: return "not_found";
    case ItemStatus::Skipped:  return "skipped";
    }
    return "unknown";
}

MatchingService::MatchingService(const IProfileStore& store,
                                 MatchingConfig config,
                                 std::shared_ptr<IScoringAdvisor> advisor,
                                 IAssignmentSink* sink,
                                 jobs::JobSystem* jobs)
    : store_(store)
    , config_(Repaired(std::move(config)))
    , sink_(sink)
    , engine_(EngineSettings{config_.maxDistanceMiles, std::chrono::milliseconds(config_.advisorTimeoutMs)},
              advisor, jobs)
    , formation_(engine_, advisor)
    , userCache_(std::chrono::seconds(config_.cacheTtlSeconds), static_cast<std::size_t>(config_.cacheMaxEntries))
    , tribeCache_(std::chrono::seconds(config_.cacheTtlSeconds), static_cast<std::size_t>(config_.cacheMaxEntries))
{}

std::vector<std::string> MatchingService::admit(const std::vector<std::string>& ids,
                                                std::vector<ItemResult>& statuses,
                                                const std::string& self) const
{
    std::vector<std::string> admitted;
    std::set<std::string> seen;
    const std::size_t limit = static_cast<std::size_t>(config_.maxBatchSize);

    statuses.clear();
    statuses.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i)
    {
        const std::string& id = ids[i];
        const bool skip = i >= limit || id == self || !seen.insert(id).second;
        statuses.push_back({id, skip ? ItemStatus::Skipped : ItemStatus::Ok});
        if (!skip)
            admitted.push_back(id);
    }

    if (ids.size() > limit)
        spdlog::warn("matching service: request of {} ids truncated to {}", ids.size(), limit);
    return admitted;
}

namespace {

void MarkNotFound(std::vector<ItemResult>& statuses, const std::string& id)
{
    for (auto& s : statuses)
    {
        if (s.id == id && s.status == ItemStatus::Ok)
        {
            s.status = ItemStatus::NotFound;
            return;
        }
    }
}

} // namespace

RankedList<RankedUser> MatchingService::scoreUsers(const std::string& userId,
                                                   const std::vector<std::string>& candidateIds,
                                                   const std::optional<FactorWeights>& weights)
{
    const auto self = store_.loadProfile(userId);
    if (!self)
        throw NotFoundError("user", userId);

    const FactorWeights w = weights.value_or(config_.weights);
    const std::string variant = Fingerprint(w);

    RankedList<RankedUser> out;
    std::vector<Profile> candidates;
    for (const auto& id : admit(candidateIds, out.statuses, userId))
    {
        if (auto p = store_.loadProfile(id))
            candidates.push_back(std::move(*p));
        else
            MarkNotFound(out.statuses, id);
    }

    std::vector<std::optional<UserCompatibility>> scored(candidates.size());
    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        scored[i] = userCache_.get(userId, candidates[i].id, variant);
        if (!scored[i])
            pending.push_back(i);
    }

    engine_.jobs().ParallelForIndex(std::size_t{0}, pending.size(), std::size_t{1}, [&](std::size_t k) {
        const std::size_t i = pending[k];
        scored[i] = engine_.userCompatibility(*self, candidates[i], w);
    });

    for (std::size_t i : pending)
        userCache_.put(userId, candidates[i].id, variant, *scored[i]);

    out.entries.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i)
        out.entries.push_back({candidates[i].id, scored[i]->overall, std::move(*scored[i])});

    std::stable_sort(out.entries.begin(), out.entries.end(),
                     [](const RankedUser& a, const RankedUser& b) { return a.score > b.score; });

    spdlog::debug("scoreUsers {}: {} scored ({} cached)", userId, out.entries.size(),
                  candidates.size() - pending.size());
    return out;
}

RankedList<RankedTribe> MatchingService::scoreTribes(const std::string& userId,
                                                     const std::vector<std::string>& candidateTribeIds,
                                                     const std::optional<FactorWeights>& weights)
{
    const auto self = store_.loadProfile(userId);
    if (!self)
        throw NotFoundError("user", userId);

    const FactorWeights w = weights.value_or(config_.weights);
    const std::string variant = Fingerprint(w);

    RankedList<RankedTribe> out;
    std::vector<Tribe> tribes;
    std::vector<std::vector<Profile>> members;
    for (const auto& id : admit(candidateTribeIds, out.statuses, std::string{}))
    {
        auto t = store_.loadTribe(id);
        if (!t)
        {
            MarkNotFound(out.statuses, id);
            continue;
        }
        ProfileIndex index;
        for (auto& p : store_.loadMemberProfiles(id))
            index.emplace(p.id, std::move(p));
        members.push_back(SeatedProfiles(*t, index));
        tribes.push_back(std::move(*t));
    }

    std::vector<std::optional<TribeCompatibility>> scored(tribes.size());
    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < tribes.size(); ++i)
    {
        scored[i] = tribeCache_.get(userId, tribes[i].id, variant);
        if (!scored[i])
            pending.push_back(i);
    }

    engine_.jobs().ParallelForIndex(std::size_t{0}, pending.size(), std::size_t{1}, [&](std::size_t k) {
        const std::size_t i = pending[k];
        scored[i] = engine_.tribeCompatibility(*self, tribes[i], members[i], w);
    });

    for (std::size_t i : pending)
        tribeCache_.put(userId, tribes[i].id, variant, *scored[i]);

    out.entries.reserve(tribes.size());
    for (std::size_t i = 0; i < tribes.size(); ++i)
        out.entries.push_back({tribes[i].id, scored[i]->overall, std::move(*scored[i])});

    std::stable_sort(out.entries.begin(), out.entries.end(),
                     [](const RankedTribe& a, const RankedTribe& b) { return a.score > b.score; });
    return out;
}

std::vector<RankedUser> MatchingService::suggestUsers(const std::string& userId,
                                                     std::size_t limit,
                                                     const std::optional<FactorWeights>& weights) const
{
    const auto self = store_.loadProfile(userId);
    if (!self)
        throw NotFoundError("user", userId);

    const FactorWeights w = weights.value_or(config_.weights);
    const double minScore = config_.compatibilityThreshold * 100.0;

    std::vector<RankedUser> out;
    for (auto& c : engine_.findMostCompatibleUsers(*self, store_.loadProfiles(), w, limit, minScore))
    {
        const std::string id = c.targetUserId;
        const double score = c.overall;
        out.push_back({id, score, std::move(c)});
    }

    spdlog::debug("suggestUsers {}: {} suggestion(s) at >= {:.0f}", userId, out.size(), minScore);
    return out;
}

std::vector<RankedTribe> MatchingService::suggestTribes(const std::string& userId,
                                                       std::size_t limit,
                                                       const std::optional<std::string>& region,
                                                       const std::optional<FactorWeights>& weights) const
{
    const auto self = store_.loadProfile(userId);
    if (!self)
        throw NotFoundError("user", userId);

    const FactorWeights w = weights.value_or(config_.weights);
    const double minScore = config_.compatibilityThreshold * 100.0;

    const std::vector<std::string> current = store_.loadUserTribeIds(userId);
    std::vector<Tribe> open = store_.loadTribesWithCapacity(region);
    open.erase(std::remove_if(open.begin(), open.end(),
                              [&](const Tribe& t) {
                                  return std::find(current.begin(), current.end(), t.id) != current.end();
                              }),
               open.end());

    ProfileIndex memberProfiles;
    for (const auto& t : open)
        for (auto& p : store_.loadMemberProfiles(t.id))
            memberProfiles.emplace(p.id, std::move(p));

    std::vector<RankedTribe> out;
    for (auto& c : engine_.findMostCompatibleTribes(*self, open, memberProfiles, w, limit, minScore))
    {
        const std::string id = c.tribeId;
        const double score = c.overall;
        out.push_back({id, score, std::move(c)});
    }

    spdlog::debug("suggestTribes {}: {} of {} open tribe(s) suggested, {} already joined",
                  userId, out.size(), open.size(), current.size());
    return out;
}

FormationReport MatchingService::formTribes(const std::vector<std::string>& userIds,
                                            const std::optional<std::string>& region,
                                            const std::optional<FormationOptions>& options)
{
    FormationReport report;

    std::vector<Profile> users;
    for (const auto& id : admit(userIds, report.statuses, std::string{}))
    {
        if (auto p = store_.loadProfile(id))
            users.push_back(std::move(*p));
        else
            MarkNotFound(report.statuses, id);
    }

    const std::vector<Tribe> tribes = store_.loadTribesWithCapacity(region);
    ProfileIndex memberProfiles;
    for (const auto& t : tribes)
        for (auto& p : store_.loadMemberProfiles(t.id))
            memberProfiles.emplace(p.id, std::move(p));

    spdlog::info("formTribes: {} users, {} open tribes{}", users.size(), tribes.size(),
                 region ? fmt::format(" in region {}", *region) : std::string{});

    report.result = formation_.formTribes(users, tribes, memberProfiles,
                                          options.value_or(FormationOptions::FromConfig(config_)));

    // Memberships changed: scores against these tribes and users are stale.
    for (const auto& a : report.result.existingAssignments)
    {
        invalidate(a.userId);
        invalidate(a.tribeId);
    }
    for (const auto& g : report.result.newTribes)
        for (const auto& m : g.members)
            invalidate(m.userId);

    publish(report);
    return report;
}

void MatchingService::publish(FormationReport& report)
{
    if (!sink_)
        return;

    const FormationResult& result = report.result;
    try
    {
        sink_->publish(result);

        for (const auto& a : result.existingAssignments)
            sink_->record({a.tribeId, std::chrono::system_clock::now(), MemberJoined{a.userId, a.score}});

        for (const auto& g : result.newTribes)
        {
            TribeCreated created;
            created.provisional = g.provisional;
            for (const auto& m : g.members)
                created.memberIds.push_back(m.userId);
            sink_->record({std::string{}, std::chrono::system_clock::now(), std::move(created)});
        }

        if (result.advisory)
            for (const auto& s : result.advisory->suggestions)
                sink_->record({s.fromTribe, std::chrono::system_clock::now(), s});

        report.published = true;
    }
    catch (const std::exception& e)
    {
        spdlog::error("formTribes: publishing results failed: {}", e.what());
        report.published = false;
    }
}

void MatchingService::invalidate(const std::string& id)
{
    userCache_.invalidate(id);
    tribeCache_.invalidate(id);
}

} // namespace tribe
