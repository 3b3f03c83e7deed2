#include <doctest/doctest.h>

#include "tribe/core/Errors.hpp"
#include "tribe/io/SnapshotStore.hpp"
#include "tribe/jobs/JobSystem.hpp"
#include "tribe/service/MatchingService.hpp"

#include "TestAdvisors.h"
#include "TestProfiles.h"

#include <chrono>
#include <memory>
#include <string>
#include <stdexcept>
#include <thread>

using namespace tribe;
using testutil::Cluster;
using testutil::MakeProfile;
using testutil::MakeTribe;

namespace {

jobs::JobSystem& ServiceJobs()
{
    static jobs::JobSystem s_jobs(2);
    return s_jobs;
}

class RecordingSink : public IAssignmentSink
{
public:
    void publish(const FormationResult& result) override
    {
        ++published;
        lastAssignments = result.existingAssignments.size();
    }

    void record(const ActivityRecord& activity) override
    {
        kinds.push_back(ActivityKind(activity.data));
    }

    int                      published = 0;
    std::size_t              lastAssignments = 0;
    std::vector<std::string> kinds;
};

class BrokenSink : public IAssignmentSink
{
public:
    void publish(const FormationResult&) override { throw std::runtime_error("database offline"); }
    void record(const ActivityRecord&) override {}
};

io::JsonSnapshotStore MakeStore()
{
    std::vector<Profile> profiles = Cluster("u", 6, 47.60, -122.33);
    const auto members = Cluster("m", 4, 47.61, -122.34);
    profiles.insert(profiles.end(), members.begin(), members.end());
    profiles.push_back(MakeProfile("far", -33.86, 151.21, {10, 90, 10, 90, 10}, CommunicationStyle::Expressive));

    Tribe north = MakeTribe("north", 47.61, -122.34, 6, {"m0", "m1", "m2", "m3"});
    north.region = "seattle";
    Tribe full = MakeTribe("full", 47.61, -122.34, 2, {"m0", "m1"});
    full.region = "seattle";

    return io::JsonSnapshotStore(std::move(profiles), {north, full});
}

} // namespace

TEST_CASE("MatchingService/UnknownReferenceUserThrows")
{
    const auto store = MakeStore();
    MatchingService service(store, MatchingConfig{}, nullptr, nullptr, &ServiceJobs());

    CHECK_THROWS_AS(service.scoreUsers("ghost", {"u1"}), NotFoundError);
    CHECK_THROWS_AS(service.scoreTribes("ghost", {"north"}), NotFoundError);
}

TEST_CASE("MatchingService/PerItemStatuses")
{
    const auto store = MakeStore();
    MatchingService service(store, MatchingConfig{}, nullptr, nullptr, &ServiceJobs());

    const auto r = service.scoreUsers("u0", {"u1", "ghost", "u1", "u0", "far"});

    REQUIRE(r.statuses.size() == 5);
    CHECK(r.statuses[0].status == ItemStatus::Ok);
    CHECK(r.statuses[1].status == ItemStatus::NotFound);
    CHECK(r.statuses[2].status == ItemStatus::Skipped);
    CHECK(r.statuses[3].status == ItemStatus::Skipped);
    CHECK(r.statuses[4].status == ItemStatus::Ok);

    REQUIRE(r.entries.size() == 2);
    CHECK(r.entries[0].userId == "u1");
    CHECK(r.entries[1].userId == "far");
    CHECK(r.entries[0].score >= r.entries[1].score);
    CHECK(r.entries[0].detail.targetUserId == "u1");
}

TEST_CASE("MatchingService/BatchLimit")
{
    const auto store = MakeStore();
    MatchingConfig cfg;
    cfg.maxBatchSize = 2;
    MatchingService service(store, cfg, nullptr, nullptr, &ServiceJobs());

    const auto r = service.scoreUsers("u0", {"u1", "u2", "u3"});
    REQUIRE(r.statuses.size() == 3);
    CHECK(r.statuses[2].status == ItemStatus::Skipped);
    CHECK(r.entries.size() == 2);
}

TEST_CASE("MatchingService/CachedScoresSkipTheAdvisor")
{
    const auto store = MakeStore();
    auto advisor = std::make_shared<testutil::FixedAdvisor>("SCORE: 80");
    MatchingService service(store, MatchingConfig{}, advisor, nullptr, &ServiceJobs());

    const auto first = service.scoreUsers("u0", {"u1", "u2"});
    CHECK(advisor->calls.load() == 2);
    CHECK(first.entries[0].detail.advisorBlended);

    const auto second = service.scoreUsers("u0", {"u1", "u2"});
    CHECK(advisor->calls.load() == 2);
    REQUIRE(second.entries.size() == first.entries.size());
    for (std::size_t i = 0; i < first.entries.size(); ++i)
        CHECK(second.entries[i].score == first.entries[i].score);

    service.invalidate("u1");
    service.scoreUsers("u0", {"u1", "u2"});
    CHECK(advisor->calls.load() == 3);

    // Another weight set is a separate cache variant.
    FactorWeights w;
    w.personality = 1.0;
    service.scoreUsers("u0", {"u1", "u2"}, w);
    CHECK(advisor->calls.load() == 5);
}

TEST_CASE("MatchingService/ScoreTribes")
{
    const auto store = MakeStore();
    MatchingService service(store, MatchingConfig{}, nullptr, nullptr, &ServiceJobs());

    const auto r = service.scoreTribes("u0", {"north", "nowhere", "north"});
    REQUIRE(r.statuses.size() == 3);
    CHECK(r.statuses[0].status == ItemStatus::Ok);
    CHECK(r.statuses[1].status == ItemStatus::NotFound);
    CHECK(r.statuses[2].status == ItemStatus::Skipped);

    REQUIRE(r.entries.size() == 1);
    CHECK(r.entries[0].tribeId == "north");
    CHECK(r.entries[0].detail.perMember.size() == 4);
    CHECK(r.entries[0].score > 0.0);
}

TEST_CASE("MatchingService/FormTribesPublishes")
{
    const auto store = MakeStore();
    RecordingSink sink;
    MatchingConfig cfg;
    cfg.compatibilityThreshold = 0.0;
    MatchingService service(store, cfg, nullptr, &sink, &ServiceJobs());

    const auto report = service.formTribes({"u0", "u1", "u2", "u3", "u4", "u5", "ghost"}, std::string("seattle"));

    REQUIRE(report.statuses.size() == 7);
    CHECK(report.statuses[6].status == ItemStatus::NotFound);
    CHECK(report.published);
    CHECK(sink.published == 1);

    // "north" has two spare seats; "full" has none.
    CHECK(report.result.existingAssignments.size() == 2);
    for (const auto& a : report.result.existingAssignments)
        CHECK(a.tribeId == "north");
    CHECK(sink.lastAssignments == 2);

    std::size_t joined = 0;
    std::size_t created = 0;
    for (const auto& k : sink.kinds)
    {
        if (k == std::string("member_joined")) ++joined;
        if (k == std::string("tribe_created")) ++created;
    }
    CHECK(joined == 2);
    CHECK(created == report.result.newTribes.size());
}

TEST_CASE("MatchingService/SinkFailureIsReported")
{
    const auto store = MakeStore();
    BrokenSink sink;
    MatchingService service(store, MatchingConfig{}, nullptr, &sink, &ServiceJobs());

    const auto report = service.formTribes({"u0", "u1", "u2", "u3"});
    CHECK_FALSE(report.published);

    std::size_t placed = report.result.existingAssignments.size();
    for (const auto& g : report.result.newTribes)
        placed += g.members.size();
    CHECK(placed == 4);
}

TEST_CASE("MatchingService/RepairsConfig")
{
    const auto store = MakeStore();
    MatchingConfig cfg;
    cfg.minGroupSize = 1;
    cfg.compatibilityThreshold = 7.0;
    MatchingService service(store, cfg, nullptr, nullptr, &ServiceJobs());

    CHECK(service.config().minGroupSize == 4);
    CHECK(service.config().compatibilityThreshold == doctest::Approx(0.7));

    MatchingConfig uncapped;
    uncapped.cacheMaxEntries = 0;
    MatchingService other(store, uncapped, nullptr, nullptr, &ServiceJobs());
    CHECK(other.config().cacheMaxEntries == 50000);
}

TEST_CASE("MatchingService/SuggestUsers")
{
    const auto store = MakeStore();
    MatchingConfig open;
    open.compatibilityThreshold = 0.0;
    MatchingService service(store, open, nullptr, nullptr, &ServiceJobs());

    const auto all = service.suggestUsers("u0");
    CHECK(all.size() == kDefaultSuggestionLimit);
    for (std::size_t i = 0; i < all.size(); ++i)
    {
        CHECK(all[i].userId != "u0");
        CHECK(all[i].detail.targetUserId == all[i].userId);
        if (i > 0)
            CHECK(all[i - 1].score >= all[i].score);
    }

    const auto top = service.suggestUsers("u0", 3);
    REQUIRE(top.size() == 3);
    for (std::size_t i = 0; i < top.size(); ++i)
        CHECK(top[i].userId == all[i].userId);

    // At the default threshold the user on another continent drops out.
    MatchingService strict(store, MatchingConfig{}, nullptr, nullptr, &ServiceJobs());
    for (const auto& s : strict.suggestUsers("u0"))
    {
        CHECK(s.userId != "far");
        CHECK(s.score >= 70.0);
    }

    CHECK_THROWS_AS(service.suggestUsers("ghost"), NotFoundError);
}

TEST_CASE("MatchingService/SuggestTribesSkipsCurrentTribes")
{
    std::vector<Profile> profiles = Cluster("m", 4, 47.61, -122.34);
    const auto south = Cluster("s", 3, 47.55, -122.30);
    profiles.insert(profiles.end(), south.begin(), south.end());
    profiles.push_back(MakeProfile("newbie", 47.60, -122.33));

    Tribe northTribe = MakeTribe("north", 47.61, -122.34, 6, {"m0", "m1", "m2", "m3"});
    northTribe.region = "seattle";
    Tribe southTribe = MakeTribe("south", 47.55, -122.30, 6, {"s0", "s1", "s2"});
    southTribe.region = "tacoma";
    Tribe fullTribe = MakeTribe("full", 47.60, -122.33, 2, {"s0", "s1"});
    fullTribe.region = "seattle";
    const io::JsonSnapshotStore store(std::move(profiles), {northTribe, southTribe, fullTribe});

    MatchingConfig open;
    open.compatibilityThreshold = 0.0;
    MatchingService service(store, open, nullptr, nullptr, &ServiceJobs());

    // A member of "north" only sees "south"; "full" has no seat.
    const auto forMember = service.suggestTribes("m0");
    REQUIRE(forMember.size() == 1);
    CHECK(forMember[0].tribeId == "south");
    CHECK(forMember[0].detail.perMember.size() == 3);

    const auto forNewbie = service.suggestTribes("newbie");
    REQUIRE(forNewbie.size() == 2);
    CHECK(forNewbie[0].score >= forNewbie[1].score);

    CHECK(service.suggestTribes("newbie", 1).size() == 1);
    CHECK(service.suggestTribes("newbie", 10, std::string("tacoma")).size() == 1);
    CHECK(service.suggestTribes("s0", 10, std::string("tacoma")).empty());
    CHECK_THROWS_AS(service.suggestTribes("ghost"), NotFoundError);
}

TEST_CASE("CompatibilityCache/Expiry")
{
    TtlCache<int> cache(std::chrono::seconds(10));
    const auto t0 = TtlCache<int>::Clock::now();

    cache.put("a", "b", "v", 42, t0);
    CHECK(cache.get("a", "b", "v", t0 + std::chrono::seconds(5)) == 42);
    CHECK_FALSE(cache.get("a", "b", "other", t0).has_value());
    CHECK_FALSE(cache.get("a", "b", "v", t0 + std::chrono::seconds(11)).has_value());
    CHECK(cache.size() == 0);

    cache.put("a", "b", "v", 1, t0);
    cache.put("c", "a", "v", 2, t0);
    cache.put("c", "d", "v", 3, t0);
    CHECK(cache.invalidate("a") == 2);
    CHECK(cache.size() == 1);

    TtlCache<int> disabled(std::chrono::seconds(0));
    disabled.put("a", "b", "v", 1);
    CHECK(disabled.size() == 0);
}

TEST_CASE("CompatibilityCache/ExpiredEntriesAreSweptOnInsert")
{
    TtlCache<int> cache(std::chrono::seconds(10));
    const auto t0 = TtlCache<int>::Clock::now();

    cache.put("a", "b", "v", 1, t0);
    cache.put("c", "d", "v", 2, t0);
    CHECK(cache.size() == 2);

    // Never read again; the next insert after a TTL drops both.
    cache.put("e", "f", "v", 3, t0 + std::chrono::seconds(11));
    CHECK(cache.size() == 1);
    CHECK(cache.get("e", "f", "v", t0 + std::chrono::seconds(12)) == 3);

    cache.put("g", "h", "v", 4, t0 + std::chrono::seconds(12));
    CHECK(cache.purgeExpired(t0 + std::chrono::seconds(21)) == 1);
    CHECK(cache.size() == 1);
    CHECK(cache.purgeExpired(t0 + std::chrono::seconds(30)) == 1);
    CHECK(cache.size() == 0);
}

TEST_CASE("CompatibilityCache/CapacityEvictsSoonestToExpire")
{
    TtlCache<int> cache(std::chrono::seconds(10), 2);
    const auto t0 = TtlCache<int>::Clock::now();
    CHECK(cache.capacity() == 2);

    cache.put("x1", "t", "v", 1, t0);
    cache.put("x2", "t", "v", 2, t0 + std::chrono::seconds(1));
    cache.put("x3", "t", "v", 3, t0 + std::chrono::seconds(2));
    CHECK(cache.size() == 2);
    CHECK_FALSE(cache.get("x1", "t", "v", t0 + std::chrono::seconds(3)).has_value());
    CHECK(cache.get("x2", "t", "v", t0 + std::chrono::seconds(3)) == 2);
    CHECK(cache.get("x3", "t", "v", t0 + std::chrono::seconds(3)) == 3);

    // Overwriting a present key never evicts.
    cache.put("x2", "t", "v", 20, t0 + std::chrono::seconds(4));
    CHECK(cache.size() == 2);
    CHECK(cache.get("x3", "t", "v", t0 + std::chrono::seconds(5)) == 3);

    // Many distinct pairs stay within the cap.
    for (int i = 0; i < 100; ++i)
        cache.put("bulk" + std::to_string(i), "t", "v", i, t0 + std::chrono::seconds(5));
    CHECK(cache.size() == 2);
}
