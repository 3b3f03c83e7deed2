#include <doctest/doctest.h>

#include "tribe/cluster/ClusteringEngine.hpp"
#include "tribe/jobs/JobSystem.hpp"

#include "TestProfiles.h"

#include <algorithm>
#include <set>
#include <string>

using namespace tribe;
using testutil::Cluster;
using testutil::Hobby;
using testutil::MakeProfile;

namespace {

jobs::JobSystem& ClusterJobs()
{
    static jobs::JobSystem s_jobs(2);
    return s_jobs;
}

const CompatibilityEngine& Engine()
{
    static CompatibilityEngine s_engine(EngineSettings{}, nullptr, &ClusterJobs());
    return s_engine;
}

ClusteringOptions Options(double maxMiles)
{
    ClusteringOptions o;
    o.maxDistanceMiles = maxMiles;
    return o;
}

bool StartsWith(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST_CASE("Clustering/EmptyPool")
{
    ClusteringEngine clustering(Engine());
    CHECK(clustering.formGroups({}, Options(25.0)).empty());
}

TEST_CASE("Clustering/ProximityDependsOnInputOrder")
{
    // a-b and b-c are ~20 miles apart, a-c ~40.
    const Profile a = MakeProfile("a", 0.0, 0.0);
    const Profile b = MakeProfile("b", 0.29, 0.0);
    const Profile c = MakeProfile("c", 0.58, 0.0);

    const auto forward = ClusteringEngine::ProximityGroups({a, b, c}, 25.0);
    REQUIRE(forward.size() == 2);
    CHECK(forward[0] == IndexGroup{0, 1});
    CHECK(forward[1] == IndexGroup{2});

    // Reversed, b pairs with c and a is left alone.
    const auto backward = ClusteringEngine::ProximityGroups({c, b, a}, 25.0);
    REQUIRE(backward.size() == 2);
    CHECK(backward[0] == IndexGroup{0, 1});
    CHECK(backward[1] == IndexGroup{2});
}

TEST_CASE("Clustering/DistantClustersNeverMix")
{
    std::vector<Profile> users = Cluster("sea", 10, 47.60, -122.33);
    const auto nyc = Cluster("nyc", 10, 40.71, -74.00);
    users.insert(users.end(), nyc.begin(), nyc.end());

    ClusteringEngine clustering(Engine());
    const auto groups = clustering.formGroups(users, Options(50.0));

    std::set<std::string> seen;
    for (const auto& g : groups)
    {
        REQUIRE_FALSE(g.members.empty());
        CHECK_FALSE(g.provisional);
        CHECK(g.members.size() >= 4);
        CHECK(g.members.size() <= 8);

        const std::string prefix = g.members.front().userId.substr(0, 3);
        for (const auto& m : g.members)
        {
            CHECK(StartsWith(m.userId, prefix));
            CHECK(m.score >= 0.0);
            CHECK(m.score <= 100.0);
            CHECK(seen.insert(m.userId).second);
        }
    }
    CHECK(seen.size() == users.size());
}

TEST_CASE("Clustering/SmallRegionStaysTogether")
{
    const auto users = Cluster("p", 6, 51.50, -0.12);
    ClusteringEngine clustering(Engine());
    const auto groups = clustering.formGroups(users, Options(25.0));

    REQUIRE(groups.size() == 1);
    CHECK(groups[0].members.size() == 6);
    CHECK_FALSE(groups[0].provisional);
    for (const auto& m : groups[0].members)
        CHECK(m.score > 0.0);
}

TEST_CASE("Clustering/IsolatedUsersStayApart")
{
    const std::vector<Profile> users{
        MakeProfile("x", 10.0, 10.0),
        MakeProfile("y", -20.0, 40.0),
        MakeProfile("z", 35.0, -90.0),
    };

    ClusteringEngine clustering(Engine());
    const auto groups = clustering.formGroups(users, Options(25.0));

    REQUIRE(groups.size() == 3);
    for (const auto& g : groups)
    {
        CHECK(g.provisional);
        CHECK(g.members.size() == 1);
    }
}

TEST_CASE("Clustering/StrandedCitiesAreNotPooledTogether")
{
    // Three users in each city; neither city can fill a group alone.
    std::vector<Profile> users = Cluster("sea", 3, 47.60, -122.33);
    const auto nyc = Cluster("nyc", 3, 40.71, -74.00);
    users.insert(users.end(), nyc.begin(), nyc.end());

    ClusteringEngine clustering(Engine());
    const auto groups = clustering.formGroups(users, Options(50.0));

    REQUIRE(groups.size() == 2);
    std::set<std::string> seen;
    for (const auto& g : groups)
    {
        REQUIRE(g.members.size() == 3);
        CHECK(g.provisional);
        const std::string prefix = g.members.front().userId.substr(0, 3);
        for (const auto& m : g.members)
        {
            CHECK(StartsWith(m.userId, prefix));
            CHECK(seen.insert(m.userId).second);
        }
    }
    CHECK(seen.size() == users.size());
}

TEST_CASE("Clustering/InterleavedInputKeepsCoastsApart")
{
    const std::vector<Profile> users{
        MakeProfile("w0", 47.60, -122.33), MakeProfile("e0", 40.71, -74.00),
        MakeProfile("w1", 47.61, -122.34), MakeProfile("e1", 40.72, -74.01),
    };

    ClusteringEngine clustering(Engine());
    const auto groups = clustering.formGroups(users, Options(25.0));

    REQUIRE(groups.size() == 2);
    for (const auto& g : groups)
    {
        CHECK(g.provisional);
        REQUIRE(g.members.size() == 2);
        CHECK(g.members[0].userId.front() == g.members[1].userId.front());
    }
}

TEST_CASE("Clustering/SingletonScoresZero")
{
    ClusteringEngine clustering(Engine());
    const auto groups = clustering.formGroups({MakeProfile("solo", 1.0, 1.0)}, Options(25.0));

    REQUIRE(groups.size() == 1);
    REQUIRE(groups[0].members.size() == 1);
    CHECK(groups[0].provisional);
    CHECK(groups[0].members[0].userId == "solo");
    CHECK(groups[0].members[0].score == 0.0);
}

TEST_CASE("Clustering/PartitionSizes")
{
    CHECK(ClusteringEngine::PartitionSizes(10, 4, 8) == std::vector<int>{5, 5});
    CHECK(ClusteringEngine::PartitionSizes(9, 4, 8) == std::vector<int>{5, 4});
    CHECK(ClusteringEngine::PartitionSizes(16, 4, 8) == std::vector<int>{8, 8});
    CHECK(ClusteringEngine::PartitionSizes(17, 4, 8) == std::vector<int>{6, 6, 5});
    CHECK(ClusteringEngine::PartitionSizes(3, 4, 8) == std::vector<int>{3});
    CHECK(ClusteringEngine::PartitionSizes(7, 5, 6) == std::vector<int>{6, 1});
    CHECK(ClusteringEngine::PartitionSizes(0, 4, 8).empty());
}

TEST_CASE("Clustering/InterestCohesion")
{
    const Profile a = MakeProfile("a", 0, 0, {50, 50, 50, 50, 50}, CommunicationStyle::Direct,
                                  {Hobby(InterestCategory::Outdoors, "Hiking"), Hobby(InterestCategory::Food, "Cooking")});
    const Profile b = MakeProfile("b", 0, 0, {50, 50, 50, 50, 50}, CommunicationStyle::Direct,
                                  {Hobby(InterestCategory::Outdoors, "Hiking"), Hobby(InterestCategory::Food, "Baking")});

    CHECK(ClusteringEngine::InterestCohesion({}) == 1.0);
    CHECK(ClusteringEngine::InterestCohesion({&a}) == 1.0);
    CHECK(ClusteringEngine::InterestCohesion({&a, &a}) == doctest::Approx(1.0));
    CHECK(ClusteringEngine::InterestCohesion({&a, &b}) == doctest::Approx(1.0 / 3.0));
}

TEST_CASE("Clustering/TraitVariance")
{
    const Profile flat = MakeProfile("flat", 0, 0, {50, 50, 50, 50, 50});
    const Profile spiky = MakeProfile("spiky", 0, 0, {80, 20, 80, 20, 80});

    CHECK(ClusteringEngine::TraitVariance({}) == 0.0);
    CHECK(ClusteringEngine::TraitVariance({&flat}) == doctest::Approx(0.0));
    CHECK(ClusteringEngine::TraitVariance({&spiky}) == doctest::Approx(864.0));
    // Averaging with the flat profile pulls every mean toward 50.
    CHECK(ClusteringEngine::TraitVariance({&flat, &spiky}) < ClusteringEngine::TraitVariance({&spiky}));
}

namespace {

// Members of each group with a single hobby, one misplaced member per group.
Profile Hobbyist(const std::string& id, const std::string& hobby)
{
    return MakeProfile(id, 45.0, -120.0, {50, 50, 50, 50, 50}, CommunicationStyle::Direct,
                       {Hobby(InterestCategory::Arts, hobby)});
}

double Cohesion(const std::vector<IndexGroup>& groups, const std::vector<Profile>& users)
{
    double sum = 0.0;
    for (const auto& g : groups)
    {
        std::vector<const Profile*> ps;
        for (std::size_t i : g)
            ps.push_back(&users[i]);
        sum += ClusteringEngine::InterestCohesion(ps);
    }
    return sum;
}

double Variance(const std::vector<IndexGroup>& groups, const std::vector<Profile>& users)
{
    double sum = 0.0;
    for (const auto& g : groups)
    {
        std::vector<const Profile*> ps;
        for (std::size_t i : g)
            ps.push_back(&users[i]);
        sum += ClusteringEngine::TraitVariance(ps);
    }
    return sum;
}

ClusteringOptions SwapOptions()
{
    ClusteringOptions o;
    o.minGroupSize = 2;
    o.maxGroupSize = 8;
    o.maxDistanceMiles = 25.0;
    return o;
}

} // namespace

TEST_CASE("Clustering/InterestSwapMovesMisplacedMembers")
{
    // Group 0 holds a painter among potters, group 1 a potter among painters.
    const std::vector<Profile> users{
        Hobbyist("pot0", "Pottery"), Hobbyist("pot1", "Pottery"), Hobbyist("pai2", "Painting"),
        Hobbyist("pai0", "Painting"), Hobbyist("pai1", "Painting"), Hobbyist("pot2", "Pottery"),
    };
    std::vector<IndexGroup> groups{{0, 1, 2}, {3, 4, 5}};

    const double before = Cohesion(groups, users);
    CHECK(before == doctest::Approx(2.0 / 3.0));

    CHECK(ClusteringEngine::InterestSwaps(groups, users, SwapOptions()) == 1);
    CHECK(groups[0] == IndexGroup{0, 1, 5});
    CHECK(groups[1] == IndexGroup{3, 4, 2});

    const double after = Cohesion(groups, users);
    CHECK(after == doctest::Approx(2.0));
    CHECK(after > before);

    // Nothing left to improve.
    CHECK(ClusteringEngine::InterestSwaps(groups, users, SwapOptions()) == 0);
}

TEST_CASE("Clustering/BalanceSwapMixesTraits")
{
    const std::vector<Profile> users{
        MakeProfile("o0", 45.0, -120.0, {90, 10, 50, 50, 50}),
        MakeProfile("o1", 45.0, -120.0, {90, 10, 50, 50, 50}),
        MakeProfile("o2", 45.0, -120.0, {90, 10, 50, 50, 50}),
        MakeProfile("c0", 45.0, -120.0, {10, 90, 50, 50, 50}),
        MakeProfile("c1", 45.0, -120.0, {10, 90, 50, 50, 50}),
        MakeProfile("c2", 45.0, -120.0, {10, 90, 50, 50, 50}),
    };
    std::vector<IndexGroup> groups{{0, 1, 2}, {3, 4, 5}};

    const double before = Variance(groups, users);
    CHECK(before == doctest::Approx(1280.0));

    CHECK(ClusteringEngine::BalanceSwaps(groups, users, SwapOptions()) == 1);
    CHECK(groups[0] == IndexGroup{3, 1, 2});
    CHECK(groups[1] == IndexGroup{0, 4, 5});

    // Two 2:1 mixes: per-trait means of 63.3 and 36.7 around 50.
    const double d = 40.0 / 3.0;
    const double after = Variance(groups, users);
    CHECK(after == doctest::Approx(2.0 * (2.0 * d * d) / 5.0));
    CHECK(after < before);
}

TEST_CASE("Clustering/SwapsStopAfterFiveRounds")
{
    // Six pairs of groups, each pair fixed by exactly one swap.
    std::vector<Profile> users;
    std::vector<IndexGroup> groups;
    for (int pair = 0; pair < 6; ++pair)
    {
        const std::string a = "a" + std::to_string(pair);
        const std::string b = "b" + std::to_string(pair);
        const std::size_t base = users.size();
        users.push_back(Hobbyist(a + "-0", a));
        users.push_back(Hobbyist(a + "-1", a));
        users.push_back(Hobbyist(b + "-x", b));
        users.push_back(Hobbyist(b + "-0", b));
        users.push_back(Hobbyist(b + "-1", b));
        users.push_back(Hobbyist(a + "-x", a));
        groups.push_back({base, base + 1, base + 2});
        groups.push_back({base + 3, base + 4, base + 5});
    }

    const double before = Cohesion(groups, users);
    CHECK(ClusteringEngine::InterestSwaps(groups, users, SwapOptions()) == kMaxSwapRounds);
    CHECK(Cohesion(groups, users) == doctest::Approx(before + kMaxSwapRounds * (4.0 / 3.0)));

    // The last pair is still mixed.
    CHECK(groups[10] == IndexGroup{30, 31, 32});
    CHECK(groups[11] == IndexGroup{33, 34, 35});
}

TEST_CASE("Clustering/SwapsRespectDistanceAndSize")
{
    // The misplaced members live far from the group they would join.
    std::vector<Profile> users{
        Hobbyist("pot0", "Pottery"), Hobbyist("pot1", "Pottery"), Hobbyist("pai2", "Painting"),
        Hobbyist("pai0", "Painting"), Hobbyist("pai1", "Painting"), Hobbyist("pot2", "Pottery"),
    };
    for (std::size_t i = 3; i < 6; ++i)
        users[i].coordinates = {46.0, -120.0}; // ~69 miles north

    std::vector<IndexGroup> groups{{0, 1, 2}, {3, 4, 5}};
    CHECK(ClusteringEngine::InterestSwaps(groups, users, SwapOptions()) == 0);

    // Groups at the minimum size never trade members.
    std::vector<Profile> local(users.begin(), users.end());
    for (auto& p : local)
        p.coordinates = {45.0, -120.0};
    ClusteringOptions tight = SwapOptions();
    tight.minGroupSize = 3;
    std::vector<IndexGroup> atMin{{0, 1, 2}, {3, 4, 5}};
    CHECK(ClusteringEngine::InterestSwaps(atMin, local, tight) == 0);
    CHECK(atMin[0] == IndexGroup{0, 1, 2});
}
