#include "tribe/io/JsonCodec.hpp"

#include <stdexcept>
#include <string>

namespace tribe::io {

using nlohmann::json;

namespace {

template <typename E, typename Parse>
E ParseEnum(const json& j, const char* key, E fallback, Parse parse)
{
    if (!j.contains(key))
        return fallback;
    const std::string s = j.at(key).get<std::string>();
    if (const auto v = parse(s))
        return *v;
    throw std::runtime_error(std::string("unknown ") + key + " '" + s + "'");
}

Coordinates CoordinatesFromJson(const json& j)
{
    Coordinates c;
    if (!j.contains("coordinates"))
        return c;
    const json& cj = j.at("coordinates");
    c.latitude = cj.value("latitude", 0.0);
    c.longitude = cj.value("longitude", 0.0);
    return c;
}

json ToJson(const Coordinates& c)
{
    return json{{"latitude", c.latitude}, {"longitude", c.longitude}};
}

Interest InterestFromJson(const json& j)
{
    Interest i;
    i.category = ParseEnum(j, "category", InterestCategory::Social, [](const std::string& s) { return ParseCategory(s); });
    i.name = j.value("name", std::string{});
    i.level = j.value("level", 1);
    i.primary = j.value("isPrimary", false);
    return i;
}

json ToJson(const Interest& i)
{
    json j{{"category", std::string(ToString(i.category))}, {"name", i.name}, {"level", i.level}};
    if (i.primary)
        j["isPrimary"] = true;
    return j;
}

json DetailsToJson(const std::vector<FactorDetail>& details)
{
    json arr = json::array();
    for (const auto& d : details)
    {
        arr.push_back({{"factor", std::string(ToString(d.factor))},
                       {"score", d.score},
                       {"weight", d.weight},
                       {"description", d.description}});
    }
    return arr;
}

json StatusesToJson(const std::vector<ItemResult>& statuses)
{
    json arr = json::array();
    for (const auto& s : statuses)
        arr.push_back({{"id", s.id}, {"status", std::string(ToString(s.status))}});
    return arr;
}

} // namespace

Profile ProfileFromJson(const json& j)
{
    Profile p;
    p.id = j.at("id").get<std::string>();
    p.name = j.value("name", std::string{});
    p.coordinates = CoordinatesFromJson(j);
    p.maxTravelDistance = j.value("maxTravelDistance", 0.0);
    p.communicationStyle = ParseEnum(j, "communicationStyle", CommunicationStyle::Thoughtful,
                                     [](const std::string& s) { return ParseStyle(s); });

    if (j.contains("personalityTraits"))
    {
        for (const auto& t : j.at("personalityTraits"))
        {
            TraitScore ts;
            ts.trait = ParseEnum(t, "trait", PersonalityTrait::Openness, [](const std::string& s) { return ParseTrait(s); });
            ts.score = t.value("score", 0.0);
            p.traits.push_back(ts);
        }
    }
    if (j.contains("interests"))
        for (const auto& i : j.at("interests"))
            p.interests.push_back(InterestFromJson(i));
    return p;
}

Tribe TribeFromJson(const json& j)
{
    Tribe t;
    t.id = j.at("id").get<std::string>();
    t.name = j.value("name", std::string{});
    t.region = j.value("region", std::string{});
    t.coordinates = CoordinatesFromJson(j);
    t.maxMembers = j.value("maxMembers", 8);

    if (j.contains("members"))
    {
        for (const auto& m : j.at("members"))
        {
            TribeMember member;
            member.userId = m.at("userId").get<std::string>();
            member.role = ParseEnum(m, "role", MemberRole::Member, [](const std::string& s) { return ParseRole(s); });
            member.status = ParseEnum(m, "status", MemberStatus::Active, [](const std::string& s) { return ParseStatus(s); });
            t.members.push_back(std::move(member));
        }
    }
    if (j.contains("interests"))
        for (const auto& i : j.at("interests"))
            t.interests.push_back(InterestFromJson(i));
    return t;
}

json ToJson(const Profile& p)
{
    json traits = json::array();
    for (const auto& t : p.traits)
        traits.push_back({{"trait", std::string(ToString(t.trait))}, {"score", t.score}});
    json interests = json::array();
    for (const auto& i : p.interests)
        interests.push_back(ToJson(i));

    return json{{"id", p.id},
                {"name", p.name},
                {"coordinates", ToJson(p.coordinates)},
                {"personalityTraits", traits},
                {"interests", interests},
                {"communicationStyle", std::string(ToString(p.communicationStyle))},
                {"maxTravelDistance", p.maxTravelDistance}};
}

json ToJson(const Tribe& t)
{
    json members = json::array();
    for (const auto& m : t.members)
        members.push_back({{"userId", m.userId},
                           {"role", std::string(ToString(m.role))},
                           {"status", std::string(ToString(m.status))}});
    json interests = json::array();
    for (const auto& i : t.interests)
        interests.push_back(ToJson(i));

    return json{{"id", t.id},
                {"name", t.name},
                {"region", t.region},
                {"coordinates", ToJson(t.coordinates)},
                {"maxMembers", t.maxMembers},
                {"members", members},
                {"interests", interests}};
}

json ToJson(const UserCompatibility& c)
{
    return json{{"userId", c.userId},
                {"targetUserId", c.targetUserId},
                {"overall", c.overall},
                {"algorithmic", c.algorithmic},
                {"advisorBlended", c.advisorBlended},
                {"details", DetailsToJson(c.details)}};
}

json ToJson(const TribeCompatibility& c)
{
    json perMember = json::array();
    for (const auto& m : c.perMember)
        perMember.push_back({{"userId", m.userId}, {"score", m.score}});

    return json{{"userId", c.userId},
                {"tribeId", c.tribeId},
                {"overall", c.overall},
                {"details", DetailsToJson(c.details)},
                {"perMember", perMember},
                {"balance", {{"impact", c.balance.impact}, {"improves", c.balance.improves}}}};
}

json ToJson(const RankedList<RankedUser>& list)
{
    json entries = json::array();
    for (const auto& e : list.entries)
        entries.push_back({{"userId", e.userId}, {"score", e.score}, {"detail", ToJson(e.detail)}});
    return json{{"entries", entries}, {"statuses", StatusesToJson(list.statuses)}};
}

json ToJson(const RankedList<RankedTribe>& list)
{
    json entries = json::array();
    for (const auto& e : list.entries)
        entries.push_back({{"tribeId", e.tribeId}, {"score", e.score}, {"detail", ToJson(e.detail)}});
    return json{{"entries", entries}, {"statuses", StatusesToJson(list.statuses)}};
}

json SuggestionsToJson(const std::string& userId, const std::vector<RankedUser>& users)
{
    json suggestions = json::array();
    for (const auto& e : users)
        suggestions.push_back({{"userId", e.userId}, {"score", e.score}, {"detail", ToJson(e.detail)}});
    return json{{"userId", userId}, {"suggestions", suggestions}};
}

json SuggestionsToJson(const std::string& userId, const std::vector<RankedTribe>& tribes)
{
    json suggestions = json::array();
    for (const auto& e : tribes)
        suggestions.push_back({{"tribeId", e.tribeId}, {"score", e.score}, {"detail", ToJson(e.detail)}});
    return json{{"userId", userId}, {"suggestions", suggestions}};
}

json ToJson(const FormationReport& report)
{
    const FormationResult& r = report.result;

    json assignments = json::object();
    for (const auto& a : r.existingAssignments)
        assignments[a.userId] = {{"tribeId", a.tribeId}, {"score", a.score}};

    json newTribes = json::array();
    for (const auto& g : r.newTribes)
    {
        json members = json::array();
        for (const auto& m : g.members)
            members.push_back({{"userId", m.userId}, {"score", m.score}});
        newTribes.push_back({{"members", members}, {"provisional", g.provisional}});
    }

    json out{{"existingAssignments", assignments},
             {"newTribes", newTribes},
             {"optimizationSwaps", r.optimizationSwaps},
             {"statuses", StatusesToJson(report.statuses)},
             {"published", report.published}};

    if (r.advisory)
    {
        json suggestions = json::array();
        for (const auto& s : r.advisory->suggestions)
            suggestions.push_back({{"userId", s.userId}, {"from", s.fromTribe}, {"to", s.toTribe}, {"reason", s.reason}});
        out["advisory"] = {{"insights", r.advisory->insights}, {"suggestions", suggestions}};
    }
    return out;
}

} // namespace tribe::io
