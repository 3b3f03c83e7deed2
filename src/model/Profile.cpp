#include "tribe/model/Profile.hpp"

#include <array>
#include <utility>

namespace tribe {

namespace {

constexpr std::array<std::pair<PersonalityTrait, std::string_view>, kTraitCount> kTraitNames{{
    {PersonalityTrait::Openness,          "openness"},
    {PersonalityTrait::Conscientiousness, "conscientiousness"},
    {PersonalityTrait::Extraversion,      "extraversion"},
    {PersonalityTrait::Agreeableness,     "agreeableness"},
    {PersonalityTrait::Neuroticism,       "neuroticism"},
}};

constexpr std::array<std::pair<InterestCategory, std::string_view>, 8> kCategoryNames{{
    {InterestCategory::Outdoors,   "outdoors"},
    {InterestCategory::Arts,       "arts"},
    {InterestCategory::Technology, "technology"},
    {InterestCategory::Sports,     "sports"},
    {InterestCategory::Social,     "social"},
    {InterestCategory::Learning,   "learning"},
    {InterestCategory::Wellness,   "wellness"},
    {InterestCategory::Food,       "food"},
}};

constexpr std::array<std::pair<CommunicationStyle, std::string_view>, kStyleCount> kStyleNames{{
    {CommunicationStyle::Direct,     "direct"},
    {CommunicationStyle::Thoughtful, "thoughtful"},
    {CommunicationStyle::Expressive, "expressive"},
    {CommunicationStyle::Supportive, "supportive"},
    {CommunicationStyle::Analytical, "analytical"},
}};

template <typename E, std::size_t N>
std::string_view NameOf(const std::array<std::pair<E, std::string_view>, N>& table, E v) noexcept
{
    for (const auto& [e, n] : table)
        if (e == v)
            return n;
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> Lookup(const std::array<std::pair<E, std::string_view>, N>& table, std::string_view s) noexcept
{
    for (const auto& [e, n] : table)
        if (n == s)
            return e;
    return std::nullopt;
}

} // namespace

std::string Interest::key() const
{
    std::string out(ToString(category));
    out += ':';
    out += name;
    return out;
}

std::optional<double> Profile::traitScore(PersonalityTrait t) const
{
    for (const auto& ts : traits)
        if (ts.trait == t)
            return ts.score;
    return std::nullopt;
}

bool IsPrimaryForUser(const Interest& interest) noexcept
{
    return interest.primary || interest.level >= kPrimaryInterestLevel;
}

std::string_view ToString(PersonalityTrait t) noexcept { return NameOf(kTraitNames, t); }
std::string_view ToString(InterestCategory c) noexcept { return NameOf(kCategoryNames, c); }
std::string_view ToString(CommunicationStyle s) noexcept { return NameOf(kStyleNames, s); }

std::optional<PersonalityTrait> ParseTrait(std::string_view s) noexcept { return Lookup(kTraitNames, s); }
std::optional<InterestCategory> ParseCategory(std::string_view s) noexcept { return Lookup(kCategoryNames, s); }
std::optional<CommunicationStyle> ParseStyle(std::string_view s) noexcept { return Lookup(kStyleNames, s); }

} // namespace tribe
