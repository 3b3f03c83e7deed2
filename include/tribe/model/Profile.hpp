#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tribe {

// Big-Five style traits. Scores are 0..100 intensities, never renormalized
// across traits.
enum class PersonalityTrait : std::uint8_t
{
    Openness,
    Conscientiousness,
    Extraversion,
    Agreeableness,
    Neuroticism,
};

inline constexpr std::size_t kTraitCount = 5;

enum class InterestCategory : std::uint8_t
{
    Outdoors,
    Arts,
    Technology,
    Sports,
    Social,
    Learning,
    Wellness,
    Food,
};

enum class CommunicationStyle : std::uint8_t
{
    Direct,
    Thoughtful,
    Expressive,
    Supportive,
    Analytical,
};

inline constexpr std::size_t kStyleCount = 5;

struct Coordinates
{
    double latitude  = 0.0;
    double longitude = 0.0;
};

struct TraitScore
{
    PersonalityTrait trait = PersonalityTrait::Openness;
    double           score = 0.0; // 0..100
};

struct Interest
{
    InterestCategory category = InterestCategory::Social;
    std::string      name;
    int              level = 1;       // 1..3 on user profiles
    bool             primary = false; // declared primary (tribe interests)

    // "category:name", the identity used for set similarity.
    [[nodiscard]] std::string key() const;
};

// A user profile is a read-only snapshot for the duration of a matching run.
struct Profile
{
    std::string             id;
    std::string             name;
    Coordinates             coordinates;
    std::vector<TraitScore> traits;
    std::vector<Interest>   interests;
    CommunicationStyle      communicationStyle = CommunicationStyle::Thoughtful;
    double                  maxTravelDistance  = 0.0; // miles, 0 = unset

    [[nodiscard]] std::optional<double> traitScore(PersonalityTrait t) const;
};

// User interests count as primary from level 3 upward.
inline constexpr int kPrimaryInterestLevel = 3;

[[nodiscard]] bool IsPrimaryForUser(const Interest& interest) noexcept;

// String conversion (lower-case identifiers, as they appear in snapshots).
std::string_view ToString(PersonalityTrait t) noexcept;
std::string_view ToString(InterestCategory c) noexcept;
std::string_view ToString(CommunicationStyle s) noexcept;

std::optional<PersonalityTrait>   ParseTrait(std::string_view s) noexcept;
std::optional<InterestCategory>   ParseCategory(std::string_view s) noexcept;
std::optional<CommunicationStyle> ParseStyle(std::string_view s) noexcept;

} // namespace tribe
