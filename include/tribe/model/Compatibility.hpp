#pragma once

#include "tribe/model/Profile.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tribe {

enum class CompatibilityFactor : std::uint8_t
{
    Personality,
    Interests,
    Communication,
    Location,
    Balance,
};

inline constexpr std::size_t kFactorCount = 5;

std::string_view ToString(CompatibilityFactor f) noexcept;
std::optional<CompatibilityFactor> ParseFactor(std::string_view s) noexcept;

// Non-negative factor weights. Callers may pass any scale; Normalized()
// rescales to a unit sum and falls back to the defaults when the sum is zero.
struct FactorWeights
{
    double personality   = 0.30;
    double interests     = 0.25;
    double communication = 0.20;
    double location      = 0.15;
    double balance       = 0.10;

    [[nodiscard]] double get(CompatibilityFactor f) const noexcept;
    void set(CompatibilityFactor f, double w) noexcept;

    [[nodiscard]] double sum() const noexcept;
    [[nodiscard]] FactorWeights Normalized() const noexcept;

    // Balance zeroed, the remaining four rescaled to a unit sum.
    [[nodiscard]] FactorWeights PairNormalized() const noexcept;
};

struct PersonalityResult
{
    std::array<std::optional<double>, kTraitCount> perTrait{}; // 0..100, unset if missing on a side
    double overall = 0.0;
    std::vector<PersonalityTrait> complementary; // >= 70
    std::vector<PersonalityTrait> conflicting;   // <= 40
};

struct InterestResult
{
    std::vector<std::string> shared; // "category:name"
    double overall      = 0.0;
    bool   primaryMatch = false;
};

struct CommunicationResult
{
    bool   match         = false;
    double overall       = 0.0;
    bool   complementary = false;
};

struct LocationResult
{
    double distanceMiles = 0.0;
    bool   withinRange   = false;
    double overall       = 0.0;
};

struct BalanceResult
{
    std::array<double, kTraitCount> currentBalance{};
    std::array<double, kTraitCount> projectedBalance{};
    double impact   = 0.0;
    bool   improves = false;
};

struct FactorDetail
{
    CompatibilityFactor factor = CompatibilityFactor::Personality;
    double              score  = 0.0;
    double              weight = 0.0;
    std::string         description;
};

struct UserCompatibility
{
    std::string               userId;
    std::string               targetUserId;
    double                    overall = 0.0;
    double                    algorithmic = 0.0;
    bool                      advisorBlended = false;
    std::vector<FactorDetail> details;
};

struct MemberScore
{
    std::string userId;
    double      score = 0.0;
};

struct TribeCompatibility
{
    std::string               userId;
    std::string               tribeId;
    double                    overall = 0.0;
    std::vector<FactorDetail> details;
    std::vector<MemberScore>  perMember;
    BalanceResult             balance;
};

} // namespace tribe
