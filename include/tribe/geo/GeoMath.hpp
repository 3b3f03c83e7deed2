#pragma once

#include "tribe/model/Profile.hpp"

#include <string>
#include <vector>

namespace tribe::geo {

inline constexpr double kEarthRadiusKm = 6371.0;
inline constexpr double kMilesPerKm    = 0.621371;

// Great-circle distance (haversine) in kilometres between two points in degrees.
[[nodiscard]] double DistanceKm(const Coordinates& a, const Coordinates& b) noexcept;

[[nodiscard]] constexpr double KmToMiles(double km) noexcept { return km * kMilesPerKm; }
[[nodiscard]] constexpr double MilesToKm(double miles) noexcept { return miles / kMilesPerKm; }

[[nodiscard]] inline double DistanceMiles(const Coordinates& a, const Coordinates& b) noexcept
{
    return KmToMiles(DistanceKm(a, b));
}

// Jaccard coefficient over string keys (duplicates collapse).
// Both empty -> 1.0, exactly one empty -> 0.0.
[[nodiscard]] double SetSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Jaccard over the (category,name) keys of two interest lists.
[[nodiscard]] double InterestSimilarity(const std::vector<Interest>& a, const std::vector<Interest>& b);

} // namespace tribe::geo
