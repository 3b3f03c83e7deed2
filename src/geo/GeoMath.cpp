#include "tribe/geo/GeoMath.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace tribe::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

constexpr double ToRadians(double deg) noexcept { return deg * kPi / 180.0; }

std::vector<std::string> Keys(const std::vector<Interest>& interests)
{
    std::vector<std::string> out;
    out.reserve(interests.size());
    for (const auto& i : interests)
        out.push_back(i.key());
    return out;
}

} // namespace

double DistanceKm(const Coordinates& a, const Coordinates& b) noexcept
{
    if (a.latitude == b.latitude && a.longitude == b.longitude)
        return 0.0;

    const double dLat = ToRadians(b.latitude - a.latitude);
    const double dLon = ToRadians(b.longitude - a.longitude);

    const double sinLat = std::sin(dLat / 2.0);
    const double sinLon = std::sin(dLon / 2.0);
    double h = sinLat * sinLat +
               std::cos(ToRadians(a.latitude)) * std::cos(ToRadians(b.latitude)) * sinLon * sinLon;
    h = std::clamp(h, 0.0, 1.0);

    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double SetSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b)
{
    const std::set<std::string> sa(a.begin(), a.end());
    const std::set<std::string> sb(b.begin(), b.end());

    if (sa.empty() && sb.empty())
        return 1.0;
    if (sa.empty() || sb.empty())
        return 0.0;

    std::size_t inter = 0;
    for (const auto& k : sa)
        inter += sb.count(k);

    const std::size_t uni = sa.size() + sb.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

double InterestSimilarity(const std::vector<Interest>& a, const std::vector<Interest>& b)
{
    return SetSimilarity(Keys(a), Keys(b));
}

} // namespace tribe::geo
