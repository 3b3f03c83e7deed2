#include "tribe/model/Compatibility.hpp"

#include <cmath>

namespace tribe {

std::string_view ToString(CompatibilityFactor f) noexcept
{
    switch (f)
    {
    case CompatibilityFactor::Personality:   return "personality";
    case CompatibilityFactor::Interests:     return "interests";
    case CompatibilityFactor::Communication: return "communication";
    case CompatibilityFactor::Location:      return "location";
    case CompatibilityFactor::Balance:       return "balance";
    }
    return "unknown";
}

std::optional<CompatibilityFactor> ParseFactor(std::string_view s) noexcept
{
    if (s == "personality")   return CompatibilityFactor::Personality;
    if (s == "interests")     return CompatibilityFactor::Interests;
    if (s == "communication") return CompatibilityFactor::Communication;
    if (s == "location")      return CompatibilityFactor::Location;
    if (s == "balance")       return CompatibilityFactor::Balance;
    return std::nullopt;
}

double FactorWeights::get(CompatibilityFactor f) const noexcept
{
    switch (f)
    {
    case CompatibilityFactor::Personality:   return personality;
    case CompatibilityFactor::Interests:     return interests;
    case CompatibilityFactor::Communication: return communication;
    case CompatibilityFactor::Location:      return location;
    case CompatibilityFactor::Balance:       return balance;
    }
    return 0.0;
}

void FactorWeights::set(CompatibilityFactor f, double w) noexcept
{
    switch (f)
    {
    case CompatibilityFactor::Personality:   personality = w; break;
    case CompatibilityFactor::Interests:     interests = w; break;
    case CompatibilityFactor::Communication: communication = w; break;
    case CompatibilityFactor::Location:      location = w; break;
    case CompatibilityFactor::Balance:       balance = w; break;
    }
}

double FactorWeights::sum() const noexcept
{
    return personality + interests + communication + location + balance;
}

namespace {

// Negative or non-finite entries do not contribute.
double Sanitize(double w) noexcept
{
    return (std::isfinite(w) && w > 0.0) ? w : 0.0;
}

} // namespace

FactorWeights FactorWeights::Normalized() const noexcept
{
    FactorWeights w;
    w.personality   = Sanitize(personality);
    w.interests     = Sanitize(interests);
    w.communication = Sanitize(communication);
    w.location      = Sanitize(location);
    w.balance       = Sanitize(balance);

    const double total = w.sum();
    if (!(total > 0.0))
        return FactorWeights{};

    w.personality   /= total;
    w.interests     /= total;
    w.communication /= total;
    w.location      /= total;
    w.balance       /= total;
    return w;
}

FactorWeights FactorWeights::PairNormalized() const noexcept
{
    FactorWeights w = Normalized();
    w.balance = 0.0;
    const double total = w.sum();
    if (!(total > 0.0))
    {
        // Only balance carried weight; use the default pair split.
        w = FactorWeights{};
        w.balance = 0.0;
    }
    const double t = w.sum();
    w.personality   /= t;
    w.interests     /= t;
    w.communication /= t;
    w.location      /= t;
    return w;
}

} // namespace tribe
