#include "tribe/model/Tribe.hpp"

#include <algorithm>

namespace tribe {

int Tribe::seatedCount() const noexcept
{
    return static_cast<int>(std::count_if(members.begin(), members.end(),
                                          [](const TribeMember& m) { return m.occupiesSeat(); }));
}

int Tribe::spareSeats() const noexcept
{
    return std::max(0, maxMembers - seatedCount());
}

std::string_view ToString(MemberRole r) noexcept
{
    return r == MemberRole::Creator ? "creator" : "member";
}

std::string_view ToString(MemberStatus s) noexcept
{
    switch (s)
    {
    case MemberStatus::Pending:  return "pending";
    case MemberStatus::Active:   return "active";
    case MemberStatus::Inactive: return "inactive";
    case MemberStatus::Removed:  return "removed";
    case MemberStatus::Left:     return "left";
    }
    return "unknown";
}

std::optional<MemberRole> ParseRole(std::string_view s) noexcept
{
    if (s == "creator") return MemberRole::Creator;
    if (s == "member")  return MemberRole::Member;
    return std::nullopt;
}

std::optional<MemberStatus> ParseStatus(std::string_view s) noexcept
{
    if (s == "pending")  return MemberStatus::Pending;
    if (s == "active")   return MemberStatus::Active;
    if (s == "inactive") return MemberStatus::Inactive;
    if (s == "removed")  return MemberStatus::Removed;
    if (s == "left")     return MemberStatus::Left;
    return std::nullopt;
}

} // namespace tribe
