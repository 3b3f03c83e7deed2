#pragma once

#include "tribe/model/Profile.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tribe {

enum class MemberRole : std::uint8_t { Creator, Member };

enum class MemberStatus : std::uint8_t
{
    Pending,
    Active,
    Inactive,
    Removed,
    Left,
};

struct TribeMember
{
    std::string  userId;
    MemberRole   role   = MemberRole::Member;
    MemberStatus status = MemberStatus::Active;

    // Pending and active members hold a seat.
    [[nodiscard]] bool occupiesSeat() const noexcept
    {
        return status == MemberStatus::Pending || status == MemberStatus::Active;
    }
};

struct Tribe
{
    std::string              id;
    std::string              name;
    std::string              region;
    Coordinates              coordinates;
    std::vector<TribeMember> members;
    int                      maxMembers = 8;
    std::vector<Interest>    interests;

    [[nodiscard]] int seatedCount() const noexcept;
    [[nodiscard]] int spareSeats() const noexcept;
    [[nodiscard]] bool hasCapacity() const noexcept { return spareSeats() > 0; }
};

std::string_view ToString(MemberRole r) noexcept;
std::string_view ToString(MemberStatus s) noexcept;
std::optional<MemberRole>   ParseRole(std::string_view s) noexcept;
std::optional<MemberStatus> ParseStatus(std::string_view s) noexcept;

} // namespace tribe
