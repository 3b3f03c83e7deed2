#include "tribe/model/Activity.hpp"

#include <type_traits>

namespace tribe {

const char* ActivityKind(const ActivityData& data) noexcept
{
    return std::visit([](const auto& d) -> const char* {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, TribeCreated>)
            return "tribe_created";
        else if constexpr (std::is_same_v<T, MemberJoined>)
            return "member_joined";
        else if constexpr (std::is_same_v<T, AdvisorSuggestion>)
            return "advisor_suggestion";
        else
            return "opaque";
    }, data);
}

} // namespace tribe
