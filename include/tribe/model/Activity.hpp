#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tribe {

struct TribeCreated
{
    std::vector<std::string> memberIds;
    bool                     provisional = false;
};

struct MemberJoined
{
    std::string userId;
    double      score = 0.0;
};

struct AdvisorSuggestion
{
    std::string userId;
    std::string fromTribe;
    std::string toTribe;
    std::string reason;
};

// Unknown activity kinds keep their payload as flat key/value pairs.
struct OpaquePayload
{
    std::string                                      kind;
    std::vector<std::pair<std::string, std::string>> fields;
};

using ActivityData = std::variant<TribeCreated, MemberJoined, AdvisorSuggestion, OpaquePayload>;

struct ActivityRecord
{
    std::string                           tribeId;
    std::chrono::system_clock::time_point at = std::chrono::system_clock::now();
    ActivityData                          data;
};

const char* ActivityKind(const ActivityData& data) noexcept;

} // namespace tribe
