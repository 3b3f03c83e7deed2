#pragma once

#include "tribe/model/Profile.hpp"
#include "tribe/model/Tribe.hpp"
#include "tribe/service/MatchingService.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tribe::io {

// Snapshot schema (lower-case enum names):
//   profile: { id, name, coordinates:{latitude,longitude},
//              personalityTraits:[{trait,score}], interests:[{category,name,level}],
//              communicationStyle, maxTravelDistance }
//   tribe:   { id, name, region, coordinates, maxMembers,
//              members:[{userId,role,status}], interests:[{category,name,isPrimary}] }
// Unknown enum names throw std::runtime_error.

Profile ProfileFromJson(const nlohmann::json& j);
Tribe   TribeFromJson(const nlohmann::json& j);

nlohmann::json ToJson(const Profile& p);
nlohmann::json ToJson(const Tribe& t);
nlohmann::json ToJson(const UserCompatibility& c);
nlohmann::json ToJson(const TribeCompatibility& c);
nlohmann::json ToJson(const RankedList<RankedUser>& list);
nlohmann::json ToJson(const RankedList<RankedTribe>& list);
nlohmann::json ToJson(const FormationReport& report);

// { "userId": ..., "suggestions": [{ userId|tribeId, score, detail }] }
nlohmann::json SuggestionsToJson(const std::string& userId, const std::vector<RankedUser>& users);
nlohmann::json SuggestionsToJson(const std::string& userId, const std::vector<RankedTribe>& tribes);

} // namespace tribe::io
