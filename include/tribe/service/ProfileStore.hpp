#pragma once

#include "tribe/model/Activity.hpp"
#include "tribe/model/Profile.hpp"
#include "tribe/model/Tribe.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tribe {

struct FormationResult;

// Read side of the persistence collaborator. Unknown ids come back empty;
// I/O failures are thrown.
class IProfileStore
{
public:
    virtual ~IProfileStore() = default;

    virtual std::optional<Profile> loadProfile(const std::string& userId) const = 0;
    virtual std::optional<Tribe> loadTribe(const std::string& tribeId) const = 0;

    // Tribes with at least one free seat, optionally limited to a region.
    virtual std::vector<Tribe> loadTribesWithCapacity(const std::optional<std::string>& region) const = 0;

    virtual std::vector<Profile> loadMemberProfiles(const std::string& tribeId) const = 0;

    // Every stored profile, in store order.
    virtual std::vector<Profile> loadProfiles() const = 0;

    // Tribes where the user holds a seat (pending or active).
    virtual std::vector<std::string> loadUserTribeIds(const std::string& userId) const = 0;
};

// Write/notify side: materializes memberships and fans out activity.
class IAssignmentSink
{
public:
    virtual ~IAssignmentSink() = default;

    virtual void publish(const FormationResult& result) = 0;
    virtual void record(const ActivityRecord& activity) = 0;
};

} // namespace tribe
