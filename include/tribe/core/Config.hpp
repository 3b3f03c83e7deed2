#pragma once

#include "tribe/model/Compatibility.hpp"

#include <filesystem>
#include <string>

namespace tribe {

inline constexpr int    kMinTribeSize            = 4;
inline constexpr int    kMaxTribeSize            = 8;
inline constexpr double kDefaultThreshold        = 0.70;
inline constexpr double kDefaultMaxDistanceMiles = 25.0;

struct MatchingConfig
{
    int           minGroupSize           = kMinTribeSize;
    int           maxGroupSize           = kMaxTribeSize;
    double        maxDistanceMiles       = kDefaultMaxDistanceMiles;
    double        compatibilityThreshold = kDefaultThreshold; // 0..1
    FactorWeights weights;
    int           maxBatchSize           = 1000;
    int           advisorTimeoutMs       = 2000;
    int           cacheTtlSeconds        = 24 * 60 * 60;
    int           cacheMaxEntries        = 50000; // per cache
    int           workerThreads          = 0; // 0 = hardware concurrency
};

// key=value file; '#' / ';' comments. Unknown keys and malformed values are
// ignored. Returns false if the file cannot be read (cfg keeps its values).
bool LoadConfig(MatchingConfig& cfg, const std::filesystem::path& path);
bool SaveConfig(const MatchingConfig& cfg, const std::filesystem::path& path);

// TRIBE_DEFAULT_COMPATIBILITY_THRESHOLD, TRIBE_DEFAULT_MAX_DISTANCE, TRIBE_MAX_BATCH_SIZE.
// Returns the number of overrides applied.
int ApplyEnvironment(MatchingConfig& cfg);

// Clamps recoverable operator mistakes back into range. Returns the number
// of fields changed; each change is logged as a warning.
int Repair(MatchingConfig& cfg);

} // namespace tribe
