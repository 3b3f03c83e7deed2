#include "tribe/core/Config.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace tribe {

namespace {

void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

std::string_view Trimmed(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

bool ParseInt(std::string_view sv, int& out) noexcept
{
    sv = Trimmed(sv);

    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || sv.empty())
        return false;

    out = v;
    return true;
}

// from_chars for double is not everywhere yet; strtod on a bounded copy.
bool ParseDouble(std::string_view sv, double& out)
{
    sv = Trimmed(sv);
    if (sv.empty())
        return false;

    const std::string copy(sv);
    char* end = nullptr;
    const double v = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size() || !std::isfinite(v))
        return false;

    out = v;
    return true;
}

// Strip trailing inline comments:
//   maxDistanceMiles=25   # miles
//   minGroupSize=4        ; members
void StripInlineComment(std::string& v)
{
    std::size_t cut = std::string::npos;
    auto consider = [&](std::size_t p) {
        if (p == std::string::npos) return;
        if (cut == std::string::npos || p < cut) cut = p;
    };

    consider(v.find('#'));
    consider(v.find(';'));
    consider(v.find("//"));

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

void ApplyKey(MatchingConfig& cfg, const std::string& k, const std::string& v)
{
    auto intField = [&](int& field) {
        int parsed = field;
        if (ParseInt(v, parsed))
            field = parsed;
        else
            spdlog::warn("config: ignoring malformed integer {}={}", k, v);
    };
    auto doubleField = [&](double& field) {
        double parsed = field;
        if (ParseDouble(v, parsed))
            field = parsed;
        else
            spdlog::warn("config: ignoring malformed number {}={}", k, v);
    };

    if (k == "minGroupSize")                 intField(cfg.minGroupSize);
    else if (k == "maxGroupSize")            intField(cfg.maxGroupSize);
    else if (k == "maxDistanceMiles")        doubleField(cfg.maxDistanceMiles);
    else if (k == "compatibilityThreshold")  doubleField(cfg.compatibilityThreshold);
    else if (k == "maxBatchSize")            intField(cfg.maxBatchSize);
    else if (k == "advisorTimeoutMs")        intField(cfg.advisorTimeoutMs);
    else if (k == "cacheTtlSeconds")         intField(cfg.cacheTtlSeconds);
    else if (k == "cacheMaxEntries")         intField(cfg.cacheMaxEntries);
    else if (k == "workerThreads")           intField(cfg.workerThreads);
    else if (k.rfind("weight.", 0) == 0)
    {
        const auto factor = ParseFactor(std::string_view(k).substr(7));
        if (!factor)
        {
            spdlog::warn("config: unknown weight key {}", k);
            return;
        }
        double w = cfg.weights.get(*factor);
        doubleField(w);
        cfg.weights.set(*factor, w);
    }
    else
    {
        spdlog::debug("config: unknown key {}", k);
    }
}

} // namespace

bool LoadConfig(MatchingConfig& cfg, const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;

    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // UTF-8 BOM from Windows editors.
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        if (k.empty()) continue;
        ApplyKey(cfg, k, v);
    }

    return true;
}

bool SaveConfig(const MatchingConfig& cfg, const std::filesystem::path& path)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                          path.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    std::ostringstream oss;
    oss << "minGroupSize="           << cfg.minGroupSize << "\n";
    oss << "maxGroupSize="           << cfg.maxGroupSize << "\n";
    oss << "maxDistanceMiles="       << cfg.maxDistanceMiles << "\n";
    oss << "compatibilityThreshold=" << cfg.compatibilityThreshold << "\n";
    oss << "maxBatchSize="           << cfg.maxBatchSize << "\n";
    oss << "advisorTimeoutMs="       << cfg.advisorTimeoutMs << "\n";
    oss << "cacheTtlSeconds="        << cfg.cacheTtlSeconds << "\n";
    oss << "cacheMaxEntries="        << cfg.cacheMaxEntries << "\n";
    oss << "workerThreads="          << cfg.workerThreads << "\n";
    for (std::size_t i = 0; i < kFactorCount; ++i)
    {
        const auto f = static_cast<CompatibilityFactor>(i);
        oss << "weight." << ToString(f) << "=" << cfg.weights.get(f) << "\n";
    }
    const std::string text = oss.str();

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

int ApplyEnvironment(MatchingConfig& cfg)
{
    int applied = 0;

    if (const char* v = std::getenv("TRIBE_DEFAULT_COMPATIBILITY_THRESHOLD"))
    {
        double parsed = 0.0;
        if (ParseDouble(v, parsed)) { cfg.compatibilityThreshold = parsed; ++applied; }
        else spdlog::warn("env: TRIBE_DEFAULT_COMPATIBILITY_THRESHOLD is not a number: {}", v);
    }
    if (const char* v = std::getenv("TRIBE_DEFAULT_MAX_DISTANCE"))
    {
        double parsed = 0.0;
        if (ParseDouble(v, parsed)) { cfg.maxDistanceMiles = parsed; ++applied; }
        else spdlog::warn("env: TRIBE_DEFAULT_MAX_DISTANCE is not a number: {}", v);
    }
    if (const char* v = std::getenv("TRIBE_MAX_BATCH_SIZE"))
    {
        int parsed = 0;
        if (ParseInt(v, parsed)) { cfg.maxBatchSize = parsed; ++applied; }
        else spdlog::warn("env: TRIBE_MAX_BATCH_SIZE is not an integer: {}", v);
    }

    return applied;
}

int Repair(MatchingConfig& cfg)
{
    int fixes = 0;

    if (cfg.minGroupSize < kMinTribeSize)
    {
        spdlog::warn("config: minGroupSize {} raised to {}", cfg.minGroupSize, kMinTribeSize);
        cfg.minGroupSize = kMinTribeSize;
        ++fixes;
    }
    if (cfg.maxGroupSize > kMaxTribeSize)
    {
        spdlog::warn("config: maxGroupSize {} lowered to {}", cfg.maxGroupSize, kMaxTribeSize);
        cfg.maxGroupSize = kMaxTribeSize;
        ++fixes;
    }
    if (cfg.minGroupSize > cfg.maxGroupSize)
    {
        spdlog::warn("config: minGroupSize {} > maxGroupSize {}; using {}",
                     cfg.minGroupSize, cfg.maxGroupSize, cfg.maxGroupSize);
        cfg.minGroupSize = cfg.maxGroupSize;
        ++fixes;
    }
    if (!(cfg.compatibilityThreshold >= 0.0 && cfg.compatibilityThreshold <= 1.0))
    {
        spdlog::warn("config: compatibilityThreshold {} out of [0,1]; using {}",
                     cfg.compatibilityThreshold, kDefaultThreshold);
        cfg.compatibilityThreshold = kDefaultThreshold;
        ++fixes;
    }
    if (!(cfg.maxDistanceMiles > 0.0) || !std::isfinite(cfg.maxDistanceMiles))
    {
        spdlog::warn("config: maxDistanceMiles {} invalid; using {}",
                     cfg.maxDistanceMiles, kDefaultMaxDistanceMiles);
        cfg.maxDistanceMiles = kDefaultMaxDistanceMiles;
        ++fixes;
    }
    for (std::size_t i = 0; i < kFactorCount; ++i)
    {
        const auto f = static_cast<CompatibilityFactor>(i);
        const double w = cfg.weights.get(f);
        if (!(w >= 0.0) || !std::isfinite(w))
        {
            spdlog::warn("config: weight.{} {} invalid; using 0", ToString(f), w);
            cfg.weights.set(f, 0.0);
            ++fixes;
        }
    }
    if (!(cfg.weights.sum() > 0.0))
    {
        spdlog::warn("config: factor weights sum to zero; using defaults");
        cfg.weights = FactorWeights{};
        ++fixes;
    }
    if (cfg.maxBatchSize <= 0)
    {
        cfg.maxBatchSize = 1000;
        ++fixes;
    }
    if (cfg.advisorTimeoutMs <= 0)
    {
        cfg.advisorTimeoutMs = 2000;
        ++fixes;
    }
    if (cfg.cacheTtlSeconds < 0)
    {
        cfg.cacheTtlSeconds = 0;
        ++fixes;
    }
    if (cfg.cacheMaxEntries <= 0)
    {
        cfg.cacheMaxEntries = 50000;
        ++fixes;
    }
    if (cfg.workerThreads < 0)
    {
        cfg.workerThreads = 0;
        ++fixes;
    }

    return fixes;
}

} // namespace tribe
