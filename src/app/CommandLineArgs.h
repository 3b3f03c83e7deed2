#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tribe::app {

// Parsed command line for the tribe_match tool.
//
// Options accept both "--opt value" and "--opt=value"; list options take
// comma-separated ids.
struct CommandLineArgs
{
    bool showHelp = false;
    bool verbose = false;
    bool asyncLog = false;
    bool scoreTribes = false;

    std::optional<std::string> snapshotPath;
    std::optional<std::string> configPath;
    std::optional<std::string> scoreUser;
    std::optional<std::string> suggestUsersFor;
    std::optional<std::string> suggestTribesFor;
    std::optional<std::string> region;
    std::optional<std::string> logFile;
    std::optional<int>         limit;

    std::vector<std::string> users;
    std::vector<std::string> candidates;

    // Unrecognized or malformed arguments (reported, not fatal).
    std::vector<std::string> unknown;
};

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

std::string BuildCommandLineHelpText();

} // namespace tribe::app
