// src/tools/TribeMatchMain.cpp
//
// tribe_match: command-line front end for the matching engine.
// - Reads a JSON snapshot of profiles and tribes
// - Forms tribes for unseated users, ranks candidates for one user, or
//   suggests users and open tribes above the compatibility threshold
// - Prints the result as JSON on stdout; logs go to stderr (and optionally a file)

#include "app/CommandLineArgs.h"

#include "tribe/core/Config.hpp"
#include "tribe/core/Errors.hpp"
#include "tribe/core/Log.hpp"
#include "tribe/io/JsonCodec.hpp"
#include "tribe/io/SnapshotStore.hpp"
#include "tribe/jobs/JobSystem.hpp"
#include "tribe/service/MatchingService.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iostream>

namespace {

template <typename List>
void Truncate(List& list, const std::optional<int>& limit)
{
    if (limit && list.entries.size() > static_cast<std::size_t>(*limit))
        list.entries.resize(static_cast<std::size_t>(*limit));
}

int Run(const tribe::app::CommandLineArgs& args)
{
    tribe::MatchingConfig cfg;
    if (args.configPath && !tribe::LoadConfig(cfg, *args.configPath))
        spdlog::warn("config {} not readable, using defaults", *args.configPath);
    if (const int n = tribe::ApplyEnvironment(cfg))
        spdlog::info("{} setting(s) taken from the environment", n);

    const auto store = tribe::io::JsonSnapshotStore::Load(*args.snapshotPath);
    tribe::jobs::JobSystem jobs(static_cast<std::size_t>(std::max(0, cfg.workerThreads)));
    spdlog::debug("scoring on {} worker(s)", jobs.workerCount());
    tribe::MatchingService service(store, cfg, nullptr, nullptr, &jobs);

    const std::size_t limit = args.limit ? static_cast<std::size_t>(*args.limit) : tribe::kDefaultSuggestionLimit;

    nlohmann::json out;
    if (args.suggestUsersFor)
    {
        out = tribe::io::SuggestionsToJson(*args.suggestUsersFor, service.suggestUsers(*args.suggestUsersFor, limit));
    }
    else if (args.suggestTribesFor)
    {
        out = tribe::io::SuggestionsToJson(*args.suggestTribesFor,
                                           service.suggestTribes(*args.suggestTribesFor, limit, args.region));
    }
    else if (args.scoreUser)
    {
        if (args.scoreTribes)
        {
            std::vector<std::string> ids = args.candidates;
            if (ids.empty())
                for (const auto& t : store.tribes())
                    ids.push_back(t.id);
            auto ranked = service.scoreTribes(*args.scoreUser, ids);
            Truncate(ranked, args.limit);
            out = tribe::io::ToJson(ranked);
        }
        else
        {
            std::vector<std::string> ids = args.candidates;
            if (ids.empty())
                for (const auto& p : store.profiles())
                    if (p.id != *args.scoreUser)
                        ids.push_back(p.id);
            auto ranked = service.scoreUsers(*args.scoreUser, ids);
            Truncate(ranked, args.limit);
            out = tribe::io::ToJson(ranked);
        }
    }
    else
    {
        const std::vector<std::string> ids = args.users.empty() ? store.unseatedUserIds() : args.users;
        out = tribe::io::ToJson(service.formTribes(ids, args.region));
    }

    std::cout << out.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const auto args = tribe::app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::cout << tribe::app::BuildCommandLineHelpText();
        return 0;
    }

    int code = 0;
    try
    {
        tribe::logging::LogOptions logOptions;
        logOptions.level = args.verbose ? spdlog::level::debug : spdlog::level::info;
        logOptions.async = args.asyncLog;
        if (args.logFile)
            logOptions.file = *args.logFile;
        tribe::logging::Init(logOptions);

        for (const auto& u : args.unknown)
            spdlog::warn("ignoring unknown argument: {}", u);

        if (!args.snapshotPath)
        {
            std::cerr << "--snapshot is required\n\n" << tribe::app::BuildCommandLineHelpText();
            return 2;
        }

        code = Run(args);
    }
    catch (const tribe::NotFoundError& e)
    {
        spdlog::error("{}", e.what());
        code = 3;
    }
    catch (const tribe::InvariantViolation& e)
    {
        spdlog::critical("internal fault: {}", e.what());
        code = 70;
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        code = 1;
    }

    tribe::logging::Get()->flush();
    return code;
}
