// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Both "--opt value" and "--opt=value" are supported
//   - Id lists split on commas and drop empty items
//   - Unknown options and bad values are reported in order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <vector>

namespace {

[[nodiscard]] tribe::app::CommandLineArgs Parse(std::initializer_list<const char*> argv)
{
    std::vector<const char*> v(argv);
    return tribe::app::ParseCommandLineArgs(static_cast<int>(v.size()), v.data());
}

} // namespace

TEST_CASE("CommandLineArgs/BasicFlags")
{
    const auto args = Parse({"tribe_match", "--verbose", "--async-log", "--score-tribes", "-h"});

    CHECK(args.verbose);
    CHECK(args.asyncLog);
    CHECK(args.scoreTribes);
    CHECK(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs/ValuesWithSpaceOrEquals")
{
    const auto args = Parse({
        "tribe_match",
        "--snapshot", "data/snap.json",
        "--config=matching.ini",
        "--score-user", "u1",
        "--region=portland",
        "--limit", "5",
        "--log-file=logs/run.log",
    });

    REQUIRE(args.snapshotPath);
    REQUIRE(args.configPath);
    REQUIRE(args.scoreUser);
    REQUIRE(args.region);
    REQUIRE(args.limit);
    REQUIRE(args.logFile);
    CHECK(*args.snapshotPath == "data/snap.json");
    CHECK(*args.configPath == "matching.ini");
    CHECK(*args.scoreUser == "u1");
    CHECK(*args.region == "portland");
    CHECK(*args.limit == 5);
    CHECK(*args.logFile == "logs/run.log");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs/SuggestOptions")
{
    const auto users = Parse({"tribe_match", "--suggest-users", "u3", "--limit=4"});
    REQUIRE(users.suggestUsersFor);
    CHECK(*users.suggestUsersFor == "u3");
    CHECK_FALSE(users.suggestTribesFor.has_value());
    CHECK(*users.limit == 4);

    const auto tribes = Parse({"tribe_match", "--suggest-tribes=u7", "--region", "portland"});
    REQUIRE(tribes.suggestTribesFor);
    CHECK(*tribes.suggestTribesFor == "u7");
    CHECK(*tribes.region == "portland");
    CHECK(tribes.unknown.empty());

    const auto missing = Parse({"tribe_match", "--suggest-tribes"});
    CHECK_FALSE(missing.suggestTribesFor.has_value());
    REQUIRE(missing.unknown.size() == 1);
    CHECK(missing.unknown[0] == "--suggest-tribes");
}

TEST_CASE("CommandLineArgs/IdLists")
{
    const auto args = Parse({"tribe_match", "--users=a,b,,c", "--candidates", "x,y,"});

    CHECK(args.users == std::vector<std::string>{"a", "b", "c"});
    CHECK(args.candidates == std::vector<std::string>{"x", "y"});
}

TEST_CASE("CommandLineArgs/UnknownAndMalformed")
{
    const auto args = Parse({"tribe_match", "--bogus", "--limit=-2", "--limit=abc", "--snapshot"});

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--bogus");
    CHECK(args.unknown[1] == "--limit=-2");
    CHECK(args.unknown[2] == "--limit=abc");
    CHECK(args.unknown[3] == "--snapshot");
    CHECK_FALSE(args.limit.has_value());
    CHECK_FALSE(args.snapshotPath.has_value());
}

TEST_CASE("CommandLineArgs/HelpTextMentionsEveryOption")
{
    const std::string help = tribe::app::BuildCommandLineHelpText();
    for (const char* opt : {"--snapshot", "--config", "--users", "--region", "--score-user",
                            "--score-tribes", "--candidates", "--limit", "--verbose", "--log-file", "--async-log",
                            "--suggest-users", "--suggest-tribes"})
        CHECK(help.find(opt) != std::string::npos);
}
