#include "app/CommandLineArgs.h"

#include <charconv>
#include <sstream>
#include <string_view>
#include <system_error>

namespace tribe::app {

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    // --opt=value
    const std::size_t n = prefix.size();
    if (arg.size() <= n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty())
        return std::nullopt;
    return v;
}

[[nodiscard]] std::vector<std::string> SplitIds(std::string_view s)
{
    std::vector<std::string> out;
    while (!s.empty())
    {
        const std::size_t comma = s.find(',');
        const std::string_view item = s.substr(0, comma);
        if (!item.empty())
            out.emplace_back(item);
        if (comma == std::string_view::npos)
            break;
        s.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    CommandLineArgs out;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i] ? argv[i] : "");
        if (arg.empty())
            continue;

        if (arg == "--help" || arg == "-h") { out.showHelp = true; continue; }
        if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        if (arg == "--async-log") { out.asyncLog = true; continue; }
        if (arg == "--score-tribes") { out.scoreTribes = true; continue; }

        // Options with values: "--opt value" or "--opt=value".
        const auto valueFor = [&](std::string_view name, std::string_view& value) -> bool {
            if (arg == name)
            {
                if (i + 1 >= argc)
                {
                    out.unknown.emplace_back(arg);
                    return false;
                }
                value = argv[++i];
                return true;
            }
            return ConsumeValue(arg, name, value);
        };

        std::string_view value;
        if (arg == "--snapshot" || StartsWith(arg, "--snapshot=")) {
            if (valueFor("--snapshot", value)) out.snapshotPath = std::string(value);
            continue;
        }
        if (arg == "--config" || StartsWith(arg, "--config=")) {
            if (valueFor("--config", value)) out.configPath = std::string(value);
            continue;
        }
        if (arg == "--score-user" || StartsWith(arg, "--score-user=")) {
            if (valueFor("--score-user", value)) out.scoreUser = std::string(value);
            continue;
        }
        if (arg == "--suggest-users" || StartsWith(arg, "--suggest-users=")) {
            if (valueFor("--suggest-users", value)) out.suggestUsersFor = std::string(value);
            continue;
        }
        if (arg == "--suggest-tribes" || StartsWith(arg, "--suggest-tribes=")) {
            if (valueFor("--suggest-tribes", value)) out.suggestTribesFor = std::string(value);
            continue;
        }
        if (arg == "--region" || StartsWith(arg, "--region=")) {
            if (valueFor("--region", value)) out.region = std::string(value);
            continue;
        }
        if (arg == "--log-file" || StartsWith(arg, "--log-file=")) {
            if (valueFor("--log-file", value)) out.logFile = std::string(value);
            continue;
        }
        if (arg == "--users" || StartsWith(arg, "--users=")) {
            if (valueFor("--users", value)) out.users = SplitIds(value);
            continue;
        }
        if (arg == "--candidates" || StartsWith(arg, "--candidates=")) {
            if (valueFor("--candidates", value)) out.candidates = SplitIds(value);
            continue;
        }
        if (arg == "--limit" || StartsWith(arg, "--limit=")) {
            if (valueFor("--limit", value))
            {
                if (const auto n = ParseInt(value); n && *n >= 0)
                    out.limit = *n;
                else
                    out.unknown.emplace_back(arg);
            }
            continue;
        }

        // Anything else is unknown.
        out.unknown.emplace_back(arg);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "tribe_match - group formation and compatibility scoring\n\n";
    oss << "Input\n";
    oss << "  --snapshot <file>        JSON snapshot with \"profiles\" and \"tribes\" (required)\n";
    oss << "  --config <file>          key=value matching config (optional)\n\n";

    oss << "Form tribes (default)\n";
    oss << "  --users a,b,c            users to place (default: everyone without a seat)\n";
    oss << "  --region <name>          only consider existing tribes in this region\n\n";

    oss << "Score\n";
    oss << "  --score-user <id>        rank candidates for this user\n";
    oss << "  --score-tribes           rank tribes instead of users\n";
    oss << "  --candidates a,b,c       candidate ids (default: all)\n";
    oss << "  --limit <n>              keep the first n entries\n\n";

    oss << "Suggest\n";
    oss << "  --suggest-users <id>     users above the threshold for this user\n";
    oss << "  --suggest-tribes <id>    open tribes the user has not joined (honors --region)\n";
    oss << "                           --limit caps the list (default 10)\n\n";

    oss << "Logging\n";
    oss << "  --verbose, -v            debug logging\n";
    oss << "  --log-file <path>        also log to a file\n";
    oss << "  --async-log              log from a background thread\n\n";

    oss << "Misc\n";
    oss << "  --help, -h               Show this help\n\n";

    oss << "Examples\n";
    oss << "  tribe_match --snapshot data/sample_snapshot.json\n";
    oss << "  tribe_match --snapshot data/sample_snapshot.json --score-user u1 --limit 5\n";
    oss << "  tribe_match --snapshot data/sample_snapshot.json --score-user u1 --score-tribes\n";
    oss << "  tribe_match --snapshot data/sample_snapshot.json --suggest-tribes u3 --limit 3\n";
    return oss.str();
}

} // namespace tribe::app
