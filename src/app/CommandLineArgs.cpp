#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace skirmish::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Splits "--opt=value" / "--opt:value" at the first separator. Only the name
// is lower-cased so path values survive intact.
struct SplitArg
{
    std::string name;
    std::optional<std::string_view> value;
};

[[nodiscard]] SplitArg Split(std::string_view raw)
{
    SplitArg out;
    const std::size_t sep = raw.find_first_of("=:");
    if (sep == std::string_view::npos) {
        out.name = ToLower(raw);
        return out;
    }
    out.name = ToLower(raw.substr(0, sep));
    out.value = raw.substr(sep + 1);
    return out;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const SplitArg arg = Split(raw);
        const std::string_view name(arg.name);

        // Flags never take a value.
        if (!arg.value) {
            if (name == "--help" || name == "-h" || name == "-?") { out.showHelp = true; continue; }
            if (name == "--render") { out.render = true; continue; }
            if (name == "--verbose" || name == "-v") { out.verbose = true; continue; }
        }

        // Value is either attached ("--opt=v") or the next argument.
        const auto takeValue = [&]() -> std::optional<std::string_view> {
            if (arg.value)
                return arg.value;
            if (i + 1 >= argv.size())
                return std::nullopt;
            return argv[++i];
        };

        const auto takeString = [&](std::optional<std::string>& dst) {
            const auto v = takeValue();
            if (!v || v->empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(*v);
        };

        const auto takeInt = [&](std::optional<int>& dst) {
            const auto v = takeValue();
            const auto parsed = v ? ParseInt(*v) : std::nullopt;
            if (!parsed || *parsed < 1) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        if (name == "--input" || name == "-i") { takeString(out.inputPath); continue; }
        if (name == "--config" || name == "-c") { takeString(out.configPath); continue; }
        if (name == "--power") { takeInt(out.startPower); continue; }
        if (name == "--max-rounds") { takeInt(out.maxRounds); continue; }
        if (name == "--max-power") { takeInt(out.maxPower); continue; }

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i]);
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "grid_skirmish - Command Line Options\n\n";
    oss << "Input\n";
    oss << "  --input, -i <path>       Map file (default " << kDefaultInputPath << ")\n";
    oss << "  --config, -c <path>      JSON settings file\n\n";

    oss << "Battle\n";
    oss << "  --power <n>              First elf attack power tried by the search\n";
    oss << "  --max-rounds <n>         Give up on a battle after n rounds\n";
    oss << "  --max-power <n>          Give up the search after power n\n";
    oss << "  --render                 Print the final board of each battle\n\n";

    oss << "Misc\n";
    oss << "  --verbose, -v            Debug logging\n";
    oss << "  --help, -h               Show this help\n\n";

    oss << "Examples\n";
    oss << "  grid_skirmish -i inputs/day15.txt\n";
    oss << "  grid_skirmish --input=map.txt --power 3 --render\n";
    return oss.str();
}

} // namespace skirmish::app
