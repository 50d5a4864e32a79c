#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::app {

// Parsed command-line arguments for the grid_skirmish executable.
//
// Notes:
//   - Option names are case-insensitive; values (paths) are kept verbatim.
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
struct CommandLineArgs
{
    bool showHelp = false;          // --help / -h / -?
    bool render = false;            // --render
    bool verbose = false;           // --verbose / -v

    std::optional<std::string> inputPath;   // --input / -i <path>
    std::optional<std::string> configPath;  // --config / -c <path>

    std::optional<int> startPower;  // --power <n>
    std::optional<int> maxRounds;   // --max-rounds <n>
    std::optional<int> maxPower;    // --max-power <n>

    // Unknown options and options with bad values, in command-line order.
    std::vector<std::string> unknown;
};

inline constexpr std::string_view kDefaultInputPath = "inputs/day15.txt";

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace skirmish::app
