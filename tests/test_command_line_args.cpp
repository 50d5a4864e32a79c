// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Option names are case-insensitive, values are not
//   - Both "--opt value" and "--opt=value" / "--opt:value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] skirmish::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    std::vector<std::string_view> v;
    v.reserve(argv.size());
    for (const auto& a : argv)
        v.push_back(a);
    return skirmish::app::ParseCommandLineArgsFromArgv(v);
}

} // namespace

TEST_CASE("CommandLineArgs defaults to nothing set")
{
    const auto args = Parse({"grid_skirmish"});

    CHECK_FALSE(args.showHelp);
    CHECK_FALSE(args.render);
    CHECK_FALSE(args.verbose);
    CHECK_FALSE(args.inputPath);
    CHECK_FALSE(args.configPath);
    CHECK_FALSE(args.startPower);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({
        "grid_skirmish",
        "--RENDER",
        "-V",
        "--Help",
    });

    CHECK(args.render);
    CHECK(args.verbose);
    CHECK(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs keeps path values verbatim")
{
    const auto args = Parse({
        "grid_skirmish",
        "-I",
        "Maps/Day15.TXT",
        "--config=Settings/Battle.json",
    });

    REQUIRE(args.inputPath);
    REQUIRE(args.configPath);
    CHECK(*args.inputPath == "Maps/Day15.TXT");
    CHECK(*args.configPath == "Settings/Battle.json");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts : and = separators for values")
{
    const auto args = Parse({
        "grid_skirmish",
        "--power=12",
        "--max-rounds:500",
        "--max-power", "64",
    });

    REQUIRE(args.startPower);
    REQUIRE(args.maxRounds);
    REQUIRE(args.maxPower);
    CHECK(*args.startPower == 12);
    CHECK(*args.maxRounds == 500);
    CHECK(*args.maxPower == 64);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "grid_skirmish",
        "--frobnicate",
        "--power=abc",
        "--max-rounds", "0",
        "--render=yes",
        "--max-power", "-5",
        "--input",
    });

    CHECK_FALSE(args.startPower);
    CHECK_FALSE(args.maxRounds);
    CHECK_FALSE(args.maxPower);
    CHECK_FALSE(args.render);
    CHECK_FALSE(args.inputPath);

    REQUIRE(args.unknown.size() == 6);
    CHECK(args.unknown[0] == "--frobnicate");
    CHECK(args.unknown[1] == "--power=abc");
    CHECK(args.unknown[2] == "--max-rounds");
    CHECK(args.unknown[3] == "--render=yes");
    CHECK(args.unknown[4] == "--max-power");
    CHECK(args.unknown[5] == "--input");
}

TEST_CASE("CommandLineArgs help text lists every option")
{
    const std::string help = skirmish::app::BuildCommandLineHelpText();

    for (const char* opt : {"--input", "--config", "--power", "--max-rounds", "--max-power", "--render", "--verbose", "--help"})
        CHECK(help.find(opt) != std::string::npos);
    CHECK(help.find(skirmish::app::kDefaultInputPath) != std::string::npos);
}
