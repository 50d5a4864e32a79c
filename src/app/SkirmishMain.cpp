// grid_skirmish: plays a battle from a map file, then searches for the
// smallest elf attack power that wins without losing an elf.

#include "app/CommandLineArgs.h"
#include "logging/Log.h"

#include "skirmish/combat/PowerSearch.hpp"
#include "skirmish/combat/RoundEngine.hpp"
#include "skirmish/config/SimConfig.hpp"
#include "skirmish/io/BoardText.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace {

enum ExitCode : int {
    kExitOk = 0,
    kExitBadArgs = 1,
    kExitBadInput = 2,
    kExitUnresolved = 3,
};

bool ReadTextFile(const std::string& path, std::string& out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace skirmish;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp) {
        std::cout << app::BuildCommandLineHelpText();
        return kExitOk;
    }
    if (!args.unknown.empty()) {
        for (const auto& u : args.unknown)
            std::cerr << "Unknown or invalid argument: " << u << "\n";
        std::cerr << "\n" << app::BuildCommandLineHelpText();
        return kExitBadArgs;
    }

    // Settings: an explicit --config must load; otherwise defaults.
    config::SimConfig cfg;
    if (args.configPath) {
        auto loaded = config::load_sim_config(*args.configPath);
        if (!loaded) {
            logsys::init({});
            spdlog::error("Settings {}: {}", *args.configPath, loaded.error().message);
            return kExitBadInput;
        }
        cfg = std::move(*loaded);
    }

    if (args.startPower) cfg.search_start_power = *args.startPower;
    if (args.maxRounds) cfg.max_rounds = *args.maxRounds;
    if (args.maxPower) cfg.max_power = *args.maxPower;

    logsys::LogOptions logOpts;
    logOpts.level = args.verbose ? "debug" : cfg.log_level;
    logOpts.file = cfg.log_file;
    logsys::init(logOpts);

    const std::string inputPath = args.inputPath.value_or(std::string(app::kDefaultInputPath));
    spdlog::info("Using input {}", inputPath);

    std::string text;
    if (!ReadTextFile(inputPath, text)) {
        spdlog::error("Could not open {}", inputPath);
        return kExitBadInput;
    }

    io::ParseOptions parseOpts;
    parseOpts.start_hp = cfg.start_hp;
    parseOpts.attack = cfg.attack;

    auto parsed = io::parse_battle(text, parseOpts);
    if (!parsed) {
        spdlog::error("{}: {}", inputPath, parsed.error().message);
        return kExitBadInput;
    }
    const combat::CombatState initial = std::move(*parsed);
    spdlog::debug("Initial units: {}", io::describe_units(initial));

    const combat::BattleLimits limits{cfg.max_rounds};

    // Phase 1: the battle as given.
    combat::CombatState battle = initial;
    const auto outcome = combat::run_to_completion(battle, limits);
    if (!outcome) {
        spdlog::error("{}", outcome.error().message);
        return kExitUnresolved;
    }

    std::cout << (outcome->winner ? combat::plural(*outcome->winner) : "Nobody") << " win after "
              << outcome->rounds << " rounds with " << outcome->remaining_hp << " hp left. Score: "
              << outcome->score() << "\n";
    if (args.render)
        std::cout << io::render_board(battle) << "\n";

    // Phase 2: weakest elves that lose nobody.
    combat::PowerSearchOptions searchOpts;
    searchOpts.start_power = cfg.search_start_power;
    searchOpts.max_power = cfg.max_power;
    searchOpts.limits = limits;

    const auto best = combat::search_minimal_power(initial, searchOpts);
    if (!best) {
        spdlog::error("Power search: {}", best.error().message);
        return kExitUnresolved;
    }

    std::cout << "Elves win with " << best->power << " power after " << best->rounds
              << " rounds with " << best->remaining_hp << " hp left. Score: " << best->score() << "\n";
    if (args.render)
        std::cout << io::render_board(best->final_state) << "\n";

    spdlog::info("Power search finished after {} attempts", best->attempts);
    return kExitOk;
}
