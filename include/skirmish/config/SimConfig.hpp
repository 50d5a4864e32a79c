#pragma once
// include/skirmish/config/SimConfig.hpp
//
// Battle settings read from a small JSON file. Every key is optional; values
// that are missing keep their defaults and out-of-range values are clamped.
//
//   { "version": 1,
//     "units":   { "start_hp": 200 },
//     "attack":  { "elf": 3, "goblin": 3 },
//     "limits":  { "max_rounds": 100000, "max_power": 200 },
//     "search":  { "start_power": 4 },
//     "logging": { "level": "info", "file": "" } }

#include "skirmish/combat/CombatTypes.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace skirmish::config {

inline constexpr int kSimConfigSchemaVersion = 1;

struct SimConfig {
    int start_hp = combat::kDefaultStartHp;
    combat::AttackProfile attack{};

    int max_rounds = 100000;
    int max_power = 200;
    int search_start_power = combat::kDefaultAttackPower + 1;

    std::string log_level = "info";
    std::string log_file;
};

struct ConfigError {
    enum class Code {
        IoOpenFail,
        JsonParseError,
        JsonTypeError
    } code{};
    std::string message;
};

[[nodiscard]] std::expected<SimConfig, ConfigError> parse_sim_config(std::string_view json_text);
[[nodiscard]] std::expected<SimConfig, ConfigError> load_sim_config(const std::filesystem::path& file);

} // namespace skirmish::config
