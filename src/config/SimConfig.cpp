#include "skirmish/config/SimConfig.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace skirmish::config {

namespace {

    using json = nlohmann::json;

    constexpr int kMaxHp = 1'000'000;
    constexpr int kMaxPower = 1'000'000;
    constexpr int kMaxRounds = 10'000'000;

    const json* FindObject(const json& j, const char* key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_object())
            return nullptr;
        return &*it;
    }

    // Reads an integer if present. Returns false when the key holds another type.
    bool ReadInt(const json& obj, const char* key, int lo, int hi, int& out)
    {
        auto it = obj.find(key);
        if (it == obj.end())
            return true;
        if (!it->is_number_integer())
            return false;
        if (it->is_number_unsigned()) {
            const unsigned long long u = it->get<unsigned long long>();
            out = u > static_cast<unsigned long long>(hi) ? hi : std::max(lo, static_cast<int>(u));
            return true;
        }
        const long long v = it->get<long long>();
        out = static_cast<int>(std::clamp<long long>(v, lo, hi));
        return true;
    }

    bool ReadString(const json& obj, const char* key, std::string& out)
    {
        auto it = obj.find(key);
        if (it == obj.end())
            return true;
        if (!it->is_string())
            return false;
        out = it->get<std::string>();
        return true;
    }

    ConfigError TypeError(const char* section, const char* key, const char* expected)
    {
        return ConfigError{ConfigError::Code::JsonTypeError,
                           std::string(section) + "." + key + " must be " + expected};
    }

} // namespace

std::expected<SimConfig, ConfigError> parse_sim_config(std::string_view json_text)
{
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return std::unexpected(ConfigError{ConfigError::Code::JsonParseError, e.what()});
    }

    if (!j.is_object())
        return std::unexpected(ConfigError{ConfigError::Code::JsonTypeError, "settings root must be an object"});

    SimConfig cfg;

    if (auto it = j.find("version"); it != j.end()) {
        if (!it->is_number_integer())
            return std::unexpected(ConfigError{ConfigError::Code::JsonTypeError, "version must be an integer"});
        // Newer files are still read for the keys we understand.
        if (it->get<int>() > kSimConfigSchemaVersion)
            spdlog::warn("Settings schema version {} is newer than {}; unknown keys are ignored",
                         it->get<int>(), kSimConfigSchemaVersion);
    }

    if (const json* units = FindObject(j, "units")) {
        if (!ReadInt(*units, "start_hp", 1, kMaxHp, cfg.start_hp))
            return std::unexpected(TypeError("units", "start_hp", "an integer"));
    }

    if (const json* attack = FindObject(j, "attack")) {
        int elf = cfg.attack.of(combat::Faction::Elf);
        int goblin = cfg.attack.of(combat::Faction::Goblin);
        if (!ReadInt(*attack, "elf", 1, kMaxPower, elf))
            return std::unexpected(TypeError("attack", "elf", "an integer"));
        if (!ReadInt(*attack, "goblin", 1, kMaxPower, goblin))
            return std::unexpected(TypeError("attack", "goblin", "an integer"));
        cfg.attack.set(combat::Faction::Elf, elf);
        cfg.attack.set(combat::Faction::Goblin, goblin);
    }

    if (const json* limits = FindObject(j, "limits")) {
        if (!ReadInt(*limits, "max_rounds", 1, kMaxRounds, cfg.max_rounds))
            return std::unexpected(TypeError("limits", "max_rounds", "an integer"));
        if (!ReadInt(*limits, "max_power", 1, kMaxPower, cfg.max_power))
            return std::unexpected(TypeError("limits", "max_power", "an integer"));
    }

    if (const json* search = FindObject(j, "search")) {
        if (!ReadInt(*search, "start_power", 1, kMaxPower, cfg.search_start_power))
            return std::unexpected(TypeError("search", "start_power", "an integer"));
    }

    if (const json* logging = FindObject(j, "logging")) {
        if (!ReadString(*logging, "level", cfg.log_level))
            return std::unexpected(TypeError("logging", "level", "a string"));
        if (!ReadString(*logging, "file", cfg.log_file))
            return std::unexpected(TypeError("logging", "file", "a string"));
    }

    return cfg;
}

std::expected<SimConfig, ConfigError> load_sim_config(const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f.is_open())
        return std::unexpected(ConfigError{ConfigError::Code::IoOpenFail, "could not open " + file.string()});

    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_sim_config(ss.str());
}

} // namespace skirmish::config
