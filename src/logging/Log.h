#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace skirmish::logsys {
    struct LogOptions {
        std::string level = "info";       // trace|debug|info|warn|error|critical|off
        std::filesystem::path file;       // empty = stderr only
    };

    // Installs the "skirmish" logger (stderr, plus a file sink when requested)
    // as spdlog's default logger. Safe to call more than once.
    std::shared_ptr<spdlog::logger> init(const LogOptions& options);

    std::optional<spdlog::level::level_enum> parse_level(std::string_view name);
}
