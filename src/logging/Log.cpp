#include "Log.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cctype>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

std::optional<spdlog::level::level_enum> skirmish::logsys::parse_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> skirmish::logsys::init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool file_failed = false;
    if (!options.file.empty()) {
        std::error_code ec;
        if (options.file.has_parent_path()) fs::create_directories(options.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file.string(), true));
        } catch (const spdlog::spdlog_ex&) {
            file_failed = true;
        }
    }

    if (g_logger) spdlog::drop(g_logger->name());
    g_logger = std::make_shared<spdlog::logger>("skirmish", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);

    const auto level = parse_level(options.level);
    spdlog::set_level(level.value_or(spdlog::level::info));
    if (!level) spdlog::warn("Unknown log level '{}', using info", options.level);
    if (file_failed) spdlog::warn("Could not open log file {}; logging to stderr only", options.file.string());

    return g_logger;
}

