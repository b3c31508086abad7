#include "blobrelay/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

namespace blobrelay::utils {

namespace {
std::mutex init_mutex;

struct LevelName {
    LogLevel level;
    const char* name;
    spdlog::level::level_enum spdlog_level;
};

// First entry per level is its canonical name; the rest are accepted aliases
constexpr std::array<LevelName, 11> kLevelNames{{
    {LogLevel::TRACE, "trace", spdlog::level::trace},
    {LogLevel::DEBUG, "debug", spdlog::level::debug},
    {LogLevel::INFO, "info", spdlog::level::info},
    {LogLevel::WARN, "warn", spdlog::level::warn},
    {LogLevel::WARN, "warning", spdlog::level::warn},
    {LogLevel::ERROR, "error", spdlog::level::err},
    {LogLevel::ERROR, "err", spdlog::level::err},
    {LogLevel::CRITICAL, "critical", spdlog::level::critical},
    {LogLevel::CRITICAL, "fatal", spdlog::level::critical},
    {LogLevel::OFF, "off", spdlog::level::off},
    {LogLevel::OFF, "none", spdlog::level::off},
}};

const LevelName& entry_for(LogLevel level) {
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                           [level](const LevelName& entry) { return entry.level == level; });
    return it != kLevelNames.end() ? *it : kLevelNames[2];
}
}  // namespace

void init_logging(LogLevel level, const std::string& pattern) {
    std::lock_guard<std::mutex> lock(init_mutex);

    // spdlog refuses to register the same name twice
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
    }
    logger->set_level(entry_for(level).spdlog_level);
    logger->set_pattern(pattern.empty() ? "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v" : pattern);
    spdlog::set_default_logger(logger);
}

const char* log_level_to_string(LogLevel level) {
    return entry_for(level).name;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (const auto& entry : kLevelNames) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

}  // namespace blobrelay::utils
