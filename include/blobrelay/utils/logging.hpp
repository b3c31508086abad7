#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace blobrelay::utils {

// Log levels
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

// Name of the logger installed by init_logging()
inline constexpr const char* LOGGER_NAME = "blobrelay";

// Initialize logging. Safe to call more than once; later calls only
// change the level and pattern of the existing logger.
void init_logging(LogLevel level = LogLevel::INFO, const std::string& pattern = "");

// Canonical lowercase name of a level
const char* log_level_to_string(LogLevel level);

// Parse a level name, case-insensitively. Accepts the canonical names plus
// "warning", "err", "fatal" and "none"; nullopt for anything else.
std::optional<LogLevel> parse_log_level(const std::string& name);

}  // namespace blobrelay::utils
