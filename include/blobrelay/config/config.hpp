#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "blobrelay/receiver/reassembler.hpp"
#include "blobrelay/sender/dispatcher.hpp"
#include "blobrelay/sender/fragmenter.hpp"
#include "blobrelay/utils/logging.hpp"

namespace blobrelay::config {

// Everything a sender/receiver pair can be tuned with
struct RelayConfig {
    sender::FragmenterConfig fragmenter;
    sender::DispatcherConfig dispatcher;
    receiver::ReassemblerConfig reassembler;
    std::chrono::milliseconds sweep_interval{1000};
    utils::LogLevel log_level{utils::LogLevel::INFO};
};

// Parse configuration from an INI file. Sections: [sender], [transport],
// [receiver], [logging]. Unknown keys are ignored.
std::optional<RelayConfig> load_config(const std::string& path, std::string* error = nullptr);

// Parse configuration from CLI arguments
std::optional<RelayConfig> parse_cli(int argc, char* argv[]);

// Save configuration to file
bool save_config(const RelayConfig& config, const std::string& path);

// Apply every value in overlay that differs from the defaults
RelayConfig merge_config(const RelayConfig& base, const RelayConfig& overlay);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const RelayConfig& config);

// Comma separated list helpers for required_attributes
std::vector<std::string> split_list(const std::string& value);
std::string join_list(const std::vector<std::string>& values);

}  // namespace blobrelay::config
