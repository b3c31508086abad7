#include "blobrelay/config/config.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "blobrelay/codec/base64.hpp"

namespace blobrelay::config {

namespace {

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line_number;
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));

            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }

            entries.push_back({current_section, key, value, line_number});
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::chrono::milliseconds parse_ms(const std::string& value) {
    return std::chrono::milliseconds(std::stoll(value));
}

// Parse a non-negative integer that must fit T. std::stoull alone accepts
// "-1" and wraps it, so the sign and the range are checked here.
template <typename T>
T parse_unsigned(const std::string& value) {
    const std::string text = trim(value);
    if (!text.empty() && text[0] == '-') {
        throw std::out_of_range("negative value " + text);
    }
    size_t consumed = 0;
    const unsigned long long parsed = std::stoull(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("trailing characters in " + text);
    }
    if (parsed > std::numeric_limits<T>::max()) {
        throw std::out_of_range(text + " exceeds " +
                                std::to_string(std::numeric_limits<T>::max()));
    }
    return static_cast<T>(parsed);
}

// Returns false for keys this section does not know
bool apply_sender(sender::FragmenterConfig& config, const std::string& key,
                  const std::string& value) {
    if (key == "fragment_size") {
        config.fragment_size = parse_unsigned<uint32_t>(value);
    } else if (key == "max_transfer_size") {
        config.max_transfer_size = parse_unsigned<uint64_t>(value);
    } else if (key == "max_message_size") {
        config.max_message_size = parse_unsigned<size_t>(value);
    } else if (key == "encoding") {
        auto encoding = codec::string_to_encoding(value);
        if (!encoding) {
            throw std::invalid_argument("unknown encoding '" + value + "'");
        }
        config.encoding = *encoding;
    } else {
        return false;
    }
    return true;
}

bool apply_transport(sender::DispatcherConfig& config, const std::string& key,
                     const std::string& value) {
    if (key == "topic") {
        config.topic = value;
    } else if (key == "endpoint") {
        config.endpoint = value;
    } else if (key == "ack_deadline_ms") {
        config.ack_deadline = parse_ms(value);
    } else if (key == "max_retries") {
        config.max_retries = parse_unsigned<uint32_t>(value);
    } else if (key == "initial_backoff_ms") {
        config.initial_backoff = parse_ms(value);
    } else if (key == "max_backoff_ms") {
        config.max_backoff = parse_ms(value);
    } else if (key == "backoff_factor") {
        config.backoff_factor = std::stod(value);
    } else {
        return false;
    }
    return true;
}

bool apply_receiver(RelayConfig& config, const std::string& key, const std::string& value) {
    auto& r = config.reassembler;
    if (key == "idle_timeout_ms") {
        r.idle_timeout = parse_ms(value);
    } else if (key == "transfer_timeout_ms") {
        r.transfer_timeout = parse_ms(value);
    } else if (key == "grace_window_ms") {
        r.grace_window = parse_ms(value);
    } else if (key == "max_transfers") {
        r.max_transfers = parse_unsigned<size_t>(value);
    } else if (key == "max_transfer_size") {
        r.max_transfer_size = parse_unsigned<uint64_t>(value);
    } else if (key == "sweep_interval_ms") {
        config.sweep_interval = parse_ms(value);
    } else if (key == "required_attributes") {
        r.required_attributes = split_list(value);
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        auto item = trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return items;
}

std::string join_list(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) {
            out += ",";
        }
        out += v;
    }
    return out;
}

std::optional<RelayConfig> load_config(const std::string& path, std::string* error) {
    auto set_error = [error](std::string message) {
        if (error != nullptr) {
            *error = std::move(message);
        }
    };

    std::ifstream file(path);
    if (!file) {
        set_error("cannot open " + path);
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    RelayConfig config;

    for (const auto& entry : entries) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        try {
            bool known = false;
            if (section == "sender") {
                known = apply_sender(config.fragmenter, key, entry.value);
            } else if (section == "transport") {
                known = apply_transport(config.dispatcher, key, entry.value);
            } else if (section == "receiver") {
                known = apply_receiver(config, key, entry.value);
            } else if (section == "logging") {
                if (key == "level") {
                    auto level = utils::parse_log_level(entry.value);
                    if (!level) {
                        throw std::invalid_argument("unknown log level '" + entry.value + "'");
                    }
                    config.log_level = *level;
                    known = true;
                }
            }
            if (!known) {
                spdlog::debug("{}:{}: ignoring unknown key [{}] {}", path, entry.line_number,
                              section, key);
            }
        } catch (const std::exception& e) {
            set_error(fmt::format("{}:{}: bad value for {}: {}", path, entry.line_number,
                                  key, e.what()));
            return std::nullopt;
        }
    }

    return config;
}

std::optional<RelayConfig> parse_cli(int argc, char* argv[]) {
    CLI::App app{"blobrelay - chunked blob transfer"};
    app.allow_extras();

    RelayConfig config;
    std::string encoding = codec::encoding_to_string(config.fragmenter.encoding);
    std::string log_level = utils::log_level_to_string(config.log_level);
    std::string required;
    int64_t ack_deadline_ms = config.dispatcher.ack_deadline.count();
    int64_t idle_timeout_ms = config.reassembler.idle_timeout.count();
    int64_t transfer_timeout_ms = config.reassembler.transfer_timeout.count();
    int64_t grace_window_ms = config.reassembler.grace_window.count();
    int64_t sweep_interval_ms = config.sweep_interval.count();

    app.add_option("--fragment-size", config.fragmenter.fragment_size,
                   "Encoded bytes per fragment");
    app.add_option("--max-transfer-size", config.fragmenter.max_transfer_size,
                   "Largest encoded payload accepted");
    app.add_option("--max-message-size", config.fragmenter.max_message_size,
                   "Largest message the transport accepts");
    app.add_option("--encoding", encoding, "Payload encoding (base64, identity)");
    app.add_option("--topic", config.dispatcher.topic, "Primary publish topic");
    app.add_option("--endpoint", config.dispatcher.endpoint, "Secondary request endpoint");
    app.add_option("--ack-deadline-ms", ack_deadline_ms, "Primary acknowledgment deadline");
    app.add_option("--max-retries", config.dispatcher.max_retries,
                   "Retries after the first attempt, per path");
    app.add_option("--idle-timeout-ms", idle_timeout_ms, "Max gap between fragments");
    app.add_option("--transfer-timeout-ms", transfer_timeout_ms, "Max lifetime of a transfer");
    app.add_option("--grace-window-ms", grace_window_ms, "How long finished ids are remembered");
    app.add_option("--max-transfers", config.reassembler.max_transfers,
                   "Concurrent transfers held by the receiver");
    app.add_option("--sweep-interval-ms", sweep_interval_ms, "Receiver sweep period");
    app.add_option("--required-attributes", required, "Comma separated attribute keys");
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical, off");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::nullopt;
    }

    auto parsed_encoding = codec::string_to_encoding(encoding);
    if (!parsed_encoding) {
        return std::nullopt;
    }
    config.fragmenter.encoding = *parsed_encoding;
    config.dispatcher.ack_deadline = std::chrono::milliseconds(ack_deadline_ms);
    config.reassembler.idle_timeout = std::chrono::milliseconds(idle_timeout_ms);
    config.reassembler.transfer_timeout = std::chrono::milliseconds(transfer_timeout_ms);
    config.reassembler.grace_window = std::chrono::milliseconds(grace_window_ms);
    config.reassembler.max_transfer_size = config.fragmenter.max_transfer_size;
    config.reassembler.required_attributes = split_list(required);
    config.sweep_interval = std::chrono::milliseconds(sweep_interval_ms);
    auto parsed_level = utils::parse_log_level(log_level);
    if (!parsed_level) {
        return std::nullopt;
    }
    config.log_level = *parsed_level;

    return config;
}

bool save_config(const RelayConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    const auto& f = config.fragmenter;
    file << "[sender]\n";
    file << "fragment_size = " << f.fragment_size << "\n";
    file << "max_transfer_size = " << f.max_transfer_size << "\n";
    file << "max_message_size = " << f.max_message_size << "\n";
    file << "encoding = " << codec::encoding_to_string(f.encoding) << "\n";
    file << "\n";

    const auto& d = config.dispatcher;
    file << "[transport]\n";
    file << "topic = " << d.topic << "\n";
    file << "endpoint = " << d.endpoint << "\n";
    file << "ack_deadline_ms = " << d.ack_deadline.count() << "\n";
    file << "max_retries = " << d.max_retries << "\n";
    file << "initial_backoff_ms = " << d.initial_backoff.count() << "\n";
    file << "max_backoff_ms = " << d.max_backoff.count() << "\n";
    file << "backoff_factor = " << d.backoff_factor << "\n";
    file << "\n";

    const auto& r = config.reassembler;
    file << "[receiver]\n";
    file << "idle_timeout_ms = " << r.idle_timeout.count() << "\n";
    file << "transfer_timeout_ms = " << r.transfer_timeout.count() << "\n";
    file << "grace_window_ms = " << r.grace_window.count() << "\n";
    file << "max_transfers = " << r.max_transfers << "\n";
    file << "max_transfer_size = " << r.max_transfer_size << "\n";
    file << "sweep_interval_ms = " << config.sweep_interval.count() << "\n";
    file << "required_attributes = " << join_list(r.required_attributes) << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << utils::log_level_to_string(config.log_level) << "\n";

    return static_cast<bool>(file);
}

RelayConfig merge_config(const RelayConfig& base, const RelayConfig& overlay) {
    const RelayConfig defaults;
    RelayConfig result = base;

    // Override with values the overlay changed from the defaults
    auto take = [](auto& out, const auto& value, const auto& default_value) {
        if (value != default_value) {
            out = value;
        }
    };

    take(result.fragmenter.fragment_size, overlay.fragmenter.fragment_size,
         defaults.fragmenter.fragment_size);
    take(result.fragmenter.max_transfer_size, overlay.fragmenter.max_transfer_size,
         defaults.fragmenter.max_transfer_size);
    take(result.fragmenter.max_message_size, overlay.fragmenter.max_message_size,
         defaults.fragmenter.max_message_size);
    take(result.fragmenter.encoding, overlay.fragmenter.encoding, defaults.fragmenter.encoding);

    take(result.dispatcher.topic, overlay.dispatcher.topic, defaults.dispatcher.topic);
    take(result.dispatcher.endpoint, overlay.dispatcher.endpoint, defaults.dispatcher.endpoint);
    take(result.dispatcher.ack_deadline, overlay.dispatcher.ack_deadline,
         defaults.dispatcher.ack_deadline);
    take(result.dispatcher.max_retries, overlay.dispatcher.max_retries,
         defaults.dispatcher.max_retries);
    take(result.dispatcher.initial_backoff, overlay.dispatcher.initial_backoff,
         defaults.dispatcher.initial_backoff);
    take(result.dispatcher.max_backoff, overlay.dispatcher.max_backoff,
         defaults.dispatcher.max_backoff);
    take(result.dispatcher.backoff_factor, overlay.dispatcher.backoff_factor,
         defaults.dispatcher.backoff_factor);

    take(result.reassembler.idle_timeout, overlay.reassembler.idle_timeout,
         defaults.reassembler.idle_timeout);
    take(result.reassembler.transfer_timeout, overlay.reassembler.transfer_timeout,
         defaults.reassembler.transfer_timeout);
    take(result.reassembler.grace_window, overlay.reassembler.grace_window,
         defaults.reassembler.grace_window);
    take(result.reassembler.max_transfer_size, overlay.reassembler.max_transfer_size,
         defaults.reassembler.max_transfer_size);
    take(result.reassembler.max_transfers, overlay.reassembler.max_transfers,
         defaults.reassembler.max_transfers);
    if (!overlay.reassembler.required_attributes.empty()) {
        result.reassembler.required_attributes = overlay.reassembler.required_attributes;
    }

    take(result.sweep_interval, overlay.sweep_interval, defaults.sweep_interval);
    take(result.log_level, overlay.log_level, defaults.log_level);

    return result;
}

ValidationResult validate_config(const RelayConfig& config) {
    ValidationResult result;
    auto fail = [&result](std::string message) {
        result.errors.push_back(std::move(message));
        result.valid = false;
    };

    // Sender
    const auto& f = config.fragmenter;
    if (f.fragment_size == 0) {
        fail("fragment_size must be positive");
    } else if (f.fragment_size > sender::Fragmenter::max_fragment_size_for(f.max_message_size)) {
        fail(fmt::format("fragment_size {} does not fit in max_message_size {} (at most {})",
                         f.fragment_size, f.max_message_size,
                         sender::Fragmenter::max_fragment_size_for(f.max_message_size)));
    }
    if (f.max_transfer_size == 0) {
        fail("max_transfer_size must be positive");
    }

    // Transport
    const auto& d = config.dispatcher;
    if (d.topic.empty()) {
        fail("topic must not be empty");
    }
    if (d.endpoint.empty()) {
        result.warnings.push_back("endpoint is empty - secondary transport requests may fail");
    }
    if (d.ack_deadline.count() <= 0) {
        fail("ack_deadline_ms must be positive");
    }
    if (d.initial_backoff.count() < 0 || d.max_backoff.count() < 0) {
        fail("backoff must not be negative");
    }
    if (d.max_backoff < d.initial_backoff) {
        result.warnings.push_back("max_backoff_ms is below initial_backoff_ms - every retry "
                                  "waits max_backoff_ms");
    }
    if (d.backoff_factor < 1.0) {
        fail("backoff_factor must be at least 1.0");
    }
    if (d.max_retries == 0) {
        result.warnings.push_back("max_retries is 0 - one failed publish triggers failover");
    }

    // Receiver
    const auto& r = config.reassembler;
    if (r.idle_timeout.count() <= 0) {
        fail("idle_timeout_ms must be positive");
    }
    if (r.transfer_timeout < r.idle_timeout) {
        fail("transfer_timeout_ms must be at least idle_timeout_ms");
    }
    if (r.grace_window.count() < 0) {
        fail("grace_window_ms must not be negative");
    } else if (r.grace_window.count() == 0) {
        result.warnings.push_back("grace_window_ms is 0 - late duplicates may start new "
                                  "transfers after a purge");
    }
    if (r.max_transfers == 0) {
        fail("max_transfers must be positive");
    }
    if (r.max_transfer_size < f.max_transfer_size) {
        result.warnings.push_back("receiver max_transfer_size is below the sender's - large "
                                  "transfers will fail");
    }
    if (config.sweep_interval.count() <= 0) {
        fail("sweep_interval_ms must be positive");
    } else if (config.sweep_interval > r.idle_timeout) {
        result.warnings.push_back("sweep_interval_ms exceeds idle_timeout_ms - expiry will lag");
    }

    return result;
}

}  // namespace blobrelay::config
