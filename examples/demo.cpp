#include <atomic>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "blobrelay/config/config.hpp"
#include "blobrelay/crypto/random.hpp"
#include "blobrelay/receiver/reassembler.hpp"
#include "blobrelay/receiver/sweep_timer.hpp"
#include "blobrelay/sender/dispatcher.hpp"
#include "blobrelay/sender/transfer_sender.hpp"
#include "blobrelay/transport/loopback_transport.hpp"
#include "blobrelay/utils/logging.hpp"

using namespace blobrelay;

namespace {

std::optional<std::vector<uint8_t>> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open {}", path);
        return std::nullopt;
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

bool write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"blobrelay demo - send a file through a loopback broker"};
    app.allow_extras();

    std::string input_path;
    std::string output_path;
    std::string config_path;
    std::string save_path;
    std::string source_id = "demo";
    uint64_t fail_primary_after = 0;

    app.add_option("-i,--input", input_path, "File to send")->required();
    app.add_option("-o,--output", output_path, "Where the receiver writes the blob");
    app.add_option("-c,--config", config_path, "INI configuration file");
    app.add_option("--save-config", save_path, "Write the effective configuration");
    app.add_option("--source-id", source_id, "Source id carried in the envelope");
    app.add_option("--fail-primary-after", fail_primary_after,
                   "Fail every publish after this many (0 = never)");

    CLI11_PARSE(app, argc, argv);

    // File first, command line on top
    config::RelayConfig relay;
    if (!config_path.empty()) {
        std::string error;
        auto loaded = config::load_config(config_path, &error);
        if (!loaded) {
            spdlog::error("Failed to load config: {}", error);
            return 1;
        }
        relay = *loaded;
    }
    auto cli = config::parse_cli(argc, argv);
    if (!cli) {
        spdlog::error("Invalid command line options");
        return 1;
    }
    relay = config::merge_config(relay, *cli);

    utils::init_logging(relay.log_level);

    auto validation = config::validate_config(relay);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("Config: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            spdlog::error("Config: {}", error);
        }
        return 1;
    }
    if (!save_path.empty() && !config::save_config(relay, save_path)) {
        spdlog::error("Failed to write {}", save_path);
        return 1;
    }

    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    // Transports
    transport::LoopbackBroker broker({.max_message_size = relay.fragmenter.max_message_size,
                                      .acknowledge = true});
    transport::LoopbackEndpoint endpoint;
    if (fail_primary_after > 0) {
        broker.set_fault_hook([fail_primary_after](uint64_t n, std::span<const uint8_t>) {
            return n > fail_primary_after ? transport::PublishStatus::FAILED
                                          : transport::PublishStatus::OK;
        });
    }

    // Receiver
    receiver::Reassembler reassembler(relay.reassembler);
    std::atomic<bool> persisted{false};
    reassembler.set_persist_callback(
        [&output_path, &persisted](const protocol::TransferEnvelope& envelope,
                                   const std::vector<uint8_t>& blob) {
            spdlog::info("Received blob {} ({} bytes)", envelope.transfer_id, blob.size());
            if (!output_path.empty() && !write_file(output_path, blob)) {
                return false;
            }
            persisted = true;
            return true;
        });
    reassembler.set_outcome_callback([](const receiver::TransferOutcome& outcome) {
        spdlog::info("Transfer {} finished: {} ({})", outcome.transfer_id,
                     receiver::transfer_status_to_string(outcome.status),
                     protocol::to_string(outcome.reason));
    });

    auto deliver = [&reassembler](std::span<const uint8_t> message) {
        reassembler.on_message(message);
    };
    broker.subscribe(relay.dispatcher.topic, deliver);
    endpoint.route(relay.dispatcher.endpoint, deliver);

    receiver::SweepTimer sweeper(reassembler, relay.sweep_interval);
    sweeper.start();

    // Sender. Backoff sleeps are skipped; nothing here recovers with time.
    sender::TransportDispatcher dispatcher(relay.dispatcher, broker, &endpoint,
                                           [](std::chrono::milliseconds) {});
    sender::TransferSender sender(relay.fragmenter, dispatcher);

    auto outcome = sender.capture_and_send([&input_path] { return read_file(input_path); },
                                           source_id, {{"file", input_path}});
    sweeper.stop();

    const auto& stats = dispatcher.stats();
    spdlog::info("Sent {}: {} of {} fragments, {} attempts, {} retries, {} failovers",
                 outcome.transfer_id, outcome.fragments_sent, outcome.fragment_count,
                 stats.attempts, stats.retries, stats.failovers);

    if (!outcome.ok()) {
        spdlog::error("Transfer failed: {}", protocol::to_string(outcome.error));
        return 1;
    }
    if (!persisted) {
        spdlog::error("Receiver did not persist the blob");
        return 1;
    }

    spdlog::info("Demo finished");
    return 0;
}
