#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>

#include "blobrelay/protocol/message.hpp"
#include "blobrelay/transport/transport.hpp"
#include "blobrelay/utils/time.hpp"

namespace blobrelay::sender {

// Dispatcher configuration
struct DispatcherConfig {
    std::string topic = "blobrelay/transfers";   // Primary publish topic
    std::string endpoint = "/v1/transfers";      // Secondary request endpoint
    std::chrono::milliseconds ack_deadline{2000};
    uint32_t max_retries = 3;                    // Retries after the first attempt, per path
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{2000};
    double backoff_factor = 2.0;                 // Multiplied on each retry
};

// Outcome of delivering one message
enum class DeliveryResult {
    ACKED,             // Peer confirmed receipt
    SENT_UNCONFIRMED,  // Accepted by a transport without acknowledgment
    FAILED             // Both paths exhausted
};

// Which transport carries the current transfer
enum class TransportPath {
    PRIMARY,
    SECONDARY
};

const char* delivery_result_to_string(DeliveryResult result);
const char* transport_path_to_string(TransportPath path);

// Statistics
struct DispatcherStats {
    uint64_t attempts{0};
    uint64_t retries{0};
    uint64_t failovers{0};
    uint64_t acked{0};
    uint64_t unconfirmed{0};
    uint64_t failed{0};
};

// Sends messages over the primary transport with bounded retry and
// backoff. Once the primary exhausts its budget the rest of the transfer
// goes over the secondary; paths are never mixed back.
class TransportDispatcher {
public:
    TransportDispatcher(const DispatcherConfig& config,
                        transport::PrimaryTransport& primary,
                        transport::SecondaryTransport* secondary = nullptr,
                        utils::SleepFn sleep = utils::sleep_for);

    // Disable copy
    TransportDispatcher(const TransportDispatcher&) = delete;
    TransportDispatcher& operator=(const TransportDispatcher&) = delete;

    // Start a new transfer on the primary path
    void begin_transfer();

    // Serialize and deliver one message
    DeliveryResult send(const protocol::Message& message);

    // Deliver an already serialized message
    DeliveryResult send_bytes(std::span<const uint8_t> bytes);

    [[nodiscard]] TransportPath active_path() const { return path_; }
    [[nodiscard]] bool failed_over() const { return path_ == TransportPath::SECONDARY; }

    // Whether a successful send on the active path is an acknowledgment
    [[nodiscard]] bool path_supports_ack() const;

    // Largest message the primary accepts
    [[nodiscard]] size_t max_message_size() const { return primary_.max_message_size(); }

    // Delay before retry number `retry` (zero-based)
    [[nodiscard]] std::chrono::milliseconds backoff_for(uint32_t retry) const;

    [[nodiscard]] const DispatcherStats& stats() const { return stats_; }
    [[nodiscard]] const DispatcherConfig& config() const { return config_; }

private:
    DispatcherConfig config_;
    transport::PrimaryTransport& primary_;
    transport::SecondaryTransport* secondary_;
    utils::SleepFn sleep_;
    TransportPath path_{TransportPath::PRIMARY};
    DispatcherStats stats_{};

    bool try_primary(std::span<const uint8_t> bytes, DeliveryResult& result);
    bool try_secondary(std::span<const uint8_t> bytes, DeliveryResult& result);
    DeliveryResult record(DeliveryResult result);
};

}  // namespace blobrelay::sender
