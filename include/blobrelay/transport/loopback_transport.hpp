#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "blobrelay/transport/transport.hpp"

namespace blobrelay::transport {

// Loopback broker configuration
struct LoopbackBrokerConfig {
    size_t max_message_size = 1400;
    bool acknowledge = true;  // Behave like a QoS-1 publisher
};

// In-process publish/subscribe broker. Delivers synchronously to every
// subscriber of the topic. A fault hook can fail or swallow publishes.
class LoopbackBroker final : public PrimaryTransport {
public:
    // Called before each delivery with the running publish number
    // (starting at 1). Returning anything but OK suppresses delivery.
    using FaultHook = std::function<PublishStatus(uint64_t publish_number,
                                                  std::span<const uint8_t> message)>;

    explicit LoopbackBroker(const LoopbackBrokerConfig& config = {});

    PublishStatus publish(const std::string& topic,
                          std::span<const uint8_t> message,
                          std::chrono::milliseconds ack_deadline) override;
    void subscribe(const std::string& topic, MessageHandler handler) override;

    [[nodiscard]] bool supports_ack() const override { return config_.acknowledge; }
    [[nodiscard]] size_t max_message_size() const override { return config_.max_message_size; }
    [[nodiscard]] std::string name() const override { return "loopback-broker"; }

    void set_fault_hook(FaultHook hook);

    // Statistics
    [[nodiscard]] uint64_t publish_attempts() const;
    [[nodiscard]] uint64_t messages_delivered() const;

private:
    LoopbackBrokerConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<MessageHandler>> subscribers_;
    FaultHook fault_hook_;
    uint64_t publish_attempts_{0};
    uint64_t messages_delivered_{0};
};

// In-process request/response endpoint that hands payloads to a handler
class LoopbackEndpoint final : public SecondaryTransport {
public:
    using FaultHook = std::function<int(uint64_t request_number)>;

    LoopbackEndpoint() = default;

    int request(const std::string& endpoint, std::span<const uint8_t> payload) override;

    [[nodiscard]] std::string name() const override { return "loopback-endpoint"; }

    // Handler for requests to `endpoint`
    void route(const std::string& endpoint, MessageHandler handler);

    // Returning a non-2xx code fails the request without delivering it
    void set_fault_hook(FaultHook hook);

    [[nodiscard]] uint64_t requests_received() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, MessageHandler> routes_;
    FaultHook fault_hook_;
    uint64_t requests_received_{0};
};

}  // namespace blobrelay::transport
