#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace blobrelay::transport {

using MessageHandler = std::function<void(std::span<const uint8_t> message)>;

// Outcome of one publish attempt
enum class PublishStatus {
    OK,           // Accepted (and acknowledged, if the transport acknowledges)
    FAILED,       // Transport reported failure
    ACK_TIMEOUT   // Sent, but no acknowledgment within the deadline
};

const char* publish_status_to_string(PublishStatus status);

// Size-bounded, unordered, at-most-once publish/subscribe transport
// (an MQTT-like client). Connection management is the implementation's
// concern; the core only publishes and subscribes.
class PrimaryTransport {
public:
    virtual ~PrimaryTransport() = default;

    // Publish one message. Transports that acknowledge wait at most
    // `ack_deadline` for the acknowledgment.
    virtual PublishStatus publish(const std::string& topic,
                                  std::span<const uint8_t> message,
                                  std::chrono::milliseconds ack_deadline) = 0;

    // Register a handler for inbound messages on `topic`
    virtual void subscribe(const std::string& topic, MessageHandler handler) = 0;

    // Whether an OK publish means the peer acknowledged receipt
    [[nodiscard]] virtual bool supports_ack() const = 0;

    // Largest message accepted by publish()
    [[nodiscard]] virtual size_t max_message_size() const = 0;

    [[nodiscard]] virtual std::string name() const { return "primary"; }
};

// Request/response fallback transport (an HTTP-like client)
class SecondaryTransport {
public:
    virtual ~SecondaryTransport() = default;

    // Deliver one message; returns a status code where 2xx is success
    virtual int request(const std::string& endpoint, std::span<const uint8_t> payload) = 0;

    [[nodiscard]] virtual std::string name() const { return "secondary"; }
};

// True for 2xx status codes
inline bool is_success_status(int status_code) {
    return status_code >= 200 && status_code < 300;
}

}  // namespace blobrelay::transport
