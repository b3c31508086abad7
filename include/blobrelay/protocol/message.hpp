#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

#include "blobrelay/codec/base64.hpp"

namespace blobrelay::protocol {

using Attributes = std::map<std::string, std::string>;

// Metadata describing one transfer. Sent once as a control message;
// the receiver accepts it before, between or after the fragments.
struct TransferEnvelope {
    std::string transfer_id;
    std::string source_id;
    uint64_t created_at_ms{0};   // Sender wall clock
    uint64_t total_size{0};      // Length of the encoded payload
    uint32_t fragment_count{0};
    uint32_t fragment_size{0};   // Nominal encoded bytes per fragment
    codec::PayloadEncoding encoding{codec::PayloadEncoding::BASE64};
    Attributes attributes;

    bool operator==(const TransferEnvelope&) const = default;
};

// Envelope-only control message
struct EnvelopeMessage {
    TransferEnvelope envelope;
};

// One slice of the encoded payload
struct FragmentMessage {
    std::string transfer_id;
    uint32_t sequence_index{0};
    std::string payload_chunk;
    bool is_last{false};
};

using Message = std::variant<EnvelopeMessage, FragmentMessage>;

// Message types (wire format)
enum class MessageType : uint8_t {
    ENVELOPE = 0x01,
    FRAGMENT = 0x02
};

// Get message type from variant
MessageType get_message_type(const Message& message);

// Transfer id carried by either message kind
const std::string& message_transfer_id(const Message& message);

// Number of fragments needed for `total_size` encoded bytes
uint64_t fragment_count_for(uint64_t total_size, uint32_t fragment_size);

}  // namespace blobrelay::protocol
