#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "blobrelay/codec/base64.hpp"
#include "blobrelay/protocol/errors.hpp"
#include "blobrelay/protocol/message.hpp"
#include "blobrelay/utils/time.hpp"

namespace blobrelay::sender {

// Configuration for the fragmenter
struct FragmenterConfig {
    uint32_t fragment_size = 1024;                // Encoded bytes per fragment
    uint64_t max_transfer_size = 8 * 1024 * 1024; // Ceiling on the encoded payload
    size_t max_message_size = 1400;               // Largest message the transport accepts
    codec::PayloadEncoding encoding = codec::PayloadEncoding::BASE64;
};

// An encoded blob ready to be sent. Fragments are produced on demand
// from the single encoded buffer rather than materialized up front.
class PreparedTransfer {
public:
    PreparedTransfer(protocol::TransferEnvelope envelope, std::string encoded);

    [[nodiscard]] const protocol::TransferEnvelope& envelope() const { return envelope_; }
    [[nodiscard]] const std::string& transfer_id() const { return envelope_.transfer_id; }
    [[nodiscard]] uint32_t fragment_count() const { return envelope_.fragment_count; }
    [[nodiscard]] const std::string& encoded_payload() const { return encoded_; }

    // Envelope control message, sent ahead of fragment 0
    [[nodiscard]] protocol::EnvelopeMessage envelope_message() const;

    // Build fragment `index`, or nullopt when index >= fragment_count()
    [[nodiscard]] std::optional<protocol::FragmentMessage> fragment(uint32_t index) const;

private:
    protocol::TransferEnvelope envelope_;
    std::string encoded_;
};

// Walks the fragments of a prepared transfer in ascending order
class FragmentCursor {
public:
    explicit FragmentCursor(const PreparedTransfer& transfer) : transfer_(transfer) {}

    [[nodiscard]] bool has_next() const { return next_ < transfer_.fragment_count(); }
    [[nodiscard]] uint32_t position() const { return next_; }

    // Next fragment in order, nullopt once the transfer is exhausted
    std::optional<protocol::FragmentMessage> next();

private:
    const PreparedTransfer& transfer_;
    uint32_t next_{0};
};

// Splits blobs into size-bounded fragments tagged with a fresh transfer id
class Fragmenter {
public:
    explicit Fragmenter(const FragmenterConfig& config = {});

    // Encode `blob` and describe it. Returns nullopt with PAYLOAD_TOO_LARGE
    // or INVALID_CONFIG in `error`.
    std::optional<PreparedTransfer> prepare(std::span<const uint8_t> blob,
                                            const std::string& source_id,
                                            const protocol::Attributes& attributes = {},
                                            protocol::TransferError* error = nullptr) const;

    [[nodiscard]] const FragmenterConfig& config() const { return config_; }

    // Largest fragment_size whose serialized fragment fits max_message_size
    [[nodiscard]] static size_t max_fragment_size_for(size_t max_message_size);

private:
    FragmenterConfig config_;
};

}  // namespace blobrelay::sender
