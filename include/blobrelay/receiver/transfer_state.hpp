#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "blobrelay/protocol/errors.hpp"
#include "blobrelay/protocol/message.hpp"
#include "blobrelay/utils/time.hpp"

namespace blobrelay::receiver {

// Receiver-side transfer status. Only COLLECTING is mutable.
enum class TransferStatus {
    COLLECTING,
    COMPLETE,
    FAILED,
    EXPIRED
};

const char* transfer_status_to_string(TransferStatus status);

inline bool is_terminal(TransferStatus status) {
    return status != TransferStatus::COLLECTING;
}

// State of one transfer, keyed by transfer id in the registry
struct TransferState {
    std::string transfer_id;
    std::optional<protocol::TransferEnvelope> envelope;  // Unknown until it arrives

    // sequence_index -> payload_chunk. The key set is the received set.
    std::map<uint32_t, std::string> buffer;
    size_t buffered_bytes{0};

    std::optional<uint32_t> highest_index;  // Largest index seen
    std::optional<uint32_t> last_index;     // Index flagged is_last, if seen

    utils::TimePoint first_seen_at{};
    utils::TimePoint last_activity_at{};
    utils::TimePoint terminal_at{};

    TransferStatus status{TransferStatus::COLLECTING};
    protocol::TransferError reason{protocol::TransferError::NONE};

    // Set while the completed payload is being decoded and handed off.
    // Latches emission to once.
    bool finalizing{false};

    [[nodiscard]] bool has_index(uint32_t index) const { return buffer.count(index) > 0; }
    [[nodiscard]] size_t received_count() const { return buffer.size(); }

    // Envelope known and every index in [0, fragment_count) held
    [[nodiscard]] bool has_all_fragments() const;

    // Concatenate chunks by ascending index
    [[nodiscard]] std::string concatenate() const;

    // Drop all buffered chunks
    void release_buffer();
};

}  // namespace blobrelay::receiver
