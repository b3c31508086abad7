#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "blobrelay/protocol/errors.hpp"
#include "blobrelay/protocol/message.hpp"
#include "blobrelay/receiver/transfer_registry.hpp"
#include "blobrelay/receiver/transfer_state.hpp"
#include "blobrelay/utils/time.hpp"

namespace blobrelay::receiver {

// Configuration for the reassembler
struct ReassemblerConfig {
    std::chrono::milliseconds idle_timeout{30000};       // Max gap between fragments
    std::chrono::milliseconds transfer_timeout{300000};  // Wall-clock ceiling per transfer
    std::chrono::milliseconds grace_window{60000};       // Tombstone lifetime after terminal
    uint64_t max_transfer_size = 8 * 1024 * 1024;        // Encoded bytes per transfer
    size_t max_transfers = 256;                          // Concurrent registry entries
    std::vector<std::string> required_attributes;        // Keys the envelope must carry
};

// What happened to one inbound message
enum class IngestResult {
    ACCEPTED,   // Stored; transfer still collecting
    DUPLICATE,  // Identical re-delivery, no effect
    COMPLETED,  // This message completed the transfer
    FAILED,     // This message failed the transfer
    DISCARDED,  // Transfer already terminal (or finalizing)
    REJECTED    // Malformed, or registry full
};

const char* ingest_result_to_string(IngestResult result);

// Reported on every terminal transition, outside any lock
struct TransferOutcome {
    std::string transfer_id;
    TransferStatus status{TransferStatus::COLLECTING};
    protocol::TransferError reason{protocol::TransferError::NONE};
    std::optional<protocol::TransferEnvelope> envelope;
    size_t blob_size{0};
};

// Statistics snapshot
struct ReassemblerStats {
    uint64_t messages_received{0};
    uint64_t messages_rejected{0};
    uint64_t fragments_accepted{0};
    uint64_t duplicates{0};
    uint64_t discarded{0};
    uint64_t transfers_completed{0};
    uint64_t transfers_failed{0};
    uint64_t transfers_expired{0};
    uint64_t transfers_purged{0};
    uint64_t persist_failures{0};
};

// Result of one sweep pass
struct SweepStats {
    size_t expired{0};
    size_t purged{0};
};

// Rebuilds blobs from envelopes and fragments that arrive in any order,
// possibly duplicated, from any number of concurrent callers.
//
// Per transfer: COLLECTING -> COMPLETE | FAILED | EXPIRED. Terminal
// transfers keep a tombstone for grace_window so late duplicates are
// discarded instead of reopening state; sweep() purges them afterwards.
// The completed blob is decoded, validated and persisted exactly once,
// outside every registry lock.
class Reassembler {
public:
    using PersistCallback = std::function<bool(const protocol::TransferEnvelope& envelope,
                                               const std::vector<uint8_t>& blob)>;
    using OutcomeCallback = std::function<void(const TransferOutcome& outcome)>;

    explicit Reassembler(const ReassemblerConfig& config = {},
                         utils::NowFn now_fn = utils::Clock::now);

    // Disable copy
    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    // Set before traffic starts; not synchronized with ingestion
    void set_persist_callback(PersistCallback callback);
    void set_outcome_callback(OutcomeCallback callback);

    // Parse a wire message and route it. Never throws for bad input.
    IngestResult on_message(std::span<const uint8_t> data);

    IngestResult on_envelope(const protocol::TransferEnvelope& envelope);
    IngestResult on_fragment(const protocol::FragmentMessage& fragment);

    // Expire idle or overdue transfers and purge old tombstones
    SweepStats sweep();

    // Queries
    [[nodiscard]] std::optional<TransferStatus> status(const std::string& transfer_id);
    [[nodiscard]] std::optional<protocol::TransferError> failure_reason(
        const std::string& transfer_id);
    [[nodiscard]] size_t transfer_count() const { return registry_.size(); }
    [[nodiscard]] size_t buffered_bytes();
    [[nodiscard]] ReassemblerStats stats() const;
    [[nodiscard]] const ReassemblerConfig& config() const { return config_; }

private:
    struct Counters {
        std::atomic<uint64_t> messages_received{0};
        std::atomic<uint64_t> messages_rejected{0};
        std::atomic<uint64_t> fragments_accepted{0};
        std::atomic<uint64_t> duplicates{0};
        std::atomic<uint64_t> discarded{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> transfers_expired{0};
        std::atomic<uint64_t> transfers_purged{0};
        std::atomic<uint64_t> persist_failures{0};
    };

    ReassemblerConfig config_;
    utils::NowFn now_fn_;
    TransferRegistry registry_;
    PersistCallback persist_callback_;
    OutcomeCallback outcome_callback_;
    Counters counters_;

    // Move a COLLECTING transfer to a terminal status and release its chunks
    TransferOutcome make_terminal(TransferState& state, TransferStatus status,
                                  protocol::TransferError reason, utils::TimePoint now);

    // Check an envelope against what a placeholder already buffered
    protocol::TransferError check_envelope_against(const TransferState& state,
                                                   const protocol::TransferEnvelope& envelope) const;

    // Check a new fragment against the transfer's known shape
    protocol::TransferError check_fragment_against(const TransferState& state,
                                                   const protocol::FragmentMessage& fragment) const;

    // Latch, unlock, decode, validate, commit and hand off
    IngestResult finalize(TransferRegistry::LockedTransfer& handle);

    void notify(const TransferOutcome& outcome);
    void notify_failure(TransferRegistry::LockedTransfer& handle,
                        protocol::TransferError reason, utils::TimePoint now);
};

}  // namespace blobrelay::receiver
