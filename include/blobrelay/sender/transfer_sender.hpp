#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "blobrelay/protocol/errors.hpp"
#include "blobrelay/protocol/message.hpp"
#include "blobrelay/sender/dispatcher.hpp"
#include "blobrelay/sender/fragmenter.hpp"

namespace blobrelay::sender {

// Capture source: returns the blob, or nullopt when capture failed
using CaptureFn = std::function<std::optional<std::vector<uint8_t>>()>;

// Sender-side result of one transfer
struct SendOutcome {
    std::string transfer_id;
    protocol::TransferError error{protocol::TransferError::NONE};
    uint32_t fragment_count{0};
    uint32_t fragments_sent{0};   // Fragments with at least SENT_UNCONFIRMED
    bool fully_acked{false};      // Every message ACKED
    bool failed_over{false};      // Secondary transport was used

    [[nodiscard]] bool ok() const { return error == protocol::TransferError::NONE; }
};

// Drives one transfer at a time: fragment, then dispatch the envelope
// and every fragment in ascending order. Concurrent callers queue on an
// internal mutex, so at most one blob is in flight.
class TransferSender {
public:
    TransferSender(const FragmenterConfig& config, TransportDispatcher& dispatcher);

    // Disable copy
    TransferSender(const TransferSender&) = delete;
    TransferSender& operator=(const TransferSender&) = delete;

    // Send a blob that is already in memory
    SendOutcome send_blob(std::span<const uint8_t> blob,
                          const std::string& source_id,
                          const protocol::Attributes& attributes = {});

    // Capture once, then send. Capture failure aborts before fragmentation.
    SendOutcome capture_and_send(const CaptureFn& capture,
                                 const std::string& source_id,
                                 const protocol::Attributes& attributes = {});

    // Cooperatively abort the transfer in flight. Checked between sends;
    // the flag is cleared when the next transfer starts.
    void abort();

    [[nodiscard]] bool abort_requested() const { return abort_requested_.load(); }

    // Statistics
    [[nodiscard]] uint64_t transfers_completed() const { return transfers_completed_.load(); }
    [[nodiscard]] uint64_t transfers_abandoned() const { return transfers_abandoned_.load(); }

private:
    Fragmenter fragmenter_;
    TransportDispatcher& dispatcher_;
    std::mutex transfer_mutex_;
    std::atomic<bool> abort_requested_{false};
    std::atomic<uint64_t> transfers_completed_{0};
    std::atomic<uint64_t> transfers_abandoned_{0};

    // Prepare and send; caller holds transfer_mutex_
    SendOutcome send_locked(std::span<const uint8_t> blob,
                            const std::string& source_id,
                            const protocol::Attributes& attributes);

    SendOutcome run_transfer(const PreparedTransfer& transfer);
};

}  // namespace blobrelay::sender
