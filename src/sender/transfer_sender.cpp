#include "blobrelay/sender/transfer_sender.hpp"

#include <spdlog/spdlog.h>
#include <utility>

#include "blobrelay/protocol/wire.hpp"

namespace blobrelay::sender {

TransferSender::TransferSender(const FragmenterConfig& config, TransportDispatcher& dispatcher)
    : fragmenter_(config),
      dispatcher_(dispatcher) {
}

void TransferSender::abort() {
    abort_requested_ = true;
}

SendOutcome TransferSender::capture_and_send(const CaptureFn& capture,
                                             const std::string& source_id,
                                             const protocol::Attributes& attributes) {
    // Capture only once the previous transfer is terminal
    std::lock_guard<std::mutex> lock(transfer_mutex_);
    abort_requested_ = false;

    std::optional<std::vector<uint8_t>> blob;
    if (capture) {
        blob = capture();
    }
    if (!blob) {
        spdlog::error("Capture failed for source {}", source_id);
        SendOutcome outcome;
        outcome.error = protocol::TransferError::CAPTURE_ERROR;
        return outcome;
    }
    return send_locked(*blob, source_id, attributes);
}

SendOutcome TransferSender::send_blob(std::span<const uint8_t> blob,
                                      const std::string& source_id,
                                      const protocol::Attributes& attributes) {
    std::lock_guard<std::mutex> lock(transfer_mutex_);
    abort_requested_ = false;
    return send_locked(blob, source_id, attributes);
}

SendOutcome TransferSender::send_locked(std::span<const uint8_t> blob,
                                        const std::string& source_id,
                                        const protocol::Attributes& attributes) {
    SendOutcome outcome;
    protocol::TransferError error = protocol::TransferError::NONE;
    auto prepared = fragmenter_.prepare(blob, source_id, attributes, &error);
    if (!prepared) {
        outcome.error = error;
        return outcome;
    }

    // The envelope must fit a single transport message too
    auto envelope_bytes = protocol::serialize_message(prepared->envelope_message());
    if (envelope_bytes.empty() ||
        envelope_bytes.size() > fragmenter_.config().max_message_size) {
        spdlog::error("Envelope for transfer {} does not fit a {}-byte message",
                      prepared->transfer_id(), fragmenter_.config().max_message_size);
        outcome.transfer_id = prepared->transfer_id();
        outcome.error = protocol::TransferError::INVALID_CONFIG;
        return outcome;
    }

    return run_transfer(*prepared);
}

SendOutcome TransferSender::run_transfer(const PreparedTransfer& transfer) {
    SendOutcome outcome;
    outcome.transfer_id = transfer.transfer_id();
    outcome.fragment_count = transfer.fragment_count();

    spdlog::info("Starting transfer {} ({} encoded bytes, {} fragments)",
                 transfer.transfer_id(), transfer.encoded_payload().size(),
                 transfer.fragment_count());

    dispatcher_.begin_transfer();
    bool all_acked = true;

    auto finish = [&](protocol::TransferError error) {
        outcome.error = error;
        outcome.failed_over = dispatcher_.failed_over();
        outcome.fully_acked = (error == protocol::TransferError::NONE) && all_acked;
        if (error == protocol::TransferError::NONE) {
            ++transfers_completed_;
            spdlog::info("Transfer {} sent via {} ({})", outcome.transfer_id,
                         transport_path_to_string(dispatcher_.active_path()),
                         outcome.fully_acked ? "acknowledged" : "unconfirmed");
        } else if (error == protocol::TransferError::TRANSFER_ABANDONED) {
            ++transfers_abandoned_;
            spdlog::error("Transfer {} abandoned after {} of {} fragments", outcome.transfer_id,
                          outcome.fragments_sent, outcome.fragment_count);
        } else {
            spdlog::warn("Transfer {} stopped: {}", outcome.transfer_id,
                         protocol::to_string(error));
        }
        return outcome;
    };

    if (abort_requested_) {
        return finish(protocol::TransferError::ABORTED);
    }

    auto result = dispatcher_.send(protocol::Message{transfer.envelope_message()});
    if (result == DeliveryResult::FAILED) {
        return finish(protocol::TransferError::TRANSFER_ABANDONED);
    }
    all_acked = all_acked && result == DeliveryResult::ACKED;

    FragmentCursor cursor(transfer);
    while (cursor.has_next()) {
        if (abort_requested_) {
            return finish(protocol::TransferError::ABORTED);
        }

        const uint32_t index = cursor.position();
        auto fragment = cursor.next();
        if (!fragment) {
            break;
        }
        result = dispatcher_.send(protocol::Message{std::move(*fragment)});
        if (result == DeliveryResult::FAILED) {
            return finish(protocol::TransferError::TRANSFER_ABANDONED);
        }
        all_acked = all_acked && result == DeliveryResult::ACKED;
        ++outcome.fragments_sent;
        spdlog::debug("Transfer {} fragment {}/{} {}", transfer.transfer_id(), index + 1,
                      transfer.fragment_count(), delivery_result_to_string(result));
    }

    return finish(protocol::TransferError::NONE);
}

}  // namespace blobrelay::sender
