#include "blobrelay/receiver/reassembler.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <spdlog/spdlog.h>

#include "blobrelay/codec/base64.hpp"
#include "blobrelay/protocol/wire.hpp"
#include "blobrelay/receiver/validator.hpp"

namespace blobrelay::receiver {

using protocol::TransferError;

const char* ingest_result_to_string(IngestResult result) {
    switch (result) {
        case IngestResult::ACCEPTED: return "accepted";
        case IngestResult::DUPLICATE: return "duplicate";
        case IngestResult::COMPLETED: return "completed";
        case IngestResult::FAILED: return "failed";
        case IngestResult::DISCARDED: return "discarded";
        case IngestResult::REJECTED: return "rejected";
    }
    return "unknown";
}

Reassembler::Reassembler(const ReassemblerConfig& config, utils::NowFn now_fn)
    : config_(config),
      now_fn_(std::move(now_fn)),
      registry_(config.max_transfers) {
}

void Reassembler::set_persist_callback(PersistCallback callback) {
    persist_callback_ = std::move(callback);
}

void Reassembler::set_outcome_callback(OutcomeCallback callback) {
    outcome_callback_ = std::move(callback);
}

IngestResult Reassembler::on_message(std::span<const uint8_t> data) {
    protocol::ParseError error = protocol::ParseError::SUCCESS;
    auto message = protocol::parse_message(data, &error);
    if (!message) {
        ++counters_.messages_received;
        ++counters_.messages_rejected;
        spdlog::warn("Dropping malformed message ({} bytes): {}", data.size(),
                     protocol::parse_error_to_string(error));
        return IngestResult::REJECTED;
    }

    return std::visit([this](const auto& m) -> IngestResult {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::EnvelopeMessage>) {
            return on_envelope(m.envelope);
        } else {
            return on_fragment(m);
        }
    }, *message);
}

IngestResult Reassembler::on_envelope(const protocol::TransferEnvelope& envelope) {
    ++counters_.messages_received;
    if (envelope.transfer_id.empty()) {
        ++counters_.messages_rejected;
        spdlog::warn("Dropping envelope without transfer id");
        return IngestResult::REJECTED;
    }

    const auto now = now_fn_();
    bool at_capacity = false;
    auto handle = registry_.acquire(envelope.transfer_id, true, now, &at_capacity);
    if (!handle) {
        ++counters_.messages_rejected;
        spdlog::warn("Registry full ({} transfers), rejecting envelope for {}",
                     registry_.capacity(), envelope.transfer_id);
        return IngestResult::REJECTED;
    }

    auto& state = handle.state();
    if (is_terminal(state.status)) {
        ++counters_.discarded;
        spdlog::debug("Envelope for {} transfer {} discarded",
                      transfer_status_to_string(state.status), state.transfer_id);
        return IngestResult::DISCARDED;
    }

    if (state.envelope) {
        if (*state.envelope == envelope) {
            ++counters_.duplicates;
            return IngestResult::DUPLICATE;
        }
        if (state.finalizing) {
            ++counters_.discarded;
            return IngestResult::DISCARDED;
        }
        notify_failure(handle, TransferError::ENVELOPE_MISMATCH, now);
        return IngestResult::FAILED;
    }

    auto reason = check_envelope_against(state, envelope);
    if (reason != TransferError::NONE) {
        notify_failure(handle, reason, now);
        return IngestResult::FAILED;
    }

    state.envelope = envelope;
    state.last_activity_at = now;
    spdlog::info("Transfer {} from {}: envelope received ({} fragments, {} already held)",
                 envelope.transfer_id, envelope.source_id, envelope.fragment_count,
                 state.received_count());

    if (state.has_all_fragments()) {
        return finalize(handle);
    }
    return IngestResult::ACCEPTED;
}

IngestResult Reassembler::on_fragment(const protocol::FragmentMessage& fragment) {
    ++counters_.messages_received;
    if (fragment.transfer_id.empty()) {
        ++counters_.messages_rejected;
        spdlog::warn("Dropping fragment without transfer id");
        return IngestResult::REJECTED;
    }

    const auto now = now_fn_();
    bool at_capacity = false;
    auto handle = registry_.acquire(fragment.transfer_id, true, now, &at_capacity);
    if (!handle) {
        ++counters_.messages_rejected;
        spdlog::warn("Registry full ({} transfers), rejecting fragment {} of {}",
                     registry_.capacity(), fragment.sequence_index, fragment.transfer_id);
        return IngestResult::REJECTED;
    }

    auto& state = handle.state();
    if (is_terminal(state.status)) {
        ++counters_.discarded;
        spdlog::debug("Fragment {} for {} transfer {} discarded", fragment.sequence_index,
                      transfer_status_to_string(state.status), state.transfer_id);
        return IngestResult::DISCARDED;
    }

    auto it = state.buffer.find(fragment.sequence_index);
    if (state.finalizing) {
        // Every index is already held and the payload is being handed off
        if (it != state.buffer.end() && it->second == fragment.payload_chunk) {
            ++counters_.duplicates;
            return IngestResult::DUPLICATE;
        }
        ++counters_.discarded;
        spdlog::warn("Fragment {} for finalizing transfer {} dropped", fragment.sequence_index,
                     state.transfer_id);
        return IngestResult::DISCARDED;
    }
    if (it != state.buffer.end()) {
        if (it->second == fragment.payload_chunk) {
            ++counters_.duplicates;
            return IngestResult::DUPLICATE;
        }
        notify_failure(handle, TransferError::FRAGMENT_MISMATCH, now);
        return IngestResult::FAILED;
    }

    auto reason = check_fragment_against(state, fragment);
    if (reason != TransferError::NONE) {
        notify_failure(handle, reason, now);
        return IngestResult::FAILED;
    }

    state.buffer.emplace(fragment.sequence_index, fragment.payload_chunk);
    state.buffered_bytes += fragment.payload_chunk.size();
    state.highest_index = state.highest_index
        ? std::max(*state.highest_index, fragment.sequence_index)
        : fragment.sequence_index;
    if (fragment.is_last) {
        state.last_index = fragment.sequence_index;
    }
    state.last_activity_at = now;
    ++counters_.fragments_accepted;

    spdlog::debug("Transfer {} fragment {} stored ({} held, {} bytes)", state.transfer_id,
                  fragment.sequence_index, state.received_count(), state.buffered_bytes);

    if (state.has_all_fragments()) {
        return finalize(handle);
    }
    return IngestResult::ACCEPTED;
}

TransferError Reassembler::check_envelope_against(
    const TransferState& state, const protocol::TransferEnvelope& envelope) const {
    if (envelope.total_size > config_.max_transfer_size) {
        return TransferError::PAYLOAD_TOO_LARGE;
    }
    if (state.highest_index && *state.highest_index >= envelope.fragment_count) {
        return TransferError::ENVELOPE_MISMATCH;
    }
    if (state.last_index && static_cast<uint64_t>(*state.last_index) + 1 !=
                                envelope.fragment_count) {
        return TransferError::ENVELOPE_MISMATCH;
    }
    if (state.buffered_bytes > envelope.total_size) {
        return TransferError::ENVELOPE_MISMATCH;
    }
    for (const auto& [index, chunk] : state.buffer) {
        if (chunk.size() > envelope.fragment_size) {
            return TransferError::ENVELOPE_MISMATCH;
        }
    }
    return TransferError::NONE;
}

TransferError Reassembler::check_fragment_against(
    const TransferState& state, const protocol::FragmentMessage& fragment) const {
    const size_t chunk_size = fragment.payload_chunk.size();

    if (state.envelope) {
        const auto& envelope = *state.envelope;
        const bool is_final_index =
            static_cast<uint64_t>(fragment.sequence_index) + 1 == envelope.fragment_count;
        if (fragment.sequence_index >= envelope.fragment_count ||
            chunk_size > envelope.fragment_size ||
            fragment.is_last != is_final_index ||
            state.buffered_bytes + chunk_size > envelope.total_size) {
            return TransferError::ENVELOPE_MISMATCH;
        }
        return TransferError::NONE;
    }

    // No envelope yet: only the fragments themselves can disagree
    if (state.last_index) {
        if (fragment.sequence_index > *state.last_index ||
            (fragment.is_last && fragment.sequence_index != *state.last_index)) {
            return TransferError::ENVELOPE_MISMATCH;
        }
    }
    if (fragment.is_last && state.highest_index &&
        *state.highest_index > fragment.sequence_index) {
        return TransferError::ENVELOPE_MISMATCH;
    }
    if (state.buffered_bytes + chunk_size > config_.max_transfer_size) {
        return TransferError::PAYLOAD_TOO_LARGE;
    }
    return TransferError::NONE;
}

TransferOutcome Reassembler::make_terminal(TransferState& state, TransferStatus status,
                                           TransferError reason, utils::TimePoint now) {
    state.status = status;
    state.reason = reason;
    state.terminal_at = now;
    state.finalizing = false;
    state.release_buffer();

    switch (status) {
        case TransferStatus::COMPLETE: ++counters_.transfers_completed; break;
        case TransferStatus::FAILED: ++counters_.transfers_failed; break;
        case TransferStatus::EXPIRED: ++counters_.transfers_expired; break;
        case TransferStatus::COLLECTING: break;
    }

    TransferOutcome outcome;
    outcome.transfer_id = state.transfer_id;
    outcome.status = status;
    outcome.reason = reason;
    outcome.envelope = state.envelope;
    return outcome;
}

void Reassembler::notify_failure(TransferRegistry::LockedTransfer& handle,
                                 TransferError reason, utils::TimePoint now) {
    auto outcome = make_terminal(handle.state(), TransferStatus::FAILED, reason, now);
    handle.unlock();
    spdlog::warn("Transfer {} failed: {}", outcome.transfer_id, protocol::to_string(reason));
    notify(outcome);
}

IngestResult Reassembler::finalize(TransferRegistry::LockedTransfer& handle) {
    auto& state = handle.state();
    state.finalizing = true;
    const protocol::TransferEnvelope envelope = *state.envelope;
    const std::string transfer_id = state.transfer_id;
    const std::string encoded = state.concatenate();
    handle.unlock();

    // Decode and validate without holding the entry
    TransferError reason = TransferError::NONE;
    codec::CodecError codec_error = codec::CodecError::NONE;
    auto blob = codec::decode_payload(envelope.encoding, encoded, &codec_error);
    if (!blob) {
        reason = TransferError::CODEC_ERROR;
        spdlog::warn("Transfer {} payload failed to decode: {}", transfer_id,
                     codec::codec_error_to_string(codec_error));
    } else {
        auto validation = validate_transfer(envelope, encoded.size(), blob->size(),
                                            config_.required_attributes);
        if (!validation.valid) {
            reason = TransferError::VALIDATION_ERROR;
            spdlog::warn("Transfer {} failed validation: {}", transfer_id,
                         join_errors(validation));
        }
    }

    TransferOutcome outcome;
    {
        // Finalizing entries are skipped by sweep(), so the entry is still here
        auto relocked = registry_.find(transfer_id);
        if (!relocked) {
            spdlog::error("Transfer {} vanished while finalizing", transfer_id);
            return IngestResult::DISCARDED;
        }
        if (is_terminal(relocked.state().status)) {
            spdlog::error("Transfer {} turned {} while finalizing, result dropped", transfer_id,
                          transfer_status_to_string(relocked.state().status));
            return IngestResult::DISCARDED;
        }
        const auto status = reason == TransferError::NONE ? TransferStatus::COMPLETE
                                                          : TransferStatus::FAILED;
        outcome = make_terminal(relocked.state(), status, reason, now_fn_());
    }

    if (outcome.status != TransferStatus::COMPLETE) {
        notify(outcome);
        return IngestResult::FAILED;
    }

    outcome.blob_size = blob->size();
    spdlog::info("Transfer {} from {} complete: {} bytes in {} fragments", transfer_id,
                 envelope.source_id, blob->size(), envelope.fragment_count);

    bool stored = true;
    if (persist_callback_) {
        try {
            stored = persist_callback_(envelope, *blob);
        } catch (const std::exception& e) {
            spdlog::error("Persist callback threw for transfer {}: {}", transfer_id, e.what());
            stored = false;
        }
    }
    if (!stored) {
        ++counters_.persist_failures;
        outcome.reason = TransferError::SINK_ERROR;
        spdlog::error("Persisting transfer {} failed", transfer_id);
    }

    notify(outcome);
    return IngestResult::COMPLETED;
}

void Reassembler::notify(const TransferOutcome& outcome) {
    if (!outcome_callback_) {
        return;
    }
    try {
        outcome_callback_(outcome);
    } catch (const std::exception& e) {
        spdlog::error("Outcome callback threw for transfer {}: {}", outcome.transfer_id,
                      e.what());
    }
}

SweepStats Reassembler::sweep() {
    const auto now = now_fn_();
    SweepStats result;
    std::vector<TransferOutcome> outcomes;

    registry_.for_each([&](TransferRegistry::LockedTransfer& handle) {
        auto& state = handle.state();

        if (state.status == TransferStatus::COLLECTING) {
            if (state.finalizing) {
                return;
            }
            const auto age = utils::elapsed_ms(state.first_seen_at, now);
            const auto idle = utils::elapsed_ms(state.last_activity_at, now);
            TransferError reason = TransferError::NONE;
            if (age > static_cast<uint64_t>(config_.transfer_timeout.count())) {
                reason = TransferError::TRANSFER_TIMEOUT;
            } else if (idle > static_cast<uint64_t>(config_.idle_timeout.count())) {
                reason = TransferError::IDLE_TIMEOUT;
            }
            if (reason != TransferError::NONE) {
                spdlog::warn("Transfer {} expired ({}): {} fragments held, {} bytes released",
                             state.transfer_id, protocol::to_string(reason),
                             state.received_count(), state.buffered_bytes);
                outcomes.push_back(make_terminal(state, TransferStatus::EXPIRED, reason, now));
                ++result.expired;
            }
            return;
        }

        if (utils::elapsed_ms(state.terminal_at, now) >
            static_cast<uint64_t>(config_.grace_window.count())) {
            registry_.remove(handle);
            ++counters_.transfers_purged;
            ++result.purged;
        }
    });

    for (const auto& outcome : outcomes) {
        notify(outcome);
    }

    if (result.expired > 0 || result.purged > 0) {
        spdlog::debug("Sweep expired {} and purged {} transfers", result.expired, result.purged);
    }
    return result;
}

std::optional<TransferStatus> Reassembler::status(const std::string& transfer_id) {
    auto handle = registry_.find(transfer_id);
    if (!handle) {
        return std::nullopt;
    }
    return handle.state().status;
}

std::optional<TransferError> Reassembler::failure_reason(const std::string& transfer_id) {
    auto handle = registry_.find(transfer_id);
    if (!handle) {
        return std::nullopt;
    }
    return handle.state().reason;
}

size_t Reassembler::buffered_bytes() {
    size_t total = 0;
    registry_.for_each([&total](TransferRegistry::LockedTransfer& handle) {
        total += handle.state().buffered_bytes;
    });
    return total;
}

ReassemblerStats Reassembler::stats() const {
    ReassemblerStats s;
    s.messages_received = counters_.messages_received.load();
    s.messages_rejected = counters_.messages_rejected.load();
    s.fragments_accepted = counters_.fragments_accepted.load();
    s.duplicates = counters_.duplicates.load();
    s.discarded = counters_.discarded.load();
    s.transfers_completed = counters_.transfers_completed.load();
    s.transfers_failed = counters_.transfers_failed.load();
    s.transfers_expired = counters_.transfers_expired.load();
    s.transfers_purged = counters_.transfers_purged.load();
    s.persist_failures = counters_.persist_failures.load();
    return s;
}

}  // namespace blobrelay::receiver
