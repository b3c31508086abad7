#include "blobrelay/sender/fragmenter.hpp"

#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

#include "blobrelay/crypto/random.hpp"
#include "blobrelay/protocol/wire.hpp"

namespace blobrelay::sender {

PreparedTransfer::PreparedTransfer(protocol::TransferEnvelope envelope, std::string encoded)
    : envelope_(std::move(envelope)),
      encoded_(std::move(encoded)) {
}

protocol::EnvelopeMessage PreparedTransfer::envelope_message() const {
    return protocol::EnvelopeMessage{envelope_};
}

std::optional<protocol::FragmentMessage> PreparedTransfer::fragment(uint32_t index) const {
    if (index >= envelope_.fragment_count) {
        return std::nullopt;
    }
    const size_t offset = static_cast<size_t>(index) * envelope_.fragment_size;
    const size_t take = std::min<size_t>(envelope_.fragment_size, encoded_.size() - offset);

    protocol::FragmentMessage frag;
    frag.transfer_id = envelope_.transfer_id;
    frag.sequence_index = index;
    frag.payload_chunk = encoded_.substr(offset, take);
    frag.is_last = (index + 1 == envelope_.fragment_count);
    return frag;
}

std::optional<protocol::FragmentMessage> FragmentCursor::next() {
    if (!has_next()) {
        return std::nullopt;
    }
    return transfer_.fragment(next_++);
}

Fragmenter::Fragmenter(const FragmenterConfig& config)
    : config_(config) {
}

size_t Fragmenter::max_fragment_size_for(size_t max_message_size) {
    const size_t overhead = protocol::fragment_wire_size(crypto::TRANSFER_ID_LENGTH, 0);
    if (max_message_size <= overhead) {
        return 0;
    }
    return max_message_size - overhead;
}

std::optional<PreparedTransfer> Fragmenter::prepare(std::span<const uint8_t> blob,
                                                    const std::string& source_id,
                                                    const protocol::Attributes& attributes,
                                                    protocol::TransferError* error) const {
    auto set_error = [error](protocol::TransferError e) {
        if (error) *error = e;
    };

    if (config_.fragment_size == 0 ||
        config_.fragment_size > max_fragment_size_for(config_.max_message_size)) {
        spdlog::error("Fragment size {} does not fit a {}-byte transport message",
                      config_.fragment_size, config_.max_message_size);
        set_error(protocol::TransferError::INVALID_CONFIG);
        return std::nullopt;
    }

    // Reject before spending memory on the encoding
    const uint64_t encoded_size = codec::encoded_length(config_.encoding, blob.size());
    if (encoded_size > config_.max_transfer_size) {
        spdlog::warn("Blob of {} bytes encodes to {} bytes, over the {} byte ceiling",
                     blob.size(), encoded_size, config_.max_transfer_size);
        set_error(protocol::TransferError::PAYLOAD_TOO_LARGE);
        return std::nullopt;
    }

    const uint64_t count = protocol::fragment_count_for(encoded_size, config_.fragment_size);
    if (count > std::numeric_limits<uint32_t>::max()) {
        set_error(protocol::TransferError::PAYLOAD_TOO_LARGE);
        return std::nullopt;
    }

    std::string encoded = codec::encode_payload(config_.encoding, blob);

    protocol::TransferEnvelope envelope;
    envelope.transfer_id = crypto::generate_transfer_id();
    envelope.source_id = source_id;
    envelope.created_at_ms = utils::unix_time_ms();
    envelope.total_size = encoded.size();
    envelope.fragment_count = static_cast<uint32_t>(count);
    envelope.fragment_size = config_.fragment_size;
    envelope.encoding = config_.encoding;
    envelope.attributes = attributes;

    spdlog::debug("Prepared transfer {}: {} blob bytes, {} encoded, {} fragments",
                  envelope.transfer_id, blob.size(), encoded.size(), count);

    set_error(protocol::TransferError::NONE);
    return PreparedTransfer(std::move(envelope), std::move(encoded));
}

}  // namespace blobrelay::sender
