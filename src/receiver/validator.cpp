#include "blobrelay/receiver/validator.hpp"

#include <spdlog/fmt/fmt.h>

#include "blobrelay/codec/base64.hpp"

namespace blobrelay::receiver {

ValidationResult validate_envelope(const protocol::TransferEnvelope& envelope,
                                   const std::vector<std::string>& required_attributes) {
    ValidationResult result;

    if (envelope.transfer_id.empty()) {
        result.errors.push_back("transfer_id is missing");
        result.valid = false;
    }
    if (envelope.source_id.empty()) {
        result.errors.push_back("source_id is missing");
        result.valid = false;
    }

    if (envelope.fragment_size == 0 && envelope.total_size > 0) {
        result.errors.push_back("fragment_size is 0 for a non-empty payload");
        result.valid = false;
    } else {
        const uint64_t expected =
            protocol::fragment_count_for(envelope.total_size, envelope.fragment_size);
        if (expected != envelope.fragment_count) {
            result.errors.push_back(fmt::format(
                "fragment_count {} does not match {} bytes at {} bytes per fragment",
                envelope.fragment_count, envelope.total_size, envelope.fragment_size));
            result.valid = false;
        }
    }

    for (const auto& key : required_attributes) {
        if (envelope.attributes.find(key) == envelope.attributes.end()) {
            result.errors.push_back(fmt::format("required attribute '{}' is missing", key));
            result.valid = false;
        }
    }

    return result;
}

ValidationResult validate_transfer(const protocol::TransferEnvelope& envelope,
                                   size_t encoded_size,
                                   size_t blob_size,
                                   const std::vector<std::string>& required_attributes) {
    ValidationResult result = validate_envelope(envelope, required_attributes);

    if (envelope.total_size != encoded_size) {
        result.errors.push_back(fmt::format("declared total_size {} but reassembled {} bytes",
                                            envelope.total_size, encoded_size));
        result.valid = false;
    }

    if (codec::encoded_length(envelope.encoding, blob_size) != encoded_size) {
        result.errors.push_back(fmt::format("decoded {} bytes from {} encoded bytes",
                                            blob_size, encoded_size));
        result.valid = false;
    }

    return result;
}

std::string join_errors(const ValidationResult& result) {
    std::string out;
    for (const auto& error : result.errors) {
        if (!out.empty()) {
            out += "; ";
        }
        out += error;
    }
    return out;
}

}  // namespace blobrelay::receiver
