#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "blobrelay/protocol/message.hpp"

namespace blobrelay::receiver {

// Validation result
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
};

// Check the closed envelope schema on its own: ids present, and the
// fragment count consistent with size and fragment size.
ValidationResult validate_envelope(const protocol::TransferEnvelope& envelope,
                                   const std::vector<std::string>& required_attributes = {});

// Check a completed transfer before hand-off: the envelope schema plus
// the declared size against what was actually reassembled and decoded.
ValidationResult validate_transfer(const protocol::TransferEnvelope& envelope,
                                   size_t encoded_size,
                                   size_t blob_size,
                                   const std::vector<std::string>& required_attributes = {});

// Join errors for logging
std::string join_errors(const ValidationResult& result);

}  // namespace blobrelay::receiver
