#include "blobrelay/receiver/transfer_state.hpp"

namespace blobrelay::receiver {

const char* transfer_status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::COLLECTING: return "collecting";
        case TransferStatus::COMPLETE: return "complete";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::EXPIRED: return "expired";
    }
    return "unknown";
}

bool TransferState::has_all_fragments() const {
    if (!envelope) {
        return false;
    }
    // Indices >= fragment_count are rejected on arrival, so a full count
    // means full coverage of [0, fragment_count)
    return buffer.size() == envelope->fragment_count;
}

std::string TransferState::concatenate() const {
    std::string out;
    out.reserve(buffered_bytes);
    for (const auto& [index, chunk] : buffer) {
        out.append(chunk);
    }
    return out;
}

void TransferState::release_buffer() {
    buffer.clear();
    buffered_bytes = 0;
}

}  // namespace blobrelay::receiver
