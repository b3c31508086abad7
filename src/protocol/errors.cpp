#include "blobrelay/protocol/errors.hpp"

namespace blobrelay::protocol {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::NONE: return "none";
        case TransferError::CODEC_ERROR: return "codec error";
        case TransferError::PAYLOAD_TOO_LARGE: return "payload too large";
        case TransferError::INVALID_CONFIG: return "invalid config";
        case TransferError::TRANSFER_ABANDONED: return "transfer abandoned";
        case TransferError::FRAGMENT_MISMATCH: return "fragment mismatch";
        case TransferError::ENVELOPE_MISMATCH: return "envelope mismatch";
        case TransferError::VALIDATION_ERROR: return "validation error";
        case TransferError::CAPTURE_ERROR: return "capture error";
        case TransferError::SINK_ERROR: return "sink error";
        case TransferError::ABORTED: return "aborted";
        case TransferError::IDLE_TIMEOUT: return "idle timeout";
        case TransferError::TRANSFER_TIMEOUT: return "transfer timeout";
    }
    return "unknown";
}

}  // namespace blobrelay::protocol
