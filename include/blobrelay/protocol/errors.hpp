#pragma once

namespace blobrelay::protocol {

// Reason a transfer did not (or could not) complete. Shared by the
// sender and receiver sides so outcomes can be compared end to end.
enum class TransferError {
    NONE,
    CODEC_ERROR,         // Encoded payload failed to decode
    PAYLOAD_TOO_LARGE,   // Exceeds max_transfer_size
    INVALID_CONFIG,      // Fragment would not fit the transport message
    TRANSFER_ABANDONED,  // Both transports exhausted their retries
    FRAGMENT_MISMATCH,   // Same index seen with different content
    ENVELOPE_MISMATCH,   // Fragments disagree with the envelope
    VALIDATION_ERROR,    // Complete but semantically invalid
    CAPTURE_ERROR,       // Capture source failed
    SINK_ERROR,          // Persist callback reported failure
    ABORTED,             // Cancelled by the caller
    IDLE_TIMEOUT,        // No activity within idle_timeout
    TRANSFER_TIMEOUT     // Exceeded the wall-clock ceiling
};

const char* to_string(TransferError error);

}  // namespace blobrelay::protocol
