#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "message.hpp"

namespace blobrelay::protocol {

// Message structure (wire format, all integers big-endian):
// [magic: 'B' 'R'][version: 1 byte][type: 1 byte][body]
//
// ENVELOPE body:
//   [transfer_id: str16][source_id: str16][created_at_ms: 8][total_size: 8]
//   [fragment_count: 4][fragment_size: 4][encoding: 1]
//   [attribute_count: 2]{[key: str16][value: str16]}*
// FRAGMENT body:
//   [transfer_id: str16][sequence_index: 4][flags: 1][chunk_length: 4][chunk]
//
// str16 is a 2-byte length followed by that many bytes.

struct WireHeader {
    static constexpr size_t SIZE = 4;  // magic(2) + version(1) + type(1)
    static constexpr uint8_t MAGIC_0 = 'B';
    static constexpr uint8_t MAGIC_1 = 'R';
    static constexpr uint8_t VERSION = 1;
};

// Fragment flag bits
constexpr uint8_t FLAG_LAST = 1 << 0;

// Parse result enum
enum class ParseError {
    SUCCESS,
    TOO_SHORT,
    BAD_MAGIC,
    UNSUPPORTED_VERSION,
    UNKNOWN_TYPE,
    TRUNCATED,
    TRAILING_BYTES,
    INVALID_FIELD
};

const char* parse_error_to_string(ParseError error);

// Serialize a message. Strings longer than 65535 bytes cannot be
// represented; returns empty in that case.
std::vector<uint8_t> serialize_message(const Message& message);

// Parse a message. Returns nullopt on failure.
std::optional<Message> parse_message(std::span<const uint8_t> data, ParseError* error = nullptr);

// Serialized size of a fragment message without producing it
size_t fragment_wire_size(size_t transfer_id_length, size_t chunk_length);

}  // namespace blobrelay::protocol
