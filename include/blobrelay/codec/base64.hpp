#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blobrelay::codec {

// How a blob is turned into transport payload text
enum class PayloadEncoding : uint8_t {
    BASE64 = 0x01,    // Standard alphabet, padded
    IDENTITY = 0x02   // Raw bytes, for binary-safe transports
};

// Decode failure reason
enum class CodecError {
    NONE,
    INVALID_LENGTH,     // Not a multiple of 4 characters
    INVALID_CHARACTER,  // Character outside the base64 alphabet
    INVALID_PADDING,    // Misplaced '=' or non-zero trailing bits
    UNKNOWN_ENCODING
};

const char* codec_error_to_string(CodecError error);
const char* encoding_to_string(PayloadEncoding encoding);
std::optional<PayloadEncoding> string_to_encoding(const std::string& str);

// Base64 encode (standard alphabet, with padding)
std::string encode(std::span<const uint8_t> data);

// Base64 decode. Returns nullopt on malformed input.
std::optional<std::vector<uint8_t>> decode(std::string_view text, CodecError* error = nullptr);

// Encode with the given payload encoding
std::string encode_payload(PayloadEncoding encoding, std::span<const uint8_t> data);

// Decode with the given payload encoding
std::optional<std::vector<uint8_t>> decode_payload(PayloadEncoding encoding,
                                                   std::string_view text,
                                                   CodecError* error = nullptr);

// Length of the encoded form of `size` raw bytes
size_t encoded_length(PayloadEncoding encoding, size_t size);

}  // namespace blobrelay::codec
