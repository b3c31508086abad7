#include "blobrelay/codec/base64.hpp"

#include <sodium.h>

namespace blobrelay::codec {

namespace {

constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;

bool is_alphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

const char* codec_error_to_string(CodecError error) {
    switch (error) {
        case CodecError::NONE: return "none";
        case CodecError::INVALID_LENGTH: return "invalid length";
        case CodecError::INVALID_CHARACTER: return "invalid character";
        case CodecError::INVALID_PADDING: return "invalid padding";
        case CodecError::UNKNOWN_ENCODING: return "unknown encoding";
    }
    return "unknown";
}

const char* encoding_to_string(PayloadEncoding encoding) {
    switch (encoding) {
        case PayloadEncoding::BASE64: return "base64";
        case PayloadEncoding::IDENTITY: return "identity";
    }
    return "unknown";
}

std::optional<PayloadEncoding> string_to_encoding(const std::string& str) {
    if (str == "base64") return PayloadEncoding::BASE64;
    if (str == "identity" || str == "raw") return PayloadEncoding::IDENTITY;
    return std::nullopt;
}

std::string encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    // ENCODED_LEN includes the terminating NUL
    const size_t max_len = sodium_base64_ENCODED_LEN(data.size(), VARIANT);
    std::string out(max_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), VARIANT);
    out.resize(max_len - 1);
    return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view text, CodecError* error) {
    auto set_error = [error](CodecError e) {
        if (error) *error = e;
    };

    if (text.empty()) {
        set_error(CodecError::NONE);
        return std::vector<uint8_t>{};
    }

    if (text.size() % 4 != 0) {
        set_error(CodecError::INVALID_LENGTH);
        return std::nullopt;
    }

    for (char c : text) {
        if (!is_alphabet(c) && c != '=') {
            set_error(CodecError::INVALID_CHARACTER);
            return std::nullopt;
        }
    }

    std::vector<uint8_t> out(text.size() / 4 * 3);
    size_t bin_len = 0;
    // b64_end == nullptr makes libsodium reject anything after valid padding
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &bin_len, nullptr, VARIANT) != 0) {
        set_error(CodecError::INVALID_PADDING);
        return std::nullopt;
    }

    out.resize(bin_len);
    set_error(CodecError::NONE);
    return out;
}

std::string encode_payload(PayloadEncoding encoding, std::span<const uint8_t> data) {
    if (encoding == PayloadEncoding::IDENTITY) {
        return std::string(data.begin(), data.end());
    }
    return encode(data);
}

std::optional<std::vector<uint8_t>> decode_payload(PayloadEncoding encoding,
                                                   std::string_view text,
                                                   CodecError* error) {
    switch (encoding) {
        case PayloadEncoding::BASE64:
            return decode(text, error);
        case PayloadEncoding::IDENTITY:
            if (error) *error = CodecError::NONE;
            return std::vector<uint8_t>(text.begin(), text.end());
    }
    if (error) *error = CodecError::UNKNOWN_ENCODING;
    return std::nullopt;
}

size_t encoded_length(PayloadEncoding encoding, size_t size) {
    if (encoding == PayloadEncoding::IDENTITY) {
        return size;
    }
    return (size + 2) / 3 * 4;
}

}  // namespace blobrelay::codec
