#include "blobrelay/protocol/wire.hpp"

#include <limits>
#include <string>
#include <type_traits>

namespace blobrelay::protocol {

namespace {

// Serialize uint64_t to bytes (big-endian)
void write_u64(std::vector<uint8_t>& buffer, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

// Serialize uint32_t to bytes (big-endian)
void write_u32(std::vector<uint8_t>& buffer, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

// Serialize uint16_t to bytes (big-endian)
void write_u16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value >> 8));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

bool write_str16(std::vector<uint8_t>& buffer, const std::string& value) {
    if (value.size() > std::numeric_limits<uint16_t>::max()) {
        return false;
    }
    write_u16(buffer, static_cast<uint16_t>(value.size()));
    buffer.insert(buffer.end(), value.begin(), value.end());
    return true;
}

// Bounds-checked sequential reader over a byte span
class Reader {
public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    bool read_u8(uint8_t& out) {
        if (remaining() < 1) return false;
        out = data_[pos_++];
        return true;
    }

    bool read_u16(uint16_t& out) {
        if (remaining() < 2) return false;
        out = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool read_u32(uint32_t& out) {
        if (remaining() < 4) return false;
        out = 0;
        for (int i = 0; i < 4; ++i) {
            out = (out << 8) | data_[pos_ + i];
        }
        pos_ += 4;
        return true;
    }

    bool read_u64(uint64_t& out) {
        if (remaining() < 8) return false;
        out = 0;
        for (int i = 0; i < 8; ++i) {
            out = (out << 8) | data_[pos_ + i];
        }
        pos_ += 8;
        return true;
    }

    bool read_bytes(size_t length, std::string& out) {
        if (remaining() < length) return false;
        out.assign(reinterpret_cast<const char*>(data_.data() + pos_), length);
        pos_ += length;
        return true;
    }

    bool read_str16(std::string& out) {
        uint16_t length = 0;
        return read_u16(length) && read_bytes(length, out);
    }

    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_{0};
};

bool write_envelope(std::vector<uint8_t>& out, const TransferEnvelope& env) {
    if (env.attributes.size() > std::numeric_limits<uint16_t>::max()) {
        return false;
    }
    if (!write_str16(out, env.transfer_id) || !write_str16(out, env.source_id)) {
        return false;
    }
    write_u64(out, env.created_at_ms);
    write_u64(out, env.total_size);
    write_u32(out, env.fragment_count);
    write_u32(out, env.fragment_size);
    out.push_back(static_cast<uint8_t>(env.encoding));
    write_u16(out, static_cast<uint16_t>(env.attributes.size()));
    for (const auto& [key, value] : env.attributes) {
        if (!write_str16(out, key) || !write_str16(out, value)) {
            return false;
        }
    }
    return true;
}

bool write_fragment(std::vector<uint8_t>& out, const FragmentMessage& frag) {
    if (frag.payload_chunk.size() > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    if (!write_str16(out, frag.transfer_id)) {
        return false;
    }
    write_u32(out, frag.sequence_index);
    out.push_back(frag.is_last ? FLAG_LAST : 0);
    write_u32(out, static_cast<uint32_t>(frag.payload_chunk.size()));
    out.insert(out.end(), frag.payload_chunk.begin(), frag.payload_chunk.end());
    return true;
}

bool read_envelope(Reader& reader, TransferEnvelope& env, ParseError& error) {
    uint8_t encoding = 0;
    uint16_t attribute_count = 0;
    if (!reader.read_str16(env.transfer_id) ||
        !reader.read_str16(env.source_id) ||
        !reader.read_u64(env.created_at_ms) ||
        !reader.read_u64(env.total_size) ||
        !reader.read_u32(env.fragment_count) ||
        !reader.read_u32(env.fragment_size) ||
        !reader.read_u8(encoding) ||
        !reader.read_u16(attribute_count)) {
        error = ParseError::TRUNCATED;
        return false;
    }

    if (encoding != static_cast<uint8_t>(codec::PayloadEncoding::BASE64) &&
        encoding != static_cast<uint8_t>(codec::PayloadEncoding::IDENTITY)) {
        error = ParseError::INVALID_FIELD;
        return false;
    }
    env.encoding = static_cast<codec::PayloadEncoding>(encoding);

    for (uint16_t i = 0; i < attribute_count; ++i) {
        std::string key;
        std::string value;
        if (!reader.read_str16(key) || !reader.read_str16(value)) {
            error = ParseError::TRUNCATED;
            return false;
        }
        env.attributes[std::move(key)] = std::move(value);
    }
    return true;
}

bool read_fragment(Reader& reader, FragmentMessage& frag, ParseError& error) {
    uint8_t flags = 0;
    uint32_t chunk_length = 0;
    if (!reader.read_str16(frag.transfer_id) ||
        !reader.read_u32(frag.sequence_index) ||
        !reader.read_u8(flags) ||
        !reader.read_u32(chunk_length) ||
        !reader.read_bytes(chunk_length, frag.payload_chunk)) {
        error = ParseError::TRUNCATED;
        return false;
    }
    frag.is_last = (flags & FLAG_LAST) != 0;
    return true;
}

}  // namespace

const char* parse_error_to_string(ParseError error) {
    switch (error) {
        case ParseError::SUCCESS: return "success";
        case ParseError::TOO_SHORT: return "too short";
        case ParseError::BAD_MAGIC: return "bad magic";
        case ParseError::UNSUPPORTED_VERSION: return "unsupported version";
        case ParseError::UNKNOWN_TYPE: return "unknown type";
        case ParseError::TRUNCATED: return "truncated";
        case ParseError::TRAILING_BYTES: return "trailing bytes";
        case ParseError::INVALID_FIELD: return "invalid field";
    }
    return "unknown";
}

std::vector<uint8_t> serialize_message(const Message& message) {
    std::vector<uint8_t> out;
    out.push_back(WireHeader::MAGIC_0);
    out.push_back(WireHeader::MAGIC_1);
    out.push_back(WireHeader::VERSION);
    out.push_back(static_cast<uint8_t>(get_message_type(message)));

    bool ok = std::visit([&out](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EnvelopeMessage>) {
            out.reserve(128);
            return write_envelope(out, m.envelope);
        } else {
            out.reserve(fragment_wire_size(m.transfer_id.size(), m.payload_chunk.size()));
            return write_fragment(out, m);
        }
    }, message);

    if (!ok) {
        return {};
    }
    return out;
}

std::optional<Message> parse_message(std::span<const uint8_t> data, ParseError* error) {
    auto set_error = [error](ParseError e) {
        if (error) *error = e;
    };

    if (data.size() < WireHeader::SIZE) {
        set_error(ParseError::TOO_SHORT);
        return std::nullopt;
    }
    if (data[0] != WireHeader::MAGIC_0 || data[1] != WireHeader::MAGIC_1) {
        set_error(ParseError::BAD_MAGIC);
        return std::nullopt;
    }
    if (data[2] != WireHeader::VERSION) {
        set_error(ParseError::UNSUPPORTED_VERSION);
        return std::nullopt;
    }

    Reader reader(data.subspan(WireHeader::SIZE));
    ParseError body_error = ParseError::SUCCESS;
    std::optional<Message> result;

    switch (static_cast<MessageType>(data[3])) {
        case MessageType::ENVELOPE: {
            EnvelopeMessage msg;
            if (read_envelope(reader, msg.envelope, body_error)) {
                result = Message{std::move(msg)};
            }
            break;
        }
        case MessageType::FRAGMENT: {
            FragmentMessage msg;
            if (read_fragment(reader, msg, body_error)) {
                result = Message{std::move(msg)};
            }
            break;
        }
        default:
            set_error(ParseError::UNKNOWN_TYPE);
            return std::nullopt;
    }

    if (!result) {
        set_error(body_error);
        return std::nullopt;
    }
    if (reader.remaining() != 0) {
        set_error(ParseError::TRAILING_BYTES);
        return std::nullopt;
    }

    set_error(ParseError::SUCCESS);
    return result;
}

size_t fragment_wire_size(size_t transfer_id_length, size_t chunk_length) {
    // header + str16 id + index(4) + flags(1) + chunk_length(4) + chunk
    return WireHeader::SIZE + 2 + transfer_id_length + 4 + 1 + 4 + chunk_length;
}

}  // namespace blobrelay::protocol
