#include "blobrelay/crypto/random.hpp"

#include <sodium.h>
#include <array>
#include <cctype>

namespace blobrelay::crypto {

bool init() {
    // sodium_init() returns 1 when already initialized
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

void random_bytes(std::span<uint8_t> output) {
    randombytes_buf(output.data(), output.size());
}

std::string generate_transfer_id() {
    std::array<uint8_t, TRANSFER_ID_BYTES> raw{};
    random_bytes(raw);

    // RFC 4122 version 4, variant 10xx
    raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);

    static constexpr char HEX[] = "0123456789abcdef";
    std::string id;
    id.reserve(TRANSFER_ID_LENGTH);
    for (size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id.push_back('-');
        }
        id.push_back(HEX[raw[i] >> 4]);
        id.push_back(HEX[raw[i] & 0x0F]);
    }
    return id;
}

bool is_valid_transfer_id(const std::string& id) {
    if (id.size() != TRANSFER_ID_LENGTH) {
        return false;
    }
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace blobrelay::crypto
