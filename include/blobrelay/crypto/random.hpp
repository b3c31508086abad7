#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace blobrelay::crypto {

// Size of a transfer id in raw bytes (UUID)
constexpr size_t TRANSFER_ID_BYTES = 16;

// Length of the canonical textual form: 8-4-4-4-12 hex digits
constexpr size_t TRANSFER_ID_LENGTH = 36;

// Initialize the crypto subsystem (libsodium). Must succeed before
// random ids or the base64 codec are used.
bool init();

// Fill output with cryptographically secure random bytes
void random_bytes(std::span<uint8_t> output);

// Generate a random version-4 UUID in lowercase canonical form
std::string generate_transfer_id();

// Check that a string looks like a canonical UUID
bool is_valid_transfer_id(const std::string& id);

}  // namespace blobrelay::crypto
