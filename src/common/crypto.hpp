#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace agentrelay::crypto {

// Initialize libsodium (call once at startup, safe to call again)
bool init();

// Cryptographically secure random bytes
std::vector<uint8_t> random_bytes(size_t count);

// Lowercase hex of `count` random bytes (2 * count characters)
std::string random_hex(size_t count);

std::string to_hex(const uint8_t* data, size_t len);

} // namespace agentrelay::crypto
