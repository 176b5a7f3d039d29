#include "common/crypto.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>

namespace agentrelay::crypto {

bool init() {
    return sodium_init() >= 0;
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

std::string to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string random_hex(size_t count) {
    auto bytes = random_bytes(count);
    return to_hex(bytes.data(), bytes.size());
}

} // namespace agentrelay::crypto
