#include "util/SecureRandom.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <climits>
#include <limits>
#include <stdexcept>

namespace util {

void SecureRandom::fill(std::span<uint8_t> buffer) {
    // RAND_bytes takes an int length
    constexpr size_t MAX_REQUEST = static_cast<size_t>(INT_MAX);

    size_t offset = 0;
    while (offset < buffer.size()) {
        const size_t request = std::min(MAX_REQUEST, buffer.size() - offset);
        if (RAND_bytes(buffer.data() + offset, static_cast<int>(request)) != 1) {
            std::array<char, 256> reason{};
            ERR_error_string_n(ERR_get_error(), reason.data(), reason.size());
            throw std::runtime_error(std::string("RAND_bytes failed: ") + reason.data());
        }
        offset += request;
    }
}

auto SecureRandom::hex_token(size_t byte_count) -> std::string {
    constexpr char DIGITS[] = "0123456789abcdef";

    std::string raw(byte_count, '\0');
    fill(std::span(reinterpret_cast<uint8_t*>(raw.data()), raw.size()));

    std::string hex;
    hex.reserve(byte_count * 2);
    for (unsigned char c : raw) {
        hex.push_back(DIGITS[c >> 4]);
        hex.push_back(DIGITS[c & 0x0F]);
    }
    return hex;
}

auto SecureRandom::uniform(uint64_t bound) -> uint64_t {
    if (bound == 0) {
        return 0;
    }

    // Reject draws from the incomplete top bucket
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
                           (std::numeric_limits<uint64_t>::max() % bound);
    uint64_t value = 0;
    do {
        fill(std::span(reinterpret_cast<uint8_t*>(&value), sizeof(value)));
    } while (value >= limit);

    return value % bound;
}

} // namespace util
