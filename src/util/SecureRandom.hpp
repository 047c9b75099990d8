#ifndef SHREDDER_UTIL_SECURE_RANDOM_HPP
#define SHREDDER_UTIL_SECURE_RANDOM_HPP

#include <cstdint>
#include <span>
#include <string>

namespace util {

/**
 * @class SecureRandom
 * @brief Cryptographically secure byte source backed by OpenSSL's RAND_bytes
 *
 * There is no seed to set: every call draws fresh bytes from the DRBG.
 * Throws std::runtime_error if the generator reports failure.
 */
class SecureRandom {
public:
    /**
     * @brief Fills a buffer with random bytes
     * @param buffer The buffer to fill
     */
    static void fill(std::span<uint8_t> buffer);

    /**
     * @brief Lowercase hex encoding of byte_count random bytes
     * @return String of 2 * byte_count characters
     */
    [[nodiscard]] static auto hex_token(size_t byte_count) -> std::string;

    /**
     * @brief Uniform value in [0, bound) without modulo bias
     * @param bound Exclusive upper bound; 0 yields 0
     */
    [[nodiscard]] static auto uniform(uint64_t bound) -> uint64_t;
};

} // namespace util

#endif // SHREDDER_UTIL_SECURE_RANDOM_HPP
