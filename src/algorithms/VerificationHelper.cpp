/**
 * @file VerificationHelper.cpp
 * @brief Implementation of verification utilities
 */

#include "algorithms/VerificationHelper.hpp"

#include "util/WriteHelpers.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <format>

namespace verification {

auto read_prefix(int fd, size_t max_bytes) -> util::Result<std::vector<uint8_t>> {
    if (lseek(fd, 0, SEEK_SET) != 0) {
        const int err = errno;
        return std::unexpected(util::Error{util::ErrorKind::IoError,
                                           std::format("lseek failed: {}", std::strerror(err)),
                                           err});
    }

    std::vector<uint8_t> buffer(max_bytes);
    size_t filled = 0;

    while (filled < max_bytes) {
        ssize_t bytes_read = util::read_with_retry(fd, buffer.data() + filled, max_bytes - filled);
        if (bytes_read < 0) {
            const int err = errno;
            return std::unexpected(util::Error{util::ErrorKind::IoError,
                                               std::format("read failed: {}", std::strerror(err)),
                                               err});
        }
        if (bytes_read == 0) {
            break;
        }
        filled += static_cast<size_t>(bytes_read);
    }

    buffer.resize(filled);
    return buffer;
}

auto looks_random(std::span<const uint8_t> data) -> bool {
    if (data.size() < 2) {
        return true;
    }

    std::array<uint64_t, 256> byte_counts{};
    for (uint8_t byte : data) {
        byte_counts[byte]++;
    }

    if (data.size() < byte_counts.size()) {
        const auto distinct = std::ranges::count_if(byte_counts, [](uint64_t c) { return c > 0; });
        return static_cast<size_t>(distinct) * 2 >= data.size();
    }

    // Chi-squared test for uniform distribution
    const double expected = static_cast<double>(data.size()) / 256.0;

    double chi_squared = 0.0;
    for (const auto& count : byte_counts) {
        double diff = static_cast<double>(count) - expected;
        chi_squared += (diff * diff) / expected;
    }

    // Chi-squared(255, 0.001)
    constexpr double CRITICAL_VALUE = 310.5;

    // A single value far above its expected count means a pattern, not noise
    const double max_allowed = expected + 8.0 * std::sqrt(expected) + 8.0;
    const uint64_t max_count = *std::ranges::max_element(byte_counts);

    return chi_squared < CRITICAL_VALUE && static_cast<double>(max_count) <= max_allowed;
}

}  // namespace verification
