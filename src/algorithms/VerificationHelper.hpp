/**
 * @file VerificationHelper.hpp
 * @brief Read-back checks run after the final overwrite pass
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace verification {

/**
 * @brief Read up to max_bytes from the start of the file
 * @param fd File descriptor opened for reading
 * @param max_bytes Upper bound on bytes returned
 * @return Bytes read (fewer at end of file), or an IoError
 */
[[nodiscard]] auto read_prefix(int fd, size_t max_bytes) -> util::Result<std::vector<uint8_t>>;

/**
 * @brief Statistical check that data looks like random output
 * @param data Sample to judge
 * @return true if the sample passes
 *
 * Samples of 256 bytes or more use a chi-squared test on the byte
 * distribution plus a dominant-byte check. Smaller samples only require
 * that at least half of the bytes are distinct values. Samples shorter than
 * two bytes cannot be judged and pass.
 */
[[nodiscard]] auto looks_random(std::span<const uint8_t> data) -> bool;

}  // namespace verification
