/**
 * @file PassPattern.hpp
 * @brief One entry of an overwrite schedule
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

/**
 * @class PassPattern
 * @brief Byte generator for a single overwrite pass
 *
 * A pattern is one of three shapes, evaluated on demand:
 * - Random: fresh bytes from the secure random source on every call
 * - Constant: every byte equals one value
 * - Motif: a 3-byte sequence tiled and truncated to the requested length
 *
 * Patterns hold no mutable state, so a schedule can be shared freely.
 */
class PassPattern {
public:
    struct Random {
        auto operator==(const Random&) const -> bool = default;
    };
    struct Constant {
        uint8_t value;
        auto operator==(const Constant&) const -> bool = default;
    };
    struct Motif {
        std::array<uint8_t, 3> bytes;
        auto operator==(const Motif&) const -> bool = default;
    };

    using Shape = std::variant<Random, Constant, Motif>;

    [[nodiscard]] static auto random() -> PassPattern { return PassPattern{Random{}}; }

    [[nodiscard]] static auto constant(uint8_t value) -> PassPattern {
        return PassPattern{Constant{value}};
    }

    [[nodiscard]] static auto motif(uint8_t a, uint8_t b, uint8_t c) -> PassPattern {
        return PassPattern{Motif{{a, b, c}}};
    }

    /**
     * @brief Produce exactly byte_count bytes of this pattern
     */
    [[nodiscard]] auto generate(size_t byte_count) const -> std::vector<uint8_t>;

    /**
     * @brief Fill a chunk that starts pass_offset bytes into the pass
     *
     * Motifs stay phase-aligned across chunk boundaries, so a pass written in
     * chunks is byte-identical to generate(original_size).
     */
    void fill(std::span<uint8_t> chunk, uint64_t pass_offset = 0) const;

    [[nodiscard]] auto is_random() const -> bool {
        return std::holds_alternative<Random>(shape_);
    }

    /**
     * @brief Short label for logs, e.g. "random", "0x55", "92 49 24"
     */
    [[nodiscard]] auto describe() const -> std::string;

    auto operator==(const PassPattern&) const -> bool = default;

private:
    explicit PassPattern(Shape shape) : shape_(shape) {}

    Shape shape_;
};

using PatternSchedule = std::vector<PassPattern>;
