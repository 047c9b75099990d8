#include "algorithms/PassPattern.hpp"

#include "util/SecureRandom.hpp"

#include <algorithm>
#include <format>

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

}  // namespace

auto PassPattern::generate(size_t byte_count) const -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(byte_count);
    fill(bytes, 0);
    return bytes;
}

void PassPattern::fill(std::span<uint8_t> chunk, uint64_t pass_offset) const {
    std::visit(overloaded{
                   [&](const Random&) { util::SecureRandom::fill(chunk); },
                   [&](const Constant& c) { std::ranges::fill(chunk, c.value); },
                   [&](const Motif& m) {
                       auto phase = static_cast<size_t>(pass_offset % m.bytes.size());
                       for (auto& byte : chunk) {
                           byte = m.bytes[phase];
                           phase = (phase + 1) % m.bytes.size();
                       }
                   },
               },
               shape_);
}

auto PassPattern::describe() const -> std::string {
    return std::visit(overloaded{
                          [](const Random&) -> std::string { return "random"; },
                          [](const Constant& c) -> std::string {
                              return std::format("0x{:02X}", c.value);
                          },
                          [](const Motif& m) -> std::string {
                              return std::format("{:02X} {:02X} {:02X}", m.bytes[0], m.bytes[1],
                                                 m.bytes[2]);
                          },
                      },
                      shape_);
}
