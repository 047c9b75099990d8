#include "algorithms/GutmannMethod.hpp"

#include <cstdint>

PatternSchedule GutmannMethod::schedule() const {
    PatternSchedule passes;
    passes.reserve(PASS_COUNT);

    // Passes 1-4: random
    for (int i = 0; i < 4; ++i) {
        passes.push_back(PassPattern::random());
    }

    // Passes 5-6
    passes.push_back(PassPattern::constant(0x55));
    passes.push_back(PassPattern::constant(0xAA));

    // Passes 7-9
    passes.push_back(PassPattern::motif(0x92, 0x49, 0x24));
    passes.push_back(PassPattern::motif(0x49, 0x24, 0x92));
    passes.push_back(PassPattern::motif(0x24, 0x92, 0x49));

    // Passes 10-25: 0x00, 0x11, ... 0xFF
    for (int step = 0; step < 16; ++step) {
        passes.push_back(PassPattern::constant(static_cast<uint8_t>(step * 0x11)));
    }

    // Passes 26-28 repeat 7-9
    passes.push_back(PassPattern::motif(0x92, 0x49, 0x24));
    passes.push_back(PassPattern::motif(0x49, 0x24, 0x92));
    passes.push_back(PassPattern::motif(0x24, 0x92, 0x49));

    // Passes 29-31
    passes.push_back(PassPattern::motif(0x6D, 0xB6, 0xDB));
    passes.push_back(PassPattern::motif(0xB6, 0xDB, 0x6D));
    passes.push_back(PassPattern::motif(0xDB, 0x6D, 0xB6));

    // Passes 32-35: random
    for (int i = 0; i < 4; ++i) {
        passes.push_back(PassPattern::random());
    }

    return passes;
}
