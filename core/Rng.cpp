#include "core/Rng.hpp"

namespace core {
uint32_t NextU32(uint32_t& state) {
    // Xorshift32, deterministic from the explicit caller-provided seed/state.
    if (state == 0u) {
        state = 0xA341316Cu;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

float NextFloat01(uint32_t& state) {
    constexpr float invMaxU32 = 1.0f / 4294967295.0f;
    return static_cast<float>(NextU32(state)) * invMaxU32;
}

int NextIndex(uint32_t& state, int count) {
    if (count <= 0) {
        return 0;
    }
    return static_cast<int>(NextU32(state) % static_cast<uint32_t>(count));
}

int NextIntRange(uint32_t& state, int minInclusive, int maxInclusive) {
    if (maxInclusive <= minInclusive) {
        return minInclusive;
    }
    return minInclusive + NextIndex(state, maxInclusive - minInclusive + 1);
}
}  // namespace core
