#pragma once

#include <cstdint>

// Deterministic xorshift helpers. All randomness in the content engine is
// drawn from an explicit caller-owned state so runs replay from a seed.
namespace core {

uint32_t NextU32(uint32_t& state);
float NextFloat01(uint32_t& state);

// Uniform integer in [0, count). Returns 0 when count <= 0.
int NextIndex(uint32_t& state, int count);

// Uniform integer in [minInclusive, maxInclusive].
int NextIntRange(uint32_t& state, int minInclusive, int maxInclusive);

}  // namespace core
