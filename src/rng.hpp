#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>

namespace procmaps {

// Compile-time tag hashing (FNV-1a) for readable domain separation.
//
// Each generator salts the user seed with its own tag so the same seed
// produces unrelated streams for the charge field, the walk and the regions.
//
// Example:
//   RNG rng(hashCombine(seed, "WALK"_tag));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

constexpr uint32_t operator"" _tag(const char* str, std::size_t len) {
    return fnv1a32(str, len);
}

inline uint32_t hash32(uint32_t x) {
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// Generators treat this as a sequential tape: every draw they make is part
// of their documented output contract, so the call order below must not be
// reshuffled without changing every seeded map.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // Uniform integer in [lo, hiInclusive].
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Uniform index in [0, count). Consumes one draw even when count == 1.
    std::size_t pick(std::size_t count) {
        if (count == 0) return 0;
        return static_cast<std::size_t>(nextU32() % static_cast<uint32_t>(count));
    }

    double next01() {
        // [0,1)
        return nextU32() / (static_cast<double>(std::numeric_limits<uint32_t>::max()) + 1.0);
    }
};

} // namespace procmaps
