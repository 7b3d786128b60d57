#pragma once

#include <cstdint>

namespace eb {

/// @brief Seedable pseudo random generator used by Fire and Twinkle.
///
/// Each instance keeps its own seed, so animations never share hidden global
/// random state and tests can reproduce a run by constructing with the same
/// seed.
///
/// @code
/// eb::eb_random rng(1234);
/// auto pattern = eb::Pattern::create(eb::Twinkle{}, 60, rng);
/// @endcode
class eb_random {
private:
    uint16_t seed_;

    /// 16-bit linear congruential step (same constants as random16())
    uint16_t next_random16() {
        seed_ = static_cast<uint16_t>(seed_ * 2053u + 13849u);
        return seed_;
    }

    uint32_t next_random32() {
        uint32_t high = next_random16();
        uint32_t low = next_random16();
        return (high << 16) | low;
    }

public:
    eb_random() : seed_(1337) {}
    explicit eb_random(uint16_t seed) : seed_(seed) {}

    /// Generate a random 32-bit number
    uint32_t operator()() {
        return next_random32();
    }

    /// Generate an 8-bit random number
    uint8_t random8() {
        uint16_t r = next_random16();
        // return the sum of the high and low bytes, for better mixing
        return (uint8_t)(((uint8_t)(r & 0xFF)) + ((uint8_t)(r >> 8)));
    }

    uint16_t random16() {
        return next_random16();
    }

    /// Uniform float in [lo, hi]
    float randomFloat(float lo, float hi) {
        const float unit = next_random16() / 65535.0f;
        return lo + (hi - lo) * unit;
    }
};

//-----------------------------------------------------------------------------
// Stateless hashing. Used where a color must be a pure function of its inputs
// but should still look random (Fire jitter, Christmas palette picks).
//-----------------------------------------------------------------------------

/// Fast, cheap 32-bit integer hash (Thomas Wang)
inline uint32_t fast_hash32(uint32_t x) noexcept {
    x = (x ^ 61u) ^ (x >> 16);
    x = x + (x << 3);
    x = x ^ (x >> 4);
    x = x * 0x27d4eb2dU;
    x = x ^ (x >> 15);
    return x;
}

inline uint32_t hash_pair(uint32_t a, uint32_t b, uint32_t seed = 0) noexcept {
    uint32_t h = fast_hash32(seed ^ a);
    return fast_hash32(h ^ b);
}

/// Hash of (seed, index, phase) mapped onto [0,1].
inline float hash_unit(uint32_t seed, uint32_t index, uint64_t phase) noexcept {
    const uint32_t p = hash_pair(static_cast<uint32_t>(phase & 0xFFFFFFFFu),
                                 static_cast<uint32_t>(phase >> 32), seed);
    return hash_pair(index, p, seed) / 4294967295.0f;
}

} // namespace eb
