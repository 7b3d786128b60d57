#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "easyblink_config.h"
#include "eb/random.h"
#include "eb/result.h"

namespace eb {

/// A window of `width` consecutive pixels runs around the strip, one position
/// per frame.
struct Chase {
    size_t width = 1;
};

/// Every pixel breathes together over `period` frames.
struct Pulse {
    uint32_t period = EASYBLINK_DEFAULT_PULSE_PERIOD;
};

/// Every third pixel is lit, the lit set shifting by one each frame.
struct TheaterChase {};

/// Idle pixels spark at random and fade out over the following frames.
struct Twinkle {
    uint8_t chance = EASYBLINK_DEFAULT_TWINKLE_CHANCE;  ///< out of 255, per pixel per frame
    float decay = EASYBLINK_DEFAULT_TWINKLE_DECAY;      ///< brightness multiplier per frame
};

/// Larson scanner: a bright head sweeps back and forth dragging a fading tail.
struct KnightRider {
    size_t tail = 0;  ///< 0 picks 40% of the strip
};

inline bool operator==(const Chase& a, const Chase& b) { return a.width == b.width; }
inline bool operator==(const Pulse& a, const Pulse& b) { return a.period == b.period; }
inline bool operator==(const TheaterChase&, const TheaterChase&) { return true; }
inline bool operator==(const Twinkle& a, const Twinkle& b) {
    return a.chance == b.chance && a.decay == b.decay;
}
inline bool operator==(const KnightRider& a, const KnightRider& b) { return a.tail == b.tail; }

/// Pattern kind plus its own parameters. Adding a pattern means adding an
/// alternative here and one case to the engine's visitor.
using PatternKind = std::variant<Chase, Pulse, TheaterChase, Twinkle, KnightRider>;

const char* patternName(const PatternKind& kind);

/// Checks the kind's parameters (zero chase width, zero pulse period,
/// twinkle decay outside [0,1)).
Result<void> validate(const PatternKind& kind);

/// @brief Animation state for one pattern on one strip.
///
/// Holds the phase counter, the only state that carries from frame to frame,
/// plus whatever per-pixel state the kind needs (Twinkle levels). The
/// auxiliary state is sized to the strip when the pattern is created.
class Pattern {
  public:
    /// @param rng seeds this pattern's own generator; the pattern never
    ///            touches global random state.
    static Result<Pattern> create(const PatternKind& kind, size_t numLeds, eb_random& rng);

    const PatternKind& kind() const { return mKind; }

    uint64_t phase() const { return mPhase; }
    void setPhase(uint64_t phase) { mPhase = phase; }

    /// Twinkle spark levels, one per pixel; empty for other kinds.
    const std::vector<float>& levels() const { return mLevels; }

  private:
    friend class PatternEngine;

    Pattern(const PatternKind& kind, size_t numLeds, uint16_t seed);

    PatternKind mKind;
    size_t mNumLeds;
    uint64_t mPhase = 0;
    std::vector<float> mLevels;
    eb_random mRng;
};

} // namespace eb
