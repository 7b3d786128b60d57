#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "easyblink_config.h"
#include "eb/crgb.h"
#include "eb/random.h"
#include "eb/result.h"

namespace eb {

/// One color stop of a gradient; position is in [0,1].
struct GradientStop {
    float position;
    CRGB color;
};

inline bool operator==(const GradientStop& lhs, const GradientStop& rhs) {
    return lhs.position == rhs.position && lhs.color == rhs.color;
}

/// @brief Palette function mapping (pixel index, animation phase) to a color.
///
/// A Colorway is an immutable descriptor: colorAt() is pure, deterministic and
/// may be called for any index and phase in any order. It is cheap to copy and
/// safe to share between frames and patterns.
class Colorway {
  public:
    /// Full-saturation hue wheel spread once across the strip and rotated by
    /// `step` degrees per phase tick. Period is 360 ticks.
    struct Rainbow {
        uint32_t step = EASYBLINK_DEFAULT_RAINBOW_STEP;
    };

    /// Warm red-orange-white gradient with flickering per-pixel brightness.
    /// The flicker is a hash of (seed, index, phase), so it is reproducible.
    struct Fire {
        uint32_t seed = 0;
    };

    /// Constant color, ignores index and phase.
    struct Solid {
        CRGB color;
    };

    /// Linear RGB interpolation between sorted stops along the strip.
    struct Gradient {
        std::vector<GradientStop> stops;
    };

    /// Each pixel keeps one entry of the palette, picked by a seeded hash of
    /// its index.
    struct Palette {
        std::vector<CRGB> entries;
        uint32_t seed = 0;
    };

    using Variant = std::variant<Rainbow, Fire, Solid, Gradient, Palette>;

    static Colorway rainbow(uint32_t step = EASYBLINK_DEFAULT_RAINBOW_STEP);
    static Colorway fire(eb_random& rng);
    static Colorway solid(CRGB color);
    /// Solid color at full saturation and value; see eb::Hue for named hues.
    static Colorway hue(int degrees);
    /// Fails with StripError::CONFIG when the stops are empty, out of [0,1] or
    /// not sorted by position.
    static Result<Colorway> gradient(std::vector<GradientStop> stops);
    static Result<Colorway> palette(std::vector<CRGB> entries, uint32_t seed);
    /// Traditional tree lights: white, red, green, blue and purple.
    static Colorway christmas(eb_random& rng);

    /// Color of pixel @p index out of @p total at animation @p phase.
    /// @pre total > 0. total == 1 is treated as position 0.
    CRGB colorAt(size_t index, size_t total, uint64_t phase) const;

    const Variant& variant() const { return mVariant; }
    const char* name() const;

    /// The stops used by Fire.
    static const std::vector<GradientStop>& fireStops();

  private:
    explicit Colorway(Variant v) : mVariant(std::move(v)) {}

    Variant mVariant;
};

} // namespace eb
