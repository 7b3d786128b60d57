#pragma once

#include "eb/crgb.h"

namespace eb {

/// One addressable LED: a color plus its own brightness in [0,1].
/// Pixels have no identity beyond their position in the strip.
struct Pixel {
    CRGB color;
    float brightness = 0.0f;

    constexpr Pixel() = default;
    constexpr Pixel(CRGB c, float bri) : color(c), brightness(bri) {}

    /// Black, brightness 0.
    static constexpr Pixel off() { return Pixel(); }

    /// True when the pixel emits any light.
    bool isLit() const { return static_cast<bool>(color) && brightness > 0.0f; }
};

inline bool operator==(const Pixel& lhs, const Pixel& rhs) {
    return lhs.color == rhs.color && lhs.brightness == rhs.brightness;
}

inline bool operator!=(const Pixel& lhs, const Pixel& rhs) {
    return !(lhs == rhs);
}

} // namespace eb
