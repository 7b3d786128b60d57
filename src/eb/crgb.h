/// @file crgb.h
/// Defines the 8-bit red, green, and blue (RGB) pixel color type
#pragma once

#include <cstdint>
#include <string>

namespace eb {

/// Representation of an 8-bit RGB color (Red, Green, Blue)
struct CRGB {
    uint8_t r;  ///< Red channel value
    uint8_t g;  ///< Green channel value
    uint8_t b;  ///< Blue channel value

    /// Predefined RGB colors, packed as 0xRRGGBB
    enum HTMLColorCode : uint32_t {
        Black  = 0x000000,
        White  = 0xFFFFFF,
        Red    = 0xFF0000,
        Orange = 0xFFA500,
        Yellow = 0xFFFF00,
        Green  = 0x008000,
        Blue   = 0x0000FF,
        Purple = 0x800080,
    };

    /// Default constructor: black
    constexpr CRGB() noexcept : r(0), g(0), b(0) {}

    /// Allow construction from red, green, and blue
    constexpr CRGB(uint8_t ir, uint8_t ig, uint8_t ib) noexcept
        : r(ir), g(ig), b(ib) {}

    /// Allow construction from 32-bit (really 24-bit) bit 0xRRGGBB color code
    constexpr CRGB(uint32_t colorcode) noexcept
        : r((colorcode >> 16) & 0xFF), g((colorcode >> 8) & 0xFF), b((colorcode >> 0) & 0xFF) {}

    constexpr CRGB(HTMLColorCode colorcode) noexcept
        : CRGB(static_cast<uint32_t>(colorcode)) {}

    constexpr uint32_t as_uint32_t() const noexcept {
        return (uint32_t{r} << 16) | (uint32_t{g} << 8) | uint32_t{b};
    }

    /// True if any channel is lit
    constexpr explicit operator bool() const noexcept {
        return r || g || b;
    }

    /// Scale all channels by a factor in [0,1], rounding to nearest.
    CRGB scaled(float factor) const;

    /// Linear interpolation between two colors.
    /// @param amountOfP2 0.0 returns p1, 1.0 returns p2
    static CRGB lerp(const CRGB& p1, const CRGB& p2, float amountOfP2);

    std::string toString() const;
};

inline bool operator==(const CRGB& lhs, const CRGB& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

inline bool operator!=(const CRGB& lhs, const CRGB& rhs) {
    return !(lhs == rhs);
}

} // namespace eb
