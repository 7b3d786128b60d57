#pragma once

/// @file apa102.h
/// APA102 / SK9822 wire format.
///
/// A frame is:
/// - Start frame: 4 bytes of 0x00
/// - LED data: 4 bytes per LED, [111BBBBB][Blue][Green][Red]
/// - End frame: (num_leds / 32) + 1 DWords of 0xFF, enough clock edges to push
///   the data through every LED of the strip

#include <cstddef>
#include <cstdint>
#include <vector>

#include "eb/pixel.h"

namespace eb {
namespace apa102 {

constexpr uint8_t kLedFrameMarker = 0xE0;
constexpr uint8_t kMaxBrightness = 0x1F;
constexpr uint8_t kEndFrameByte = 0xFF;

/// Total byte count of a frame for @p num_leds LEDs
constexpr size_t calculateBytes(size_t num_leds) {
    return 4 + (num_leds * 4) + (4 * ((num_leds / 32) + 1));
}

/// Map a pixel's [0,1] brightness onto the 5-bit global brightness field.
/// A lit pixel never rounds down to 0.
uint8_t brightness5(const Pixel& pixel);

/// Encode a whole frame, replacing the contents of @p out.
void encodeFrame(const Pixel* pixels, size_t count, std::vector<uint8_t>* out);

} // namespace apa102
} // namespace eb
