#pragma once

/// @file hsv2rgb.h
/// Functions to convert from the HSV colorspace to the RGB colorspace

#include "eb/crgb.h"

namespace eb {

/// Hand-picked hues, in degrees, for the named solid colors.
namespace Hue {
constexpr int RED = 0;
constexpr int ORANGE = 18;
constexpr int YELLOW = 40;
constexpr int GREEN = 116;
constexpr int BLUE = 240;
constexpr int PURPLE = 266;
} // namespace Hue

/// Convert an HSV value to RGB.
/// @param hue degrees, any value; wrapped into [0,360)
/// @param sat saturation, clamped to [0,1]
/// @param val value (brightness), clamped to [0,1]
CRGB hsv2rgb(float hue, float sat, float val);

} // namespace eb
