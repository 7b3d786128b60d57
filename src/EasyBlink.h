#pragma once

/// @file EasyBlink.h
/// Main EasyBlink header. Pattern animation for APA102 strips on a
/// single-board computer.
///
/// @code
/// #include "EasyBlink.h"
///
/// int main() {
///     auto controller = eb::Controller::create(120);
///     if (!controller) {
///         return 1;
///     }
///     while (true) {
///         controller.value().executeColorwayPattern(eb::ColorwayPreset::FIREPLACE, 40);
///     }
/// }
/// @endcode

#include "easyblink_config.h"

#include "eb/crgb.h"
#include "eb/hsv2rgb.h"
#include "eb/pixel.h"
#include "eb/pixel_buffer.h"
#include "eb/random.h"
#include "eb/result.h"

#include "eb/colorway.h"
#include "eb/pattern.h"
#include "eb/pattern_engine.h"

#include "eb/controller.h"
#include "eb/delay.h"
#include "eb/spi.h"
#include "eb/transport.h"
