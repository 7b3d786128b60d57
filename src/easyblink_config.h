#pragma once

/// @file easyblink_config.h
/// EasyBlink compile-time configuration. Every value can be overridden by
/// defining it before this header is included (or on the compiler command line).

/// SPI device the APA102 strip hangs off. On a Raspberry Pi this is SPI0:
/// data (MOSI) on GPIO10 / physical pin 19, clock (SCLK) on GPIO11 / physical pin 23.
/// Enable it with raspi-config under "Interface Options -> SPI".
#ifndef EASYBLINK_DEFAULT_SPI_DEVICE
#define EASYBLINK_DEFAULT_SPI_DEVICE "/dev/spidev0.0"
#endif

/// APA102 has trouble with long strips at high clock rates; 6 MHz just works.
#ifndef EASYBLINK_DEFAULT_SPI_SPEED_HZ
#define EASYBLINK_DEFAULT_SPI_SPEED_HZ 6000000
#endif

/// Degrees of hue the rainbow rotates per frame.
#ifndef EASYBLINK_DEFAULT_RAINBOW_STEP
#define EASYBLINK_DEFAULT_RAINBOW_STEP 2
#endif

/// Frames in one full breath of the Pulse pattern.
#ifndef EASYBLINK_DEFAULT_PULSE_PERIOD
#define EASYBLINK_DEFAULT_PULSE_PERIOD 100
#endif

/// Lowest brightness the Pulse pattern dips to.
#ifndef EASYBLINK_PULSE_FLOOR
#define EASYBLINK_PULSE_FLOOR 0.15f
#endif

/// Chance (out of 255) that an idle pixel sparks on a given Twinkle frame.
#ifndef EASYBLINK_DEFAULT_TWINKLE_CHANCE
#define EASYBLINK_DEFAULT_TWINKLE_CHANCE 16
#endif

/// Per-frame brightness multiplier of a fading Twinkle spark.
#ifndef EASYBLINK_DEFAULT_TWINKLE_DECAY
#define EASYBLINK_DEFAULT_TWINKLE_DECAY 0.75f
#endif

/// Frame delay the demo uses when none is given.
#ifndef EASYBLINK_DEFAULT_DELAY_MS
#define EASYBLINK_DEFAULT_DELAY_MS 20
#endif
