#pragma once

#include <cstdint>
#include <string>

#include "easyblink_config.h"

namespace eb {

/// Where and how to talk to the SPI bus the strip is wired to.
struct SpiConfig {
    std::string device = EASYBLINK_DEFAULT_SPI_DEVICE;
    uint32_t speedHz = EASYBLINK_DEFAULT_SPI_SPEED_HZ;
    uint8_t mode = 0;         ///< SPI_MODE_0: APA102 latches on the rising clock edge
    uint8_t bitsPerWord = 8;

    /// Raspberry Pi SPI0 (GPIO10 data, GPIO11 clock) at the default rate.
    static SpiConfig platformDefault() { return SpiConfig(); }
};

} // namespace eb
