#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "eb/result.h"
#include "eb/spi.h"
#include "eb/transport.h"
#include "platforms/posix/spi_device_posix.h"

namespace eb {

/// APA102 strip driven from a Linux spidev device.
class Apa102SpiTransport : public Transport {
  public:
    /// Open the SPI device. Fails with StripError::TRANSPORT_INIT.
    static Result<std::unique_ptr<Transport>> open(const SpiConfig& config);

    Result<void> writeFrame(const Pixel* pixels, size_t count) override;
    const char* name() const override { return "APA102/spidev"; }

  private:
    explicit Apa102SpiTransport(SpiDevicePosix device) : mDevice(std::move(device)) {}

    SpiDevicePosix mDevice;
    std::vector<uint8_t> mBytes;  // staging buffer, reused between frames
};

} // namespace eb
