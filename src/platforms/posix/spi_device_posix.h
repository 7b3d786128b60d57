#pragma once

#include <cstddef>
#include <cstdint>

#include "eb/result.h"
#include "eb/spi.h"

namespace eb {

/// @brief Linux spidev handle (/dev/spidevB.C).
///
/// Owns the file descriptor; closed on destruction. Move-only.
class SpiDevicePosix {
  public:
    /// Open and configure the device (mode, word size, max speed).
    /// Fails with StripError::TRANSPORT_INIT, e.g. when SPI is not enabled.
    static Result<SpiDevicePosix> open(const SpiConfig& config);

    ~SpiDevicePosix();
    SpiDevicePosix(SpiDevicePosix&& other);
    SpiDevicePosix& operator=(SpiDevicePosix&& other);

    /// Clock out @p size bytes. Large buffers are split into transfers the
    /// spidev driver accepts. Fails with StripError::TRANSPORT_WRITE.
    Result<void> write(const uint8_t* data, size_t size);

    bool isOpen() const { return mFd >= 0; }

  private:
    SpiDevicePosix(int fd, const SpiConfig& config) : mFd(fd), mConfig(config) {}
    void close();

    SpiDevicePosix(const SpiDevicePosix&) = delete;
    SpiDevicePosix& operator=(const SpiDevicePosix&) = delete;

    int mFd = -1;
    SpiConfig mConfig;
};

} // namespace eb
