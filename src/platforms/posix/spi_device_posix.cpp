#include "platforms/posix/spi_device_posix.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <sstream>
#include <string>

#include "eb/warn.h"

namespace eb {

namespace {

// spidev rejects single transfers larger than its bufsiz module parameter,
// which defaults to one page.
constexpr size_t kMaxTransferBytes = 4096;

std::string describe(const SpiConfig& config, const char* what, int err) {
    std::ostringstream msg;
    msg << config.device << ": " << what << " failed: " << strerror(err);
    return msg.str();
}

} // namespace

Result<SpiDevicePosix> SpiDevicePosix::open(const SpiConfig& config) {
    int fd = ::open(config.device.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return Result<SpiDevicePosix>::failure(StripError::TRANSPORT_INIT,
                                               describe(config, "open", errno));
    }
    SpiDevicePosix device(fd, config);

    uint8_t mode = config.mode;
    if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0) {
        return Result<SpiDevicePosix>::failure(StripError::TRANSPORT_INIT,
                                               describe(config, "SPI_IOC_WR_MODE", errno));
    }
    uint8_t bits = config.bitsPerWord;
    if (ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0) {
        return Result<SpiDevicePosix>::failure(StripError::TRANSPORT_INIT,
                                               describe(config, "SPI_IOC_WR_BITS_PER_WORD", errno));
    }
    uint32_t speed = config.speedHz;
    if (ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        return Result<SpiDevicePosix>::failure(StripError::TRANSPORT_INIT,
                                               describe(config, "SPI_IOC_WR_MAX_SPEED_HZ", errno));
    }
    return Result<SpiDevicePosix>::success(std::move(device));
}

SpiDevicePosix::~SpiDevicePosix() {
    close();
}

SpiDevicePosix::SpiDevicePosix(SpiDevicePosix&& other)
    : mFd(other.mFd), mConfig(std::move(other.mConfig)) {
    other.mFd = -1;
}

SpiDevicePosix& SpiDevicePosix::operator=(SpiDevicePosix&& other) {
    if (this != &other) {
        close();
        mFd = other.mFd;
        mConfig = std::move(other.mConfig);
        other.mFd = -1;
    }
    return *this;
}

void SpiDevicePosix::close() {
    if (mFd >= 0) {
        if (::close(mFd) < 0) {
            EB_WARN(mConfig.device << ": close failed: " << strerror(errno));
        }
        mFd = -1;
    }
}

Result<void> SpiDevicePosix::write(const uint8_t* data, size_t size) {
    if (!isOpen()) {
        return Result<void>::failure(StripError::TRANSPORT_WRITE, mConfig.device + ": device is closed");
    }
    size_t offset = 0;
    while (offset < size) {
        const size_t chunk = std::min(kMaxTransferBytes, size - offset);
        struct spi_ioc_transfer tr;
        memset(&tr, 0, sizeof(tr));
        tr.tx_buf = reinterpret_cast<uintptr_t>(data + offset);
        tr.len = static_cast<uint32_t>(chunk);
        tr.speed_hz = mConfig.speedHz;
        tr.bits_per_word = mConfig.bitsPerWord;
        if (ioctl(mFd, SPI_IOC_MESSAGE(1), &tr) < 0) {
            return Result<void>::failure(StripError::TRANSPORT_WRITE,
                                         describe(mConfig, "SPI_IOC_MESSAGE", errno));
        }
        offset += chunk;
    }
    return Result<void>::success();
}

} // namespace eb
