#include "platforms/posix/apa102_spi_transport.h"

#include "eb/chipsets/apa102.h"
#include "eb/error.h"
#include "eb/warn.h"

namespace eb {

Result<std::unique_ptr<Transport>> Apa102SpiTransport::open(const SpiConfig& config) {
    Result<SpiDevicePosix> device = SpiDevicePosix::open(config);
    if (!device) {
        EB_ERROR("APA102 transport unavailable: " << device.message());
        return Result<std::unique_ptr<Transport>>::failure(device.error(), device.message());
    }
    EB_INFO("APA102 transport on " << config.device << " at " << config.speedHz << " Hz");
    std::unique_ptr<Transport> transport(new Apa102SpiTransport(std::move(device.value())));
    return Result<std::unique_ptr<Transport>>::success(std::move(transport));
}

Result<void> Apa102SpiTransport::writeFrame(const Pixel* pixels, size_t count) {
    apa102::encodeFrame(pixels, count, &mBytes);
    return mDevice.write(mBytes.data(), mBytes.size());
}

} // namespace eb
