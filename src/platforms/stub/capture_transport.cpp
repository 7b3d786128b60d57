#include "platforms/stub/capture_transport.h"

#include "eb/chipsets/apa102.h"

namespace eb {

Result<void> CaptureTransport::writeFrame(const Pixel* pixels, size_t count) {
    ++mWriteCount;
    if (mFailWrites > 0) {
        --mFailWrites;
        return Result<void>::failure(StripError::TRANSPORT_WRITE, "capture: injected write failure");
    }
    mFrames.emplace_back(pixels, pixels + count);
    apa102::encodeFrame(pixels, count, &mBytes);
    return Result<void>::success();
}

const std::vector<Pixel>& CaptureTransport::lastFrame() const {
    static const std::vector<Pixel> empty;
    return mFrames.empty() ? empty : mFrames.back();
}

} // namespace eb
