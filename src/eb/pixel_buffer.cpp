#include "eb/pixel_buffer.h"

#include <algorithm>
#include <sstream>

namespace eb {

void PixelBuffer::clear() {
    std::fill(mPixels.begin(), mPixels.end(), Pixel::off());
}

Result<void> PixelBuffer::commit(std::vector<Pixel>& frame) {
    if (frame.size() != mPixels.size()) {
        std::ostringstream msg;
        msg << "frame has " << frame.size() << " pixels, strip has " << mPixels.size();
        return Result<void>::failure(StripError::CONFIG, msg.str());
    }
    mPixels.swap(frame);
    return Result<void>::success();
}

} // namespace eb
