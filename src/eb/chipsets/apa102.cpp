#include "eb/chipsets/apa102.h"

#include <algorithm>
#include <cmath>

namespace eb {
namespace apa102 {

uint8_t brightness5(const Pixel& pixel) {
    const float b = std::min(1.0f, std::max(0.0f, pixel.brightness));
    long bri = std::lround(b * kMaxBrightness);
    if (bri == 0 && b > 0.0f && pixel.color) {
        bri = 1;
    }
    return static_cast<uint8_t>(bri);
}

void encodeFrame(const Pixel* pixels, size_t count, std::vector<uint8_t>* out) {
    out->clear();
    out->reserve(calculateBytes(count));

    // Start boundary
    out->insert(out->end(), 4, 0x00);

    for (size_t i = 0; i < count; ++i) {
        const Pixel& p = pixels[i];
        out->push_back(kLedFrameMarker | brightness5(p));
        out->push_back(p.color.b);
        out->push_back(p.color.g);
        out->push_back(p.color.r);
    }

    // End boundary
    const size_t nDWords = (count / 32) + 1;
    out->insert(out->end(), 4 * nDWords, kEndFrameByte);
}

} // namespace apa102
} // namespace eb
