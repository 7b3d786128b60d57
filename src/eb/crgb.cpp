#include "eb/crgb.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace eb {

namespace {

uint8_t to_channel(float v) {
    v = std::min(255.0f, std::max(0.0f, v));
    return static_cast<uint8_t>(std::lround(v));
}

} // namespace

CRGB CRGB::scaled(float factor) const {
    factor = std::min(1.0f, std::max(0.0f, factor));
    return CRGB(to_channel(r * factor), to_channel(g * factor), to_channel(b * factor));
}

CRGB CRGB::lerp(const CRGB& p1, const CRGB& p2, float amountOfP2) {
    if (amountOfP2 <= 0.0f) {
        return p1;
    }
    if (amountOfP2 >= 1.0f) {
        return p2;
    }
    const float a = 1.0f - amountOfP2;
    return CRGB(to_channel(p1.r * a + p2.r * amountOfP2),
                to_channel(p1.g * a + p2.g * amountOfP2),
                to_channel(p1.b * a + p2.b * amountOfP2));
}

std::string CRGB::toString() const {
    std::ostringstream out;
    out << "CRGB(" << int(r) << "," << int(g) << "," << int(b) << ")";
    return out.str();
}

} // namespace eb
