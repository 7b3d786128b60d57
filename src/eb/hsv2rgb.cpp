#include "eb/hsv2rgb.h"

#include <algorithm>
#include <cmath>

namespace eb {

CRGB hsv2rgb(float h, float s, float v) {
    h = std::fmod(h, 360.0f);
    if (h < 0) h += 360.0f;
    s = std::clamp(s, 0.0f, 1.0f);
    v = std::clamp(v, 0.0f, 1.0f);
    const float c = v * s;
    const float x = c * (1.0f - std::fabs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
    const float m = v - c;
    float r = 0, g = 0, b = 0;
    const int seg = static_cast<int>(h / 60.0f);
    switch (seg) {
        case 0: r = c; g = x; b = 0; break;
        case 1: r = x; g = c; b = 0; break;
        case 2: r = 0; g = c; b = x; break;
        case 3: r = 0; g = x; b = c; break;
        case 4: r = x; g = 0; b = c; break;
        default: r = c; g = 0; b = x; break;
    }
    return CRGB(static_cast<uint8_t>(std::lround((r + m) * 255.0f)),
                static_cast<uint8_t>(std::lround((g + m) * 255.0f)),
                static_cast<uint8_t>(std::lround((b + m) * 255.0f)));
}

} // namespace eb
