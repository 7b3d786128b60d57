#include "eb/colorway.h"

#include <cmath>
#include <sstream>

#include "eb/hsv2rgb.h"

namespace eb {

namespace {

// Position of a pixel along the strip, 0 for the first and 1 for the last.
float strip_position(size_t index, size_t total) {
    if (total <= 1) {
        return 0.0f;
    }
    return static_cast<float>(index) / static_cast<float>(total - 1);
}

CRGB sample_gradient(const std::vector<GradientStop>& stops, float pos) {
    if (pos <= stops.front().position) {
        return stops.front().color;
    }
    if (pos >= stops.back().position) {
        return stops.back().color;
    }
    for (size_t k = 1; k < stops.size(); ++k) {
        const GradientStop& hi = stops[k];
        if (pos > hi.position) {
            continue;
        }
        if (pos == hi.position) {
            return hi.color;
        }
        const GradientStop& lo = stops[k - 1];
        const float span = hi.position - lo.position;
        const float t = span > 0.0f ? (pos - lo.position) / span : 1.0f;
        return CRGB::lerp(lo.color, hi.color, t);
    }
    return stops.back().color;
}

struct ColorAtVisitor {
    size_t index;
    size_t total;
    uint64_t phase;

    CRGB operator()(const Colorway::Rainbow& rb) const {
        // Integer offset keeps colorAt(i, n, p) == colorAt(i, n, p + 360) exact.
        const uint64_t offset = ((phase % 360) * rb.step) % 360;
        const float base = total > 1 ? 360.0f * index / total : 0.0f;
        return hsv2rgb(std::fmod(base + static_cast<float>(offset), 360.0f), 1.0f, 1.0f);
    }

    CRGB operator()(const Colorway::Fire& fire) const {
        const float heat = hash_unit(fire.seed, static_cast<uint32_t>(index), phase);
        const float flicker = hash_unit(fire.seed ^ 0x9e3779b9u, static_cast<uint32_t>(index), phase);
        // Squaring biases toward the deep red end; embers are rarer than flames.
        const CRGB base = sample_gradient(Colorway::fireStops(), heat * heat);
        return base.scaled(0.55f + 0.45f * flicker);
    }

    CRGB operator()(const Colorway::Solid& solid) const {
        return solid.color;
    }

    CRGB operator()(const Colorway::Gradient& g) const {
        return sample_gradient(g.stops, strip_position(index, total));
    }

    CRGB operator()(const Colorway::Palette& p) const {
        const uint32_t pick = hash_pair(static_cast<uint32_t>(index), 0u, p.seed);
        return p.entries[pick % p.entries.size()];
    }
};

struct NameVisitor {
    const char* operator()(const Colorway::Rainbow&) const { return "Rainbow"; }
    const char* operator()(const Colorway::Fire&) const { return "Fire"; }
    const char* operator()(const Colorway::Solid&) const { return "Solid"; }
    const char* operator()(const Colorway::Gradient&) const { return "Gradient"; }
    const char* operator()(const Colorway::Palette&) const { return "Palette"; }
};

} // namespace

const std::vector<GradientStop>& Colorway::fireStops() {
    static const std::vector<GradientStop> stops = {
        {0.00f, CRGB(0x80, 0x00, 0x00)},  // deep red
        {0.35f, CRGB(0xFF, 0x20, 0x00)},  // red
        {0.70f, CRGB(0xFF, 0x80, 0x00)},  // orange
        {1.00f, CRGB(0xFF, 0xE0, 0xB0)},  // near white
    };
    return stops;
}

Colorway Colorway::rainbow(uint32_t step) {
    return Colorway(Rainbow{step});
}

Colorway Colorway::fire(eb_random& rng) {
    return Colorway(Fire{rng()});
}

Colorway Colorway::solid(CRGB color) {
    return Colorway(Solid{color});
}

Colorway Colorway::hue(int degrees) {
    return Colorway(Solid{hsv2rgb(static_cast<float>(degrees), 1.0f, 1.0f)});
}

Result<Colorway> Colorway::gradient(std::vector<GradientStop> stops) {
    if (stops.empty()) {
        return Result<Colorway>::failure(StripError::CONFIG, "gradient needs at least one stop");
    }
    for (size_t k = 0; k < stops.size(); ++k) {
        const float pos = stops[k].position;
        if (!(pos >= 0.0f && pos <= 1.0f)) {
            std::ostringstream msg;
            msg << "gradient stop " << k << " position " << pos << " is outside [0,1]";
            return Result<Colorway>::failure(StripError::CONFIG, msg.str());
        }
        if (k > 0 && pos < stops[k - 1].position) {
            std::ostringstream msg;
            msg << "gradient stop " << k << " position " << pos
                << " is before previous stop at " << stops[k - 1].position;
            return Result<Colorway>::failure(StripError::CONFIG, msg.str());
        }
    }
    return Result<Colorway>::success(Colorway(Gradient{std::move(stops)}));
}

Result<Colorway> Colorway::palette(std::vector<CRGB> entries, uint32_t seed) {
    if (entries.empty()) {
        return Result<Colorway>::failure(StripError::CONFIG, "palette needs at least one color");
    }
    return Result<Colorway>::success(Colorway(Palette{std::move(entries), seed}));
}

Colorway Colorway::christmas(eb_random& rng) {
    std::vector<CRGB> entries = {
        CRGB(CRGB::White),
        hsv2rgb(0.0f, 1.0f, 1.0f),
        hsv2rgb(120.0f, 1.0f, 1.0f),
        hsv2rgb(240.0f, 1.0f, 1.0f),
        hsv2rgb(270.0f, 1.0f, 1.0f),
    };
    return Colorway(Palette{std::move(entries), rng()});
}

CRGB Colorway::colorAt(size_t index, size_t total, uint64_t phase) const {
    return std::visit(ColorAtVisitor{index, total, phase}, mVariant);
}

const char* Colorway::name() const {
    return std::visit(NameVisitor{}, mVariant);
}

} // namespace eb
