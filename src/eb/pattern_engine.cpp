#include "eb/pattern_engine.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace eb {

namespace {

// Sparks dimmer than this are switched off.
constexpr float kTwinkleCutoff = 0.02f;

struct RenderVisitor {
    const Colorway& colorway;
    size_t total;
    uint64_t phase;
    eb_random& rng;
    const std::vector<float>& levels;
    std::vector<Pixel>& frame;
    std::vector<float>& nextLevels;

    void operator()(const Chase& chase) const {
        const size_t start = static_cast<size_t>(phase % total);
        const size_t width = std::min(chase.width, total);
        for (size_t k = 0; k < width; ++k) {
            const size_t i = (start + k) % total;
            frame[i] = Pixel(colorway.colorAt(i, total, phase), 1.0f);
        }
    }

    void operator()(const Pulse& pulse) const {
        float wave = 1.0f;
        if (pulse.period > 1) {
            // Triangle wave: 0 at the start of the period, 1 halfway through.
            const float t = static_cast<float>(phase % pulse.period) / pulse.period;
            wave = 1.0f - std::abs(2.0f * t - 1.0f);
        }
        const float floor = EASYBLINK_PULSE_FLOOR;
        const float brightness = std::clamp(floor + (1.0f - floor) * wave, 0.0f, 1.0f);
        for (size_t i = 0; i < total; ++i) {
            frame[i] = Pixel(colorway.colorAt(i, total, phase), brightness);
        }
    }

    void operator()(const TheaterChase&) const {
        const size_t offset = static_cast<size_t>(phase % 3);
        for (size_t i = offset; i < total; i += 3) {
            frame[i] = Pixel(colorway.colorAt(i, total, phase), 1.0f);
        }
    }

    void operator()(const Twinkle& twinkle) const {
        for (size_t i = 0; i < total; ++i) {
            float level = levels[i] * twinkle.decay;
            if (level < kTwinkleCutoff) {
                level = 0.0f;
            }
            // Draw for every pixel so the random sequence does not depend on
            // which pixels happen to be lit.
            const bool spark = rng.random8() < twinkle.chance;
            if (level == 0.0f && spark) {
                level = rng.randomFloat(0.5f, 1.0f);
            }
            nextLevels[i] = level;
            if (level > 0.0f) {
                frame[i] = Pixel(colorway.colorAt(i, total, phase), level);
            }
        }
    }

    void operator()(const KnightRider& kr) const {
        size_t tail = kr.tail;
        if (tail == 0) {
            tail = std::max<size_t>(1, total * 2 / 5);
        }
        const uint64_t period = total > 1 ? 2 * (total - 1) : 1;
        const uint64_t t = phase % period;
        const size_t head = static_cast<size_t>(t < total ? t : period - t);
        for (size_t i = 0; i < total; ++i) {
            const size_t distance = i > head ? i - head : head - i;
            if (distance >= tail) {
                continue;
            }
            const float brightness = 1.0f - static_cast<float>(distance) / tail;
            frame[i] = Pixel(colorway.colorAt(i, total, phase), brightness);
        }
    }
};

} // namespace

uint64_t PatternEngine::nextPhase(const PatternKind& kind, uint64_t phase, size_t numLeds) {
    if (std::holds_alternative<Chase>(kind) && numLeds > 0) {
        return (phase + 1) % numLeds;
    }
    return phase + 1;
}

Result<void> PatternEngine::advance(PixelBuffer& buffer, const Colorway& colorway, Pattern& pattern) {
    const uint64_t phase = pattern.mPhase;
    pattern.mPhase = nextPhase(pattern.mKind, phase, pattern.mNumLeds);

    const size_t total = buffer.size();
    if (total == 0) {
        return Result<void>::failure(StripError::CONFIG, "cannot animate an empty strip");
    }
    if (total != pattern.mNumLeds) {
        std::ostringstream msg;
        msg << patternName(pattern.mKind) << " pattern was built for " << pattern.mNumLeds
            << " pixels but the buffer has " << total;
        return Result<void>::failure(StripError::CONFIG, msg.str());
    }

    // Render off to the side so a failure leaves buffer and levels untouched.
    std::vector<Pixel> frame(total, Pixel::off());
    std::vector<float> nextLevels(pattern.mLevels.size(), 0.0f);
    eb_random rng = pattern.mRng;
    std::visit(RenderVisitor{colorway, total, phase, rng, pattern.mLevels, frame, nextLevels},
               pattern.mKind);

    Result<void> committed = buffer.commit(frame);
    if (!committed) {
        return committed;
    }
    pattern.mLevels.swap(nextLevels);
    pattern.mRng = rng;
    return Result<void>::success();
}

} // namespace eb
