#include "eb/pattern.h"

#include <sstream>

namespace eb {

namespace {

struct NameVisitor {
    const char* operator()(const Chase&) const { return "Chase"; }
    const char* operator()(const Pulse&) const { return "Pulse"; }
    const char* operator()(const TheaterChase&) const { return "TheaterChase"; }
    const char* operator()(const Twinkle&) const { return "Twinkle"; }
    const char* operator()(const KnightRider&) const { return "KnightRider"; }
};

struct ValidateVisitor {
    Result<void> operator()(const Chase& c) const {
        if (c.width == 0) {
            return Result<void>::failure(StripError::CONFIG, "chase width must be at least 1");
        }
        return Result<void>::success();
    }
    Result<void> operator()(const Pulse& p) const {
        if (p.period == 0) {
            return Result<void>::failure(StripError::CONFIG, "pulse period must be at least 1");
        }
        return Result<void>::success();
    }
    Result<void> operator()(const TheaterChase&) const {
        return Result<void>::success();
    }
    Result<void> operator()(const Twinkle& t) const {
        if (!(t.decay >= 0.0f && t.decay < 1.0f)) {
            std::ostringstream msg;
            msg << "twinkle decay " << t.decay << " is outside [0,1)";
            return Result<void>::failure(StripError::CONFIG, msg.str());
        }
        return Result<void>::success();
    }
    Result<void> operator()(const KnightRider&) const {
        return Result<void>::success();
    }
};

} // namespace

const char* patternName(const PatternKind& kind) {
    return std::visit(NameVisitor{}, kind);
}

Result<void> validate(const PatternKind& kind) {
    return std::visit(ValidateVisitor{}, kind);
}

Pattern::Pattern(const PatternKind& kind, size_t numLeds, uint16_t seed)
    : mKind(kind), mNumLeds(numLeds), mRng(seed) {
    if (std::holds_alternative<Twinkle>(mKind)) {
        mLevels.assign(numLeds, 0.0f);
    }
}

Result<Pattern> Pattern::create(const PatternKind& kind, size_t numLeds, eb_random& rng) {
    if (numLeds == 0) {
        return Result<Pattern>::failure(StripError::CONFIG, "pattern needs at least one pixel");
    }
    Result<void> valid = validate(kind);
    if (!valid) {
        return Result<Pattern>::failure(valid.error(), valid.message());
    }
    return Result<Pattern>::success(Pattern(kind, numLeds, rng.random16()));
}

} // namespace eb
