#include "eb/controller.h"

#include "eb/delay.h"
#include "eb/dbg.h"
#include "eb/error.h"
#include "eb/pattern_engine.h"
#include "eb/warn.h"
#include "platforms/posix/apa102_spi_transport.h"

namespace eb {

Controller::Controller(size_t numLeds, std::unique_ptr<Transport> transport, uint16_t seed)
    : mBuffer(numLeds), mTransport(std::move(transport)), mRng(seed), mPresetSeed(mRng.random16()) {}

Result<Controller> Controller::create(size_t numLeds) {
    return create(numLeds, SpiConfig::platformDefault());
}

Result<Controller> Controller::create(size_t numLeds, const SpiConfig& spi) {
    return create(numLeds, [spi]() { return Apa102SpiTransport::open(spi); });
}

Result<Controller> Controller::create(size_t numLeds, const TransportFactory& openTransport,
                                      uint16_t seed) {
    if (numLeds == 0) {
        EB_ERROR("refusing to drive a strip of 0 pixels");
        return Result<Controller>::failure(StripError::CONFIG, "pixel count must be at least 1");
    }
    Result<std::unique_ptr<Transport>> transport = openTransport();
    if (!transport) {
        return Result<Controller>::failure(StripError::TRANSPORT_INIT, transport.message());
    }
    if (!transport.value()) {
        return Result<Controller>::failure(StripError::TRANSPORT_INIT, "transport factory returned nothing");
    }
    EB_INFO("controller for " << numLeds << " pixels on " << transport.value()->name());
    return Result<Controller>::success(Controller(numLeds, std::move(transport.value()), seed));
}

Result<void> Controller::executePattern(const Colorway& colorway, const PatternKind& kind,
                                        uint32_t delayMs) {
    if (!mPattern || !(mPattern->kind() == kind)) {
        Result<Pattern> fresh = Pattern::create(kind, mBuffer.size(), mRng);
        if (!fresh) {
            EB_ERROR(patternName(kind) << ": " << fresh.message());
            return Result<void>::from_error(fresh);
        }
        EB_DBG("starting " << patternName(kind) << " pattern");
        mPattern = std::move(fresh.value());
    }

    Result<void> advanced = PatternEngine::advance(mBuffer, colorway, *mPattern);
    if (!advanced) {
        EB_ERROR(patternName(kind) << ": " << advanced.message());
        return advanced;
    }

    Result<void> flushed = flush();
    delay(delayMs);
    return flushed;
}

Result<void> Controller::executeColorwayPattern(ColorwayPreset preset, uint32_t delayMs) {
    // Same seed every frame so the colorway stays the same across calls.
    eb_random presetRng(mPresetSeed);
    switch (preset) {
        case ColorwayPreset::FIREPLACE:
            return executePattern(Colorway::fire(presetRng), Twinkle{64, 0.85f}, delayMs);
        case ColorwayPreset::CHRISTMAS_TRADITIONAL:
            return executePattern(Colorway::christmas(presetRng), Twinkle{}, delayMs);
    }
    return Result<void>::failure(StripError::CONFIG, "unknown colorway preset");
}

Result<void> Controller::flush() {
    Result<void> written = mTransport->writeFrame(mBuffer.data(), mBuffer.size());
    if (!written) {
        EB_WARN(mTransport->name() << " write failed: " << written.message());
    }
    return written;
}

Result<void> Controller::clear() {
    mBuffer.clear();
    return flush();
}

} // namespace eb
