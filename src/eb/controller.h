#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "eb/colorway.h"
#include "eb/pattern.h"
#include "eb/pixel_buffer.h"
#include "eb/random.h"
#include "eb/result.h"
#include "eb/spi.h"
#include "eb/transport.h"

namespace eb {

/// Colorways that come with a pattern of their own.
enum class ColorwayPreset : uint8_t {
    FIREPLACE,              ///< Fire colorway, twinkling like a crackling fire
    CHRISTMAS_TRADITIONAL,  ///< Classic tree light colors, twinkling
};

/// @brief Drives one strip: owns the pixel buffer, the current pattern and
/// the hardware transport.
///
/// Typical use:
/// @code
/// auto controller = eb::Controller::create(120);
/// if (!controller) { /* report controller.message() */ }
/// while (true) {
///     controller.value().executePattern(eb::Colorway::rainbow(), eb::Chase{10}, 20);
/// }
/// @endcode
class Controller {
  public:
    using TransportFactory = std::function<Result<std::unique_ptr<Transport>>()>;

    /// Strip on the platform default SPI bus.
    static Result<Controller> create(size_t numLeds);
    static Result<Controller> create(size_t numLeds, const SpiConfig& spi);

    /// Strip on a caller supplied transport. The factory is only invoked
    /// once @p numLeds has been validated.
    /// @param seed seeds the generator handed to randomized patterns
    static Result<Controller> create(size_t numLeds, const TransportFactory& openTransport,
                                     uint16_t seed = 1337);

    Controller(Controller&&) = default;
    Controller& operator=(Controller&&) = default;

    /// Run one frame: advance the pattern once, flush to the strip, then
    /// sleep @p delayMs. The pattern keeps its state while @p kind is
    /// unchanged between calls; a different kind starts over at phase 0.
    ///
    /// A TRANSPORT_WRITE failure leaves the buffer intact and the phase
    /// advanced; call flush() to retry or simply run the next frame.
    Result<void> executePattern(const Colorway& colorway, const PatternKind& kind, uint32_t delayMs);

    /// Run one frame of a colorway that picks its own pattern.
    Result<void> executeColorwayPattern(ColorwayPreset preset, uint32_t delayMs);

    /// Re-send the current buffer without advancing anything.
    Result<void> flush();

    /// Blank the strip and flush.
    Result<void> clear();

    size_t numLeds() const { return mBuffer.size(); }
    const PixelBuffer& buffer() const { return mBuffer; }
    /// The active pattern, if any frame has run yet.
    const Pattern* pattern() const { return mPattern ? &*mPattern : nullptr; }
    const Transport& transport() const { return *mTransport; }

  private:
    Controller(size_t numLeds, std::unique_ptr<Transport> transport, uint16_t seed);

    PixelBuffer mBuffer;
    std::unique_ptr<Transport> mTransport;
    std::optional<Pattern> mPattern;
    eb_random mRng;
    uint16_t mPresetSeed;
};

} // namespace eb
