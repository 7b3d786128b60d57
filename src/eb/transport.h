#pragma once

#include <cstddef>

#include "eb/pixel.h"
#include "eb/result.h"

namespace eb {

/// @brief Hardware sink that commits a frame of pixels to the strip.
///
/// A transport receives the whole strip, in strip order, and either commits
/// it or reports StripError::TRANSPORT_WRITE. It must not keep a pointer to
/// the pixels past the call.
class Transport {
  public:
    virtual ~Transport() {}

    /// Send brightness and color for @p count pixels starting at @p pixels.
    virtual Result<void> writeFrame(const Pixel* pixels, size_t count) = 0;

    /// Short human readable name, for logging.
    virtual const char* name() const = 0;
};

} // namespace eb
