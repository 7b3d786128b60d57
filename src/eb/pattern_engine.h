#pragma once

#include "eb/colorway.h"
#include "eb/pattern.h"
#include "eb/pixel_buffer.h"
#include "eb/result.h"

namespace eb {

/// Renders one frame of a pattern into a pixel buffer.
class PatternEngine {
  public:
    /// Compute the next frame and write it over the whole buffer.
    ///
    /// The frame is rendered at the pattern's current phase, then the phase
    /// advances exactly once. The phase advances even when the call fails;
    /// on failure neither the buffer nor any other pattern state changes.
    ///
    /// Fails with StripError::CONFIG when the buffer is empty or its length
    /// differs from the strip the pattern was created for.
    static Result<void> advance(PixelBuffer& buffer, const Colorway& colorway, Pattern& pattern);

    /// Phase that follows @p phase for this kind on a strip of @p numLeds.
    /// Chase wraps at the strip length; everything else counts up.
    static uint64_t nextPhase(const PatternKind& kind, uint64_t phase, size_t numLeds);
};

} // namespace eb
