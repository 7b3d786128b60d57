#pragma once

#include <cstddef>
#include <vector>

#include "eb/pixel.h"
#include "eb/result.h"

namespace eb {

/// Ordered, fixed-length sequence of pixels for one strip.
///
/// The length is set at construction and never changes. Every pixel starts
/// black with brightness 0. The Controller owns the buffer; the pattern engine
/// only borrows it for the duration of one advance() call.
class PixelBuffer {
  public:
    explicit PixelBuffer(size_t numLeds) : mPixels(numLeds) {}

    size_t size() const { return mPixels.size(); }
    bool empty() const { return mPixels.empty(); }

    Pixel& operator[](size_t i) { return mPixels[i]; }
    const Pixel& operator[](size_t i) const { return mPixels[i]; }

    const Pixel* data() const { return mPixels.data(); }
    const std::vector<Pixel>& pixels() const { return mPixels; }

    std::vector<Pixel>::const_iterator begin() const { return mPixels.begin(); }
    std::vector<Pixel>::const_iterator end() const { return mPixels.end(); }

    /// Set every pixel to black, brightness 0.
    void clear();

    /// Replace the whole contents with a fully rendered frame in one step.
    /// The frame must have exactly size() pixels; on mismatch nothing changes.
    /// On success the previous contents are left in @p frame.
    Result<void> commit(std::vector<Pixel>& frame);

  private:
    std::vector<Pixel> mPixels;
};

} // namespace eb
