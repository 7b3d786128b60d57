#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "eb/result.h"
#include "eb/transport.h"

namespace eb {

/// @brief In-memory transport for host builds and tests.
///
/// Records every committed frame together with the APA102 bytes that would
/// have gone out on the wire. Can be told to fail upcoming writes to exercise
/// the TRANSPORT_WRITE path.
class CaptureTransport : public Transport {
  public:
    CaptureTransport() {}

    Result<void> writeFrame(const Pixel* pixels, size_t count) override;
    const char* name() const override { return "capture"; }

    /// Make the next @p n writes fail with StripError::TRANSPORT_WRITE.
    void failNextWrites(int n) { mFailWrites = n; }

    /// Number of writeFrame() calls, including failed ones.
    size_t writeCount() const { return mWriteCount; }

    const std::vector<std::vector<Pixel>>& frames() const { return mFrames; }
    const std::vector<Pixel>& lastFrame() const;

    /// Captures raw APA102 bytes of the last committed frame
    const std::vector<uint8_t>& getCapturedBytes() const { return mBytes; }

  private:
    int mFailWrites = 0;
    size_t mWriteCount = 0;
    std::vector<std::vector<Pixel>> mFrames;
    std::vector<uint8_t> mBytes;
};

} // namespace eb
