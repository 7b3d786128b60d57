#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "easyblink_config.h"
#include "eb/colorway.h"
#include "eb/controller.h"
#include "eb/pattern.h"
#include "eb/random.h"
#include "eb/result.h"
#include "eb/spi.h"

namespace eb {

/// Everything needed to run an animation, chosen once per run.
struct StripOptions {
    size_t pixelCount = 0;
    Colorway colorway = Colorway::rainbow();
    PatternKind pattern = Chase{};
    /// When set, overrides colorway and pattern.
    std::optional<ColorwayPreset> preset;
    uint32_t delayMs = EASYBLINK_DEFAULT_DELAY_MS;
    uint64_t frames = 0;  ///< 0 runs until the process is stopped
    uint16_t seed = 1337;
    SpiConfig spi;
    bool help = false;
};

/// Parse command line arguments (argv[0] is skipped).
/// Fails with StripError::CONFIG naming the offending argument.
Result<StripOptions> parseOptions(int argc, const char* const* argv);

/// rainbow[:step] | fire | solid:R,G,B | hue:NAME|DEGREES |
/// gradient:P:R,G,B/P:R,G,B[/...] | christmas
Result<Colorway> parseColorway(const std::string& text, eb_random& rng);

/// chase[:width] | pulse[:period] | theater | twinkle | knightrider[:tail]
Result<PatternKind> parsePattern(const std::string& text);

/// fireplace | christmas
Result<ColorwayPreset> parsePreset(const std::string& text);

std::string usage(const char* program);

} // namespace eb
