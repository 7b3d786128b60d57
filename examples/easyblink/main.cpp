// Runs one animation on an APA102 strip until stopped (or for --frames frames).
//
//   easyblink --leds 120 --colorway rainbow --pattern chase:10 --delay 20
//   easyblink --leds 60 --preset fireplace --delay 40

#include <cstdio>

#include "EasyBlink.h"
#include "eb/error.h"
#include "eb/options.h"
#include "eb/warn.h"

int main(int argc, char** argv) {
    eb::Result<eb::StripOptions> parsed = eb::parseOptions(argc, argv);
    if (!parsed) {
        std::fprintf(stderr, "%s\n\n%s", parsed.message(), eb::usage(argv[0]).c_str());
        return 2;
    }
    const eb::StripOptions& opts = parsed.value();
    if (opts.help) {
        std::fputs(eb::usage(argv[0]).c_str(), stdout);
        return 0;
    }

    eb::Result<eb::Controller> created = eb::Controller::create(opts.pixelCount, opts.spi);
    if (!created) {
        EB_ERROR(eb::errorName(created.error()) << ": " << created.message());
        return 1;
    }
    eb::Controller& controller = created.value();

    if (opts.preset) {
        EB_INFO("running preset on " << controller.numLeds() << " pixels via "
                << controller.transport().name() << ", " << opts.delayMs << " ms/frame");
    } else {
        EB_INFO("running " << eb::patternName(opts.pattern) << " with " << opts.colorway.name()
                << " on " << controller.numLeds() << " pixels via " << controller.transport().name()
                << ", " << opts.delayMs << " ms/frame");
    }

    for (uint64_t frame = 0; opts.frames == 0 || frame < opts.frames; ++frame) {
        eb::Result<void> shown = opts.preset
            ? controller.executeColorwayPattern(*opts.preset, opts.delayMs)
            : controller.executePattern(opts.colorway, opts.pattern, opts.delayMs);
        if (shown) {
            continue;
        }
        if (shown.error() != eb::StripError::TRANSPORT_WRITE) {
            EB_ERROR(eb::errorName(shown.error()) << ": " << shown.message());
            return 1;
        }
        // Write failures are transient (bus busy); the next frame tries again.
    }

    eb::Result<void> cleared = controller.clear();
    if (!cleared) {
        EB_WARN("could not blank the strip: " << cleared.message());
        return 1;
    }
    return 0;
}
