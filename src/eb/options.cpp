#include "eb/options.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "eb/hsv2rgb.h"

namespace eb {

namespace {

Result<uint64_t> config_error(const std::string& what) {
    return Result<uint64_t>::failure(StripError::CONFIG, what);
}

Result<uint64_t> parse_unsigned(const std::string& text, uint64_t max, const char* what) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return config_error(std::string(what) + ": expected a non-negative integer, got '" + text + "'");
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return config_error(std::string(what) + ": expected a non-negative integer, got '" + text + "'");
    }
    if (v > max) {
        std::ostringstream msg;
        msg << what << ": " << v << " is larger than " << max;
        return config_error(msg.str());
    }
    return Result<uint64_t>::success(v);
}

Result<float> parse_unit_float(const std::string& text, const char* what) {
    errno = 0;
    char* end = nullptr;
    const float v = std::strtof(text.c_str(), &end);
    if (text.empty() || errno != 0 || end == text.c_str() || *end != '\0') {
        return Result<float>::failure(StripError::CONFIG,
                                      std::string(what) + ": expected a number, got '" + text + "'");
    }
    return Result<float>::success(v);
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

// "R,G,B" with each channel 0..255
Result<CRGB> parse_rgb(const std::string& text) {
    const std::vector<std::string> parts = split(text, ',');
    if (parts.size() != 3) {
        return Result<CRGB>::failure(StripError::CONFIG, "expected R,G,B, got '" + text + "'");
    }
    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i) {
        Result<uint64_t> v = parse_unsigned(parts[i], 255, "color channel");
        if (!v) {
            return Result<CRGB>::failure(v.error(), v.message());
        }
        channels[i] = static_cast<uint8_t>(v.value());
    }
    return Result<CRGB>::success(CRGB(channels[0], channels[1], channels[2]));
}

Result<int> parse_hue(const std::string& text) {
    struct NamedHue {
        const char* name;
        int degrees;
    };
    static const NamedHue kNames[] = {
        {"red", Hue::RED},   {"orange", Hue::ORANGE}, {"yellow", Hue::YELLOW},
        {"green", Hue::GREEN}, {"blue", Hue::BLUE},   {"purple", Hue::PURPLE},
    };
    for (const NamedHue& n : kNames) {
        if (text == n.name) {
            return Result<int>::success(n.degrees);
        }
    }
    Result<uint64_t> v = parse_unsigned(text, 359, "hue");
    if (!v) {
        return Result<int>::failure(StripError::CONFIG, "unknown hue '" + text + "'");
    }
    return Result<int>::success(static_cast<int>(v.value()));
}

// Splits "name:args" into its two halves; args is empty when there is no ':'.
void split_head(const std::string& text, std::string* head, std::string* args) {
    const size_t colon = text.find(':');
    if (colon == std::string::npos) {
        *head = text;
        args->clear();
    } else {
        *head = text.substr(0, colon);
        *args = text.substr(colon + 1);
    }
}

} // namespace

Result<Colorway> parseColorway(const std::string& text, eb_random& rng) {
    std::string head, args;
    split_head(text, &head, &args);

    if (head == "rainbow") {
        uint32_t step = EASYBLINK_DEFAULT_RAINBOW_STEP;
        if (!args.empty()) {
            Result<uint64_t> v = parse_unsigned(args, 359, "rainbow step");
            if (!v) {
                return Result<Colorway>::failure(v.error(), v.message());
            }
            step = static_cast<uint32_t>(v.value());
        }
        return Result<Colorway>::success(Colorway::rainbow(step));
    }
    if (head == "fire" || head == "fireplace") {
        return Result<Colorway>::success(Colorway::fire(rng));
    }
    if (head == "christmas") {
        return Result<Colorway>::success(Colorway::christmas(rng));
    }
    if (head == "solid") {
        Result<CRGB> rgb = parse_rgb(args);
        if (!rgb) {
            return Result<Colorway>::failure(rgb.error(), rgb.message());
        }
        return Result<Colorway>::success(Colorway::solid(rgb.value()));
    }
    if (head == "hue") {
        Result<int> hue = parse_hue(args);
        if (!hue) {
            return Result<Colorway>::failure(hue.error(), hue.message());
        }
        return Result<Colorway>::success(Colorway::hue(hue.value()));
    }
    if (head == "gradient") {
        std::vector<GradientStop> stops;
        for (const std::string& stop : split(args, '/')) {
            std::string pos, rgbText;
            split_head(stop, &pos, &rgbText);
            Result<float> p = parse_unit_float(pos, "gradient stop position");
            if (!p) {
                return Result<Colorway>::failure(p.error(), p.message());
            }
            Result<CRGB> rgb = parse_rgb(rgbText);
            if (!rgb) {
                return Result<Colorway>::failure(rgb.error(), rgb.message());
            }
            stops.push_back(GradientStop{p.value(), rgb.value()});
        }
        return Colorway::gradient(std::move(stops));
    }
    return Result<Colorway>::failure(StripError::CONFIG, "unknown colorway '" + text + "'");
}

Result<PatternKind> parsePattern(const std::string& text) {
    std::string head, args;
    split_head(text, &head, &args);

    Result<PatternKind> kind;
    if (head == "chase") {
        Chase chase;
        if (!args.empty()) {
            Result<uint64_t> v = parse_unsigned(args, UINT32_MAX, "chase width");
            if (!v) {
                return Result<PatternKind>::failure(v.error(), v.message());
            }
            chase.width = static_cast<size_t>(v.value());
        }
        kind = Result<PatternKind>::success(chase);
    } else if (head == "pulse") {
        Pulse pulse;
        if (!args.empty()) {
            Result<uint64_t> v = parse_unsigned(args, UINT32_MAX, "pulse period");
            if (!v) {
                return Result<PatternKind>::failure(v.error(), v.message());
            }
            pulse.period = static_cast<uint32_t>(v.value());
        }
        kind = Result<PatternKind>::success(pulse);
    } else if (head == "theater" || head == "theaterchase") {
        kind = Result<PatternKind>::success(TheaterChase{});
    } else if (head == "twinkle" || head == "sparkle") {
        kind = Result<PatternKind>::success(Twinkle{});
    } else if (head == "knightrider") {
        KnightRider kr;
        if (!args.empty()) {
            Result<uint64_t> v = parse_unsigned(args, UINT32_MAX, "knightrider tail");
            if (!v) {
                return Result<PatternKind>::failure(v.error(), v.message());
            }
            kr.tail = static_cast<size_t>(v.value());
        }
        kind = Result<PatternKind>::success(kr);
    } else {
        return Result<PatternKind>::failure(StripError::CONFIG, "unknown pattern '" + text + "'");
    }

    Result<void> valid = validate(kind.value());
    if (!valid) {
        return Result<PatternKind>::failure(valid.error(), valid.message());
    }
    return kind;
}

Result<ColorwayPreset> parsePreset(const std::string& text) {
    if (text == "fireplace") {
        return Result<ColorwayPreset>::success(ColorwayPreset::FIREPLACE);
    }
    if (text == "christmas") {
        return Result<ColorwayPreset>::success(ColorwayPreset::CHRISTMAS_TRADITIONAL);
    }
    return Result<ColorwayPreset>::failure(StripError::CONFIG, "unknown preset '" + text + "'");
}

Result<StripOptions> parseOptions(int argc, const char* const* argv) {
    StripOptions opts;
    std::string colorwayText = "rainbow";
    bool haveLeds = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return Result<StripOptions>::success(std::move(opts));
        }
        if (i + 1 >= argc) {
            return Result<StripOptions>::failure(StripError::CONFIG, "missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--leds") {
            Result<uint64_t> v = parse_unsigned(value, UINT32_MAX, "--leds");
            if (!v) {
                return Result<StripOptions>::failure(v.error(), v.message());
            }
            if (v.value() == 0) {
                return Result<StripOptions>::failure(StripError::CONFIG, "--leds must be at least 1");
            }
            opts.pixelCount = static_cast<size_t>(v.value());
            haveLeds = true;
        } else if (arg == "--colorway") {
            colorwayText = value;
        } else if (arg == "--pattern") {
            Result<PatternKind> kind = parsePattern(value);
            if (!kind) {
                return Result<StripOptions>::failure(kind.error(), kind.message());
            }
            opts.pattern = kind.value();
        } else if (arg == "--preset") {
            Result<ColorwayPreset> preset = parsePreset(value);
            if (!preset) {
                return Result<StripOptions>::failure(preset.error(), preset.message());
            }
            opts.preset = preset.value();
        } else if (arg == "--delay") {
            Result<uint64_t> v = parse_unsigned(value, UINT32_MAX, "--delay");
            if (!v) {
                return Result<StripOptions>::failure(v.error(), v.message());
            }
            opts.delayMs = static_cast<uint32_t>(v.value());
        } else if (arg == "--frames") {
            Result<uint64_t> v = parse_unsigned(value, UINT64_MAX, "--frames");
            if (!v) {
                return Result<StripOptions>::failure(v.error(), v.message());
            }
            opts.frames = v.value();
        } else if (arg == "--seed") {
            Result<uint64_t> v = parse_unsigned(value, UINT16_MAX, "--seed");
            if (!v) {
                return Result<StripOptions>::failure(v.error(), v.message());
            }
            opts.seed = static_cast<uint16_t>(v.value());
        } else if (arg == "--device") {
            opts.spi.device = value;
        } else if (arg == "--speed") {
            Result<uint64_t> v = parse_unsigned(value, UINT32_MAX, "--speed");
            if (!v) {
                return Result<StripOptions>::failure(v.error(), v.message());
            }
            if (v.value() == 0) {
                return Result<StripOptions>::failure(StripError::CONFIG, "--speed must be at least 1");
            }
            opts.spi.speedHz = static_cast<uint32_t>(v.value());
        } else {
            return Result<StripOptions>::failure(StripError::CONFIG, "unknown option " + arg);
        }
    }

    if (!haveLeds) {
        return Result<StripOptions>::failure(StripError::CONFIG, "--leds is required");
    }

    eb_random rng(opts.seed);
    Result<Colorway> colorway = parseColorway(colorwayText, rng);
    if (!colorway) {
        return Result<StripOptions>::failure(colorway.error(), colorway.message());
    }
    opts.colorway = colorway.value();
    return Result<StripOptions>::success(std::move(opts));
}

std::string usage(const char* program) {
    std::ostringstream out;
    out << "usage: " << program << " --leds N [options]\n"
        << "\n"
        << "  --leds N           number of pixels on the strip (required, >= 1)\n"
        << "  --colorway SPEC    rainbow[:step] | fire | solid:R,G,B | hue:NAME|DEGREES |\n"
        << "                     gradient:P:R,G,B/P:R,G,B[/...] | christmas   (default rainbow)\n"
        << "                     hue names: red orange yellow green blue purple\n"
        << "  --pattern SPEC     chase[:width] | pulse[:period] | theater | twinkle |\n"
        << "                     knightrider[:tail]   (default chase)\n"
        << "  --preset NAME      fireplace | christmas (overrides colorway and pattern)\n"
        << "  --delay MS         delay between frames, 0 = as fast as possible (default "
        << EASYBLINK_DEFAULT_DELAY_MS << ")\n"
        << "  --frames N         stop after N frames and blank the strip, 0 = forever (default 0)\n"
        << "  --seed N           seed for fire and twinkle randomness (default 1337)\n"
        << "  --device PATH      SPI device (default " << EASYBLINK_DEFAULT_SPI_DEVICE << ")\n"
        << "  --speed HZ         SPI clock (default " << EASYBLINK_DEFAULT_SPI_SPEED_HZ << ")\n";
    return out.str();
}

} // namespace eb
