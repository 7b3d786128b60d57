#include "test.h"

#include "eb/controller.h"
#include "eb/delay.h"
#include "platforms/stub/capture_transport.h"

using namespace eb;

namespace {

// Builds a controller on a CaptureTransport and keeps a handle to it.
struct CaptureRig {
    CaptureTransport* transport = nullptr;
    int factoryCalls = 0;

    Controller::TransportFactory factory() {
        return [this]() {
            ++factoryCalls;
            auto capture = std::make_unique<CaptureTransport>();
            transport = capture.get();
            return Result<std::unique_ptr<Transport>>::success(std::move(capture));
        };
    }

    Controller make(size_t numLeds, uint16_t seed = 1337) {
        Result<Controller> made = Controller::create(numLeds, factory(), seed);
        REQUIRE(made.ok());
        return std::move(made.value());
    }
};

// Records the delays the controller asks for instead of sleeping.
struct DelayRecorder {
    std::vector<uint32_t> delays;
    DelayRecorder() {
        inject_delay_handler([this](uint32_t ms) { delays.push_back(ms); });
    }
    ~DelayRecorder() { clear_delay_handler(); }
};

const Colorway kSolid = Colorway::solid(CRGB(10, 20, 30));

} // namespace

TEST_CASE("Controller::create") {
    CaptureRig rig;

    SUBCASE("zero pixels is a config error and opens nothing") {
        Result<Controller> made = Controller::create(0, rig.factory());
        CHECK_FALSE(made.ok());
        CHECK_EQ(made.error(), StripError::CONFIG);
        CHECK_EQ(rig.factoryCalls, 0);
    }

    SUBCASE("starts dark") {
        Controller controller = rig.make(5);
        CHECK_EQ(rig.factoryCalls, 1);
        CHECK_EQ(controller.numLeds(), 5u);
        CHECK(controller.pattern() == nullptr);
        for (const Pixel& p : controller.buffer()) {
            CHECK_EQ(p, Pixel::off());
        }
        CHECK_EQ(std::string(controller.transport().name()), "capture");
    }

    SUBCASE("transport failure is reported as TRANSPORT_INIT") {
        Controller::TransportFactory failing = []() {
            return Result<std::unique_ptr<Transport>>::failure(StripError::TRANSPORT_WRITE, "bus on fire");
        };
        Result<Controller> made = Controller::create(3, failing);
        CHECK_EQ(made.error(), StripError::TRANSPORT_INIT);
        CHECK_EQ(std::string(made.message()), "bus on fire");
    }

    SUBCASE("a factory that returns nothing") {
        Controller::TransportFactory empty = []() {
            return Result<std::unique_ptr<Transport>>::success(nullptr);
        };
        CHECK_EQ(Controller::create(3, empty).error(), StripError::TRANSPORT_INIT);
    }
}

TEST_CASE("Controller on a missing SPI device") {
    SpiConfig spi;
    spi.device = "/nonexistent/spidev9.9";
    ScopedLogDisable quiet;
    Result<Controller> made = Controller::create(3, spi);
    CHECK_FALSE(made.ok());
    CHECK_EQ(made.error(), StripError::TRANSPORT_INIT);
    CHECK(std::string(made.message()).find("/nonexistent/spidev9.9") != std::string::npos);
}

TEST_CASE("executePattern runs one frame, flushes and waits") {
    CaptureRig rig;
    DelayRecorder recorder;
    Controller controller = rig.make(3);

    REQUIRE(controller.executePattern(kSolid, Chase{1}, 7).ok());
    CHECK_EQ(recorder.delays, std::vector<uint32_t>{7});
    REQUIRE_EQ(rig.transport->frames().size(), 1u);
    CHECK_EQ(rig.transport->lastFrame(), controller.buffer().pixels());
    CHECK_EQ(litIndices(controller.buffer()), std::vector<size_t>{0});

    // The frame went out as APA102 bytes.
    const std::vector<uint8_t>& bytes = rig.transport->getCapturedBytes();
    REQUIRE_EQ(bytes.size(), apa102::calculateBytes(3));
    CHECK_EQ(bytes[4], 0xFF);
    CHECK_EQ(bytes[5], 30);
    CHECK_EQ(bytes[6], 20);
    CHECK_EQ(bytes[7], 10);
    CHECK_EQ(bytes[8], 0xE0);
}

TEST_CASE("executePattern keeps the pattern while the kind is unchanged") {
    CaptureRig rig;
    DelayRecorder recorder;
    Controller controller = rig.make(6);

    REQUIRE(controller.executePattern(kSolid, Chase{2}, 0).ok());
    REQUIRE(controller.executePattern(kSolid, Chase{2}, 0).ok());
    CHECK_EQ(litIndices(controller.buffer()), (std::vector<size_t>{1, 2}));
    REQUIRE(controller.pattern() != nullptr);
    CHECK_EQ(controller.pattern()->phase(), 2u);

    // The colorway may change freely between frames.
    REQUIRE(controller.executePattern(Colorway::solid(CRGB(1, 2, 3)), Chase{2}, 0).ok());
    CHECK_EQ(litIndices(controller.buffer()), (std::vector<size_t>{2, 3}));
    CHECK_EQ(controller.buffer()[2].color, CRGB(1, 2, 3));

    SUBCASE("different parameters restart the pattern") {
        REQUIRE(controller.executePattern(kSolid, Chase{3}, 0).ok());
        CHECK_EQ(litIndices(controller.buffer()), (std::vector<size_t>{0, 1, 2}));
        CHECK_EQ(controller.pattern()->phase(), 1u);
    }

    SUBCASE("a different kind restarts at phase 0") {
        REQUIRE(controller.executePattern(kSolid, TheaterChase{}, 0).ok());
        CHECK_EQ(litIndices(controller.buffer()), (std::vector<size_t>{0, 3}));
        CHECK(std::holds_alternative<TheaterChase>(controller.pattern()->kind()));
    }
}

TEST_CASE("executePattern rejects a bad pattern without touching the strip") {
    CaptureRig rig;
    DelayRecorder recorder;
    Controller controller = rig.make(4);
    ScopedLogDisable quiet;

    Result<void> result = controller.executePattern(kSolid, Pulse{0}, 5);
    CHECK_EQ(result.error(), StripError::CONFIG);
    CHECK_EQ(rig.transport->writeCount(), 0u);
    CHECK(recorder.delays.empty());
    CHECK(controller.pattern() == nullptr);
}

TEST_CASE("A write failure keeps the frame for a retry") {
    CaptureRig rig;
    DelayRecorder recorder;
    Controller controller = rig.make(4);
    ScopedLogDisable quiet;

    REQUIRE(controller.executePattern(kSolid, Chase{1}, 0).ok());
    rig.transport->failNextWrites(1);

    Result<void> result = controller.executePattern(kSolid, Chase{1}, 3);
    CHECK_FALSE(result.ok());
    CHECK_EQ(result.error(), StripError::TRANSPORT_WRITE);
    // The frame was rendered and the phase moved on regardless.
    CHECK_EQ(litIndices(controller.buffer()), std::vector<size_t>{1});
    CHECK_EQ(controller.pattern()->phase(), 2u);
    CHECK_EQ(recorder.delays, (std::vector<uint32_t>{0, 3}));
    CHECK_EQ(rig.transport->frames().size(), 1u);

    REQUIRE(controller.flush().ok());
    CHECK_EQ(rig.transport->frames().size(), 2u);
    CHECK_EQ(rig.transport->lastFrame(), controller.buffer().pixels());
}

TEST_CASE("executeColorwayPattern") {
    CaptureRig rig;
    DelayRecorder recorder;
    Controller controller = rig.make(20);

    SUBCASE("fireplace twinkles warm colors") {
        for (int frame = 0; frame < 10; ++frame) {
            REQUIRE(controller.executeColorwayPattern(ColorwayPreset::FIREPLACE, 1).ok());
        }
        REQUIRE(controller.pattern() != nullptr);
        CHECK(std::holds_alternative<Twinkle>(controller.pattern()->kind()));
        CHECK_EQ(controller.pattern()->phase(), 10u);
        for (const Pixel& p : controller.buffer()) {
            if (p.isLit()) {
                CHECK(p.color.r >= p.color.b);
            }
        }
        CHECK_EQ(rig.transport->frames().size(), 10u);
    }

    SUBCASE("christmas keeps each pixel on the same color") {
        std::vector<CRGB> colors(20);
        for (int frame = 0; frame < 30; ++frame) {
            REQUIRE(controller.executeColorwayPattern(ColorwayPreset::CHRISTMAS_TRADITIONAL, 0).ok());
            for (size_t i = 0; i < controller.numLeds(); ++i) {
                const Pixel& p = controller.buffer()[i];
                if (!p.isLit()) {
                    continue;
                }
                if (!colors[i]) {
                    colors[i] = p.color;
                }
                CHECK_EQ(p.color, colors[i]);
            }
        }
    }
}

TEST_CASE("Controllers with the same seed render the same frames") {
    CaptureRig rigA;
    CaptureRig rigB;
    DelayRecorder recorder;
    Controller a = rigA.make(16, 4242);
    Controller b = rigB.make(16, 4242);
    for (int frame = 0; frame < 25; ++frame) {
        REQUIRE(a.executeColorwayPattern(ColorwayPreset::FIREPLACE, 0).ok());
        REQUIRE(b.executeColorwayPattern(ColorwayPreset::FIREPLACE, 0).ok());
        CHECK_EQ(a.buffer().pixels(), b.buffer().pixels());
    }
}

TEST_CASE("clear blanks the strip") {
    CaptureRig rig;
    DelayRecorder recorder;
    Controller controller = rig.make(5);
    REQUIRE(controller.executePattern(kSolid, Pulse{10}, 0).ok());
    CHECK_EQ(litIndices(controller.buffer()).size(), 5u);

    REQUIRE(controller.clear().ok());
    CHECK(litIndices(controller.buffer()).empty());
    for (const Pixel& p : rig.transport->lastFrame()) {
        CHECK_EQ(p, Pixel::off());
    }
    const std::vector<uint8_t>& bytes = rig.transport->getCapturedBytes();
    for (size_t led = 0; led < 5; ++led) {
        CHECK_EQ(bytes[4 + led * 4], 0xE0);
    }
}
