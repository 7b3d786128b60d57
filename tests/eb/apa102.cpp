#include "test.h"

#include "eb/chipsets/apa102.h"
#include "platforms/stub/capture_transport.h"

using namespace eb;

TEST_CASE("APA102 frame size") {
    CHECK_EQ(apa102::calculateBytes(0), 8u);
    CHECK_EQ(apa102::calculateBytes(1), 12u);
    CHECK_EQ(apa102::calculateBytes(31), 4u + 124u + 4u);
    CHECK_EQ(apa102::calculateBytes(32), 4u + 128u + 8u);
}

TEST_CASE("APA102 frame layout") {
    const Pixel pixels[] = {
        Pixel(CRGB(1, 2, 3), 1.0f),
        Pixel::off(),
    };
    std::vector<uint8_t> bytes;
    apa102::encodeFrame(pixels, 2, &bytes);

    const std::vector<uint8_t> expected = {
        0x00, 0x00, 0x00, 0x00,  // start frame
        0xFF, 0x03, 0x02, 0x01,  // full brightness, B G R
        0xE0, 0x00, 0x00, 0x00,  // off
        0xFF, 0xFF, 0xFF, 0xFF,  // end frame
    };
    CHECK_EQ(bytes, expected);
    CHECK_EQ(bytes.size(), apa102::calculateBytes(2));
}

TEST_CASE("APA102 end frame grows with the strip") {
    std::vector<Pixel> pixels(40, Pixel(CRGB(5, 5, 5), 0.5f));
    std::vector<uint8_t> bytes;
    apa102::encodeFrame(pixels.data(), pixels.size(), &bytes);
    REQUIRE_EQ(bytes.size(), apa102::calculateBytes(40));
    for (size_t i = 4 + 40 * 4; i < bytes.size(); ++i) {
        CHECK_EQ(bytes[i], 0xFF);
    }
}

TEST_CASE("APA102 brightness field") {
    CHECK_EQ(apa102::brightness5(Pixel(CRGB(9, 9, 9), 1.0f)), 31);
    CHECK_EQ(apa102::brightness5(Pixel(CRGB(9, 9, 9), 0.5f)), 16);
    CHECK_EQ(apa102::brightness5(Pixel(CRGB(9, 9, 9), 0.0f)), 0);
    // A lit pixel never disappears.
    CHECK_EQ(apa102::brightness5(Pixel(CRGB(9, 9, 9), 0.01f)), 1);
    CHECK_EQ(apa102::brightness5(Pixel(CRGB::Black, 0.01f)), 0);
    CHECK_EQ(apa102::brightness5(Pixel(CRGB(9, 9, 9), 4.0f)), 31);
}

TEST_CASE("CaptureTransport records frames and bytes") {
    CaptureTransport capture;
    const Pixel pixels[] = {Pixel(CRGB(0x11, 0x22, 0x33), 1.0f)};

    REQUIRE(capture.writeFrame(pixels, 1).ok());
    CHECK_EQ(capture.writeCount(), 1u);
    REQUIRE_EQ(capture.frames().size(), 1u);
    CHECK_EQ(capture.lastFrame()[0], pixels[0]);
    const std::vector<uint8_t>& bytes = capture.getCapturedBytes();
    REQUIRE_EQ(bytes.size(), 12u);
    CHECK_EQ(bytes[5], 0x33);
    CHECK_EQ(bytes[6], 0x22);
    CHECK_EQ(bytes[7], 0x11);

    capture.failNextWrites(2);
    CHECK_EQ(capture.writeFrame(pixels, 1).error(), StripError::TRANSPORT_WRITE);
    CHECK_EQ(capture.writeFrame(pixels, 1).error(), StripError::TRANSPORT_WRITE);
    CHECK(capture.writeFrame(pixels, 1).ok());
    CHECK_EQ(capture.writeCount(), 4u);
    CHECK_EQ(capture.frames().size(), 2u);
}
