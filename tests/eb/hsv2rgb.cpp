#include "test.h"

#include "eb/hsv2rgb.h"

using namespace eb;

TEST_CASE("hsv2rgb primaries") {
    CHECK_EQ(hsv2rgb(0.0f, 1.0f, 1.0f), CRGB(255, 0, 0));
    CHECK_EQ(hsv2rgb(120.0f, 1.0f, 1.0f), CRGB(0, 255, 0));
    CHECK_EQ(hsv2rgb(240.0f, 1.0f, 1.0f), CRGB(0, 0, 255));
    CHECK_EQ(hsv2rgb(360.0f, 1.0f, 1.0f), CRGB(255, 0, 0));
    CHECK_EQ(hsv2rgb(-120.0f, 1.0f, 1.0f), CRGB(0, 0, 255));
}

TEST_CASE("hsv2rgb saturation and value") {
    CHECK_EQ(hsv2rgb(77.0f, 0.0f, 1.0f), CRGB(255, 255, 255));
    CHECK_EQ(hsv2rgb(200.0f, 1.0f, 0.0f), CRGB(0, 0, 0));
    // Out of range inputs are clamped.
    CHECK_EQ(hsv2rgb(0.0f, 2.0f, 3.0f), CRGB(255, 0, 0));
}
