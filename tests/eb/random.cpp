#include "test.h"

#include "eb/random.h"

using namespace eb;

TEST_CASE("eb_random replays from a seed") {
    eb_random a(4321);
    eb_random b(4321);
    for (int i = 0; i < 50; ++i) {
        CHECK_EQ(a(), b());
        CHECK_EQ(a.random8(), b.random8());
        CHECK_EQ(a.random16(), b.random16());
    }

    eb_random c(4322);
    eb_random d(4321);
    bool differs = false;
    for (int i = 0; i < 10; ++i) {
        differs = differs || c.random16() != d.random16();
    }
    CHECK(differs);
}

TEST_CASE("eb_random default seed") {
    eb_random implicit;
    eb_random explicitSeed(1337);
    CHECK_EQ(implicit.random16(), explicitSeed.random16());
}

TEST_CASE("eb_random::randomFloat stays in range") {
    eb_random rng(9);
    for (int i = 0; i < 1000; ++i) {
        const float v = rng.randomFloat(0.5f, 1.0f);
        CHECK(v >= 0.5f);
        CHECK(v <= 1.0f);
    }
}

TEST_CASE("random8 covers the whole byte") {
    eb_random rng(77);
    int low = 0;
    int high = 0;
    for (int i = 0; i < 2000; ++i) {
        const uint8_t v = rng.random8();
        if (v < 64) ++low;
        if (v >= 192) ++high;
    }
    CHECK(low > 200);
    CHECK(high > 200);
}

TEST_CASE("hash_unit is a pure function onto [0,1]") {
    for (uint32_t index = 0; index < 20; ++index) {
        for (uint64_t phase = 0; phase < 20; ++phase) {
            const float v = hash_unit(5, index, phase);
            CHECK(v >= 0.0f);
            CHECK(v <= 1.0f);
            CHECK_EQ(hash_unit(5, index, phase), v);
        }
    }
    CHECK(hash_unit(5, 3, 0) != hash_unit(6, 3, 0));
    // The upper half of a 64-bit phase still matters.
    CHECK(hash_unit(5, 3, 1) != hash_unit(5, 3, (uint64_t(1) << 32) | 1));
}
