#include "test.h"

#include "eb/cstdio.h"
#include "eb/dbg.h"
#include "eb/error.h"
#include "eb/warn.h"

using namespace eb;

namespace {

// Captures every log line and restores the log level and handlers on exit.
struct LogCapture {
    std::vector<std::string> lines;
    uint8_t previousLevel;

    explicit LogCapture(uint8_t level) : previousLevel(getLogLevel()) {
        setLogLevel(level);
        inject_println_handler([this](const char* s) { lines.push_back(s); });
    }
    ~LogCapture() {
        clear_io_handlers();
        setLogLevel(previousLevel);
    }
};

} // namespace

TEST_CASE("log macros tag their level and location") {
    LogCapture capture(LOG_LEVEL_DEBUG);
    EB_WARN("width=" << 3);
    EB_ERROR("bus " << "down");
    EB_INFO("hello");
    EB_DBG("frame " << 12);

    REQUIRE_EQ(capture.lines.size(), 4u);
    CHECK_EQ(capture.lines[0].rfind("WARN: ", 0), 0u);
    CHECK(capture.lines[0].find("log.cpp") != std::string::npos);
    CHECK(capture.lines[0].find("width=3") != std::string::npos);
    CHECK_EQ(capture.lines[1].rfind("ERROR: ", 0), 0u);
    CHECK(capture.lines[1].find("bus down") != std::string::npos);
    CHECK_EQ(capture.lines[2].rfind("INFO: ", 0), 0u);
    CHECK(capture.lines[3].find("frame 12") != std::string::npos);
}

#ifndef EASYBLINK_FORCE_DBG
#error "test builds must keep EB_DBG compiled in"
#endif

TEST_CASE("EB_DBG is live in test builds and obeys the log level") {
    LogCapture capture(LOG_LEVEL_DEBUG);
    EB_DBG("visible");
    setLogLevel(LOG_LEVEL_INFO);
    EB_DBG("hidden");
    REQUIRE_EQ(capture.lines.size(), 1u);
    CHECK(capture.lines[0].find("visible") != std::string::npos);
}

TEST_CASE("log level filters quieter messages") {
    LogCapture capture(LOG_LEVEL_WARN);
    EB_DBG("dropped");
    EB_INFO("dropped");
    EB_WARN("kept");
    EB_ERROR("kept");
    CHECK_EQ(capture.lines.size(), 2u);
}

TEST_CASE("ScopedLogDisable silences everything until it goes away") {
    LogCapture capture(LOG_LEVEL_DEBUG);
    {
        ScopedLogDisable guard;
        CHECK_EQ(getLogLevel(), LOG_LEVEL_NONE);
        EB_ERROR("dropped");
        println("dropped too");
    }
    CHECK_EQ(getLogLevel(), LOG_LEVEL_DEBUG);
    EB_ERROR("back");
    REQUIRE_EQ(capture.lines.size(), 1u);
    CHECK(capture.lines[0].find("back") != std::string::npos);
}

TEST_CASE("conditional log macros") {
    LogCapture capture(LOG_LEVEL_DEBUG);
    EB_WARN_IF(false, "no");
    EB_WARN_IF(true, "yes");
    EB_ERROR_IF(1 + 1 == 3, "no");
    CHECK_EQ(capture.lines.size(), 1u);
}

TEST_CASE("easyblink_file_offset") {
    CHECK_EQ(std::string(easyblink_file_offset("/home/pi/easyblink/src/eb/colorway.cpp")),
             "src/eb/colorway.cpp");
    CHECK_EQ(std::string(easyblink_file_offset("/tmp/tests/eb/log.cpp")), "log.cpp");
    CHECK_EQ(std::string(easyblink_file_offset("plain.cpp")), "plain.cpp");
}
