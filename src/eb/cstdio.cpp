#include "eb/cstdio.h"

#include <cstdio>

namespace eb {

// Default log level is DEBUG (all logging enabled)
static uint8_t gLogLevel = LOG_LEVEL_DEBUG;

uint8_t getLogLevel() {
    return gLogLevel;
}

void setLogLevel(uint8_t level) {
    gLogLevel = level;
}

bool logEnabled(uint8_t level) {
    return gLogLevel != LOG_LEVEL_NONE && level <= gLogLevel;
}

#ifdef EASYBLINK_TESTING
// Lazy initialization to avoid global constructors
static print_handler_t& get_print_handler() {
    static print_handler_t handler;
    return handler;
}

static println_handler_t& get_println_handler() {
    static println_handler_t handler;
    return handler;
}

void inject_print_handler(const print_handler_t& handler) {
    get_print_handler() = handler;
}

void inject_println_handler(const println_handler_t& handler) {
    get_println_handler() = handler;
}

void clear_io_handlers() {
    get_print_handler() = print_handler_t();
    get_println_handler() = println_handler_t();
}
#endif

void print(const char* str) {
    if (!str) return;
    if (gLogLevel == LOG_LEVEL_NONE) return;
#ifdef EASYBLINK_TESTING
    if (get_print_handler()) {
        get_print_handler()(str);
        return;
    }
#endif
    std::fputs(str, stderr);
}

void println(const char* str) {
    if (!str) return;
    if (gLogLevel == LOG_LEVEL_NONE) return;
#ifdef EASYBLINK_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif
    std::fputs(str, stderr);
    std::fputc('\n', stderr);
}

} // namespace eb
