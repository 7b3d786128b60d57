#include "eb/delay.h"

#include <chrono>
#include <thread>

namespace eb {

#ifdef EASYBLINK_TESTING
static delay_handler_t& get_delay_handler() {
    static delay_handler_t handler;
    return handler;
}

void inject_delay_handler(const delay_handler_t& handler) {
    get_delay_handler() = handler;
}

void clear_delay_handler() {
    get_delay_handler() = delay_handler_t();
}
#endif

void delay(uint32_t ms) {
#ifdef EASYBLINK_TESTING
    // Check for test override first (for fast testing)
    if (get_delay_handler()) {
        get_delay_handler()(ms);
        return;
    }
#endif
    if (ms == 0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace eb
