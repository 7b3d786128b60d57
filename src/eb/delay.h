#pragma once

/// @file eb/delay.h
/// Blocking frame delay used by the Controller between frames.

#include <cstdint>

#ifdef EASYBLINK_TESTING
#include <functional>
#endif

namespace eb {

/// Block the calling thread for the given number of milliseconds.
/// A delay of 0 returns immediately.
void delay(uint32_t ms);

#ifdef EASYBLINK_TESTING
using delay_handler_t = std::function<void(uint32_t)>;

/// Replace the real sleep (for fast, deterministic tests).
void inject_delay_handler(const delay_handler_t& handler);
void clear_delay_handler();
#endif

} // namespace eb
