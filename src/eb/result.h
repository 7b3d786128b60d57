#pragma once

/// @file result.h
/// @brief Result<T> alias over eb::expected with the strip error codes.

#include <cstdint>

#include "eb/expected.h"

namespace eb {

/// @brief Error codes reported by the animation core and its transports
enum class StripError : uint8_t {
    OK,               ///< No error (not typically used)
    CONFIG,           ///< Invalid static configuration (empty strip, bad stops, zero period)
    TRANSPORT_INIT,   ///< Hardware transport could not be opened
    TRANSPORT_WRITE,  ///< A frame could not be committed to the hardware
};

/// @brief Stable upper-case name of an error code, for logging
const char* errorName(StripError err);

/// @brief Rust-style alias used throughout EasyBlink
template<typename T, typename E = StripError>
using Result = expected<T, E>;

} // namespace eb
