#pragma once

#include <cstdint>

#ifdef EASYBLINK_TESTING
#include <functional>
#endif

namespace eb {

// =============================================================================
// Global Log Level Control
// =============================================================================
// Runtime-configurable log level. Affects EB_DBG, EB_INFO, EB_WARN and
// EB_ERROR since they all flow through eb::println.

/// Log level constants - higher values include more output
enum LogLevel : uint8_t {
    LOG_LEVEL_NONE  = 0,  ///< No logging (completely silent)
    LOG_LEVEL_ERROR = 1,  ///< Only errors
    LOG_LEVEL_WARN  = 2,  ///< Errors and warnings
    LOG_LEVEL_INFO  = 3,  ///< Errors, warnings, and info
    LOG_LEVEL_DEBUG = 4,  ///< All logging including debug (default)
};

/// Get the current global log level
uint8_t getLogLevel();

/// Set the global log level
/// @note Setting to LOG_LEVEL_NONE disables all logging output
void setLogLevel(uint8_t level);

/// True when a message of the given level would currently be printed.
bool logEnabled(uint8_t level);

/// @brief RAII class to temporarily disable all logging output
///
/// @code
/// {
///     eb::ScopedLogDisable guard;  // Suppress logging
///     // ... noisy code ...
/// }  // Logging restored when guard goes out of scope
/// @endcode
class ScopedLogDisable {
public:
    ScopedLogDisable() : mPreviousLevel(getLogLevel()) {
        setLogLevel(LOG_LEVEL_NONE);
    }

    ~ScopedLogDisable() {
        setLogLevel(mPreviousLevel);
    }

    ScopedLogDisable(const ScopedLogDisable&) = delete;
    ScopedLogDisable& operator=(const ScopedLogDisable&) = delete;

private:
    uint8_t mPreviousLevel;
};

// =============================================================================
// Low-Level Print Functions
// =============================================================================

// Print a string without newline
void print(const char* str);

// Print a string with newline
void println(const char* str);

#ifdef EASYBLINK_TESTING
using print_handler_t = std::function<void(const char*)>;
using println_handler_t = std::function<void(const char*)>;

// Inject function handlers for testing
void inject_print_handler(const print_handler_t& handler);
void inject_println_handler(const println_handler_t& handler);

// Clear all injected handlers (restores default behavior)
void clear_io_handlers();
#endif

} // namespace eb
