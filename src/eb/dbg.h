#pragma once

#include <sstream>

#include "eb/cstdio.h"

namespace eb {
// ".build/src/eb/dbg.h" -> "src/eb/dbg.h"
// "blah/blah/blah.h" -> "blah.h"
inline const char *easyblink_file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p; // Skip past "src/"
        }
        if (*p == '/') { // fallback to using last slash
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace eb

// Streams a log line at the given level: EB_LOG_AT(LOG_LEVEL_WARN, "x=" << x)
#define EB_LOG_AT(LEVEL, PREFIX, X)                                            \
    do {                                                                       \
        if (eb::logEnabled(LEVEL)) {                                           \
            std::ostringstream _eb_ss;                                         \
            _eb_ss << PREFIX << eb::easyblink_file_offset(__FILE__) << "("     \
                   << int(__LINE__) << "): " << X;                             \
            eb::println(_eb_ss.str().c_str());                                 \
        }                                                                      \
    } while (0)

// Debug lines are compiled in unless the build defines RELEASE.
#if !defined(RELEASE) || defined(EASYBLINK_TESTING)
#define EASYBLINK_FORCE_DBG 1
#endif

#ifndef EASYBLINK_FORCE_DBG
// No-op that still type-checks the << expression
#define _EASYBLINK_DBG(X) do { if (false) { std::ostringstream _eb_ss; _eb_ss << X; } } while (0)
#else
#define _EASYBLINK_DBG(X) EB_LOG_AT(eb::LOG_LEVEL_DEBUG, "", X)
#endif

#define EB_DBG(X) _EASYBLINK_DBG(X)
