#pragma once

#include "eb/dbg.h"

#ifndef EB_ERROR
// Supports both string literals and stream-style formatting with <<
#define EB_ERROR(X) EB_LOG_AT(eb::LOG_LEVEL_ERROR, "ERROR: ", X)
#define EB_ERROR_IF(COND, MSG) do { if (COND) EB_ERROR(MSG); } while (0)
#endif
