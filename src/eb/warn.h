#pragma once

#include "eb/dbg.h"

#ifndef EB_WARN
#define EB_WARN(X) EB_LOG_AT(eb::LOG_LEVEL_WARN, "WARN: ", X)
#define EB_WARN_IF(COND, MSG) do { if (COND) EB_WARN(MSG); } while (0)
#endif

#ifndef EB_INFO
#define EB_INFO(X) EB_LOG_AT(eb::LOG_LEVEL_INFO, "INFO: ", X)
#endif
