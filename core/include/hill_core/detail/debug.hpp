#pragma once

#include "hill_core/config.hpp"

#if HILL_CORE_ENABLE_DEBUG
#include <debug.h>
#define HILL_DBG(...) dbg_printf(__VA_ARGS__)
#else
#define HILL_DBG(...) \
		do {          \
		} while (0)
#endif
