#pragma once

#include "inverse_core/config.hpp"

#if INVERSE_CORE_ENABLE_DEBUG
#include <cstdio>
#define INVERSE_CORE_DBG(...) std::fprintf(stderr, __VA_ARGS__)
#else
#define INVERSE_CORE_DBG(...) \
		do {                     \
		} while (0)
#endif
