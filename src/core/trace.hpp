#pragma once

#include <iostream>

// Debug tracing for rule registration, segmentation and caching - disabled for release.
// Build with -DBUILD_PHASES_DEBUG_TRACE to enable.
#ifdef BUILD_PHASES_DEBUG_TRACE
#define BUILD_PHASES_TRACE(msg) std::cerr << "[build_phases] " << msg << std::endl
#else
#define BUILD_PHASES_TRACE(msg)                                                                                        \
	do {                                                                                                               \
	} while (0)
#endif
