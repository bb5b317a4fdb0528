#pragma once

// Brickforge Profiler Abstraction
// When BRICKFORGE_PROFILING_ENABLED is defined, these map to Tracy.
// Otherwise, they compile to nothing.

#ifdef BRICKFORGE_PROFILING_ENABLED
#include <tracy/Tracy.hpp>

#define BRICKFORGE_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define BRICKFORGE_PLOT(name, val) TracyPlot(name, val)

#else
#define BRICKFORGE_ZONE_SCOPED_N(name)
#define BRICKFORGE_PLOT(name, val)
#endif
