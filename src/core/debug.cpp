#include "playfield/core/debug.hpp"

// Initialize static members
uint64_t DebugStats::sweep_count = 0;
uint64_t DebugStats::sweep_hits = 0;
uint64_t DebugStats::rest_queries = 0;
uint64_t DebugStats::rest_misses = 0;
uint64_t DebugStats::skipped_steps = 0;
