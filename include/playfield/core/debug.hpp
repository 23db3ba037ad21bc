#pragma once

#include <cstdint>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef PLAYFIELD_ENABLE_DEBUG
#define PLAYFIELD_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (PLAYFIELD_ENABLE_DEBUG && (level) <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Collects collision query counters over a run
class DebugStats {
public:
    static void reset() {
        sweep_count = 0;
        sweep_hits = 0;
        rest_queries = 0;
        rest_misses = 0;
        skipped_steps = 0;
    }

    static void recordSweep(bool hit) {
        sweep_count++;
        if (hit) {
            sweep_hits++;
        }
    }

    static void recordRestQuery(bool found) {
        rest_queries++;
        if (!found) {
            rest_misses++;
        }
    }

    static void recordSkippedStep() {
        skipped_steps++;
    }

    static uint64_t sweeps() { return sweep_count; }
    static uint64_t hits() { return sweep_hits; }
    static uint64_t skippedSteps() { return skipped_steps; }

    static void printCollisionStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Collision stats:\n"
            "  Sweeps: " << sweep_count << " (" << sweep_hits << " hits)\n"
            "  Rest queries: " << rest_queries << " (" << rest_misses << " without normal)\n"
            "  Skipped body steps: " << skipped_steps << "\n"
        );
    }

private:
    static uint64_t sweep_count;
    static uint64_t sweep_hits;
    static uint64_t rest_queries;
    static uint64_t rest_misses;
    static uint64_t skipped_steps;
};
