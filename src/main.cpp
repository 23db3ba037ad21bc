/**
 * @fileoverview main.cpp
 * @brief Entry point: runs the SimManager loop and prints run statistics on exit.
 */

#include "playfield/core/debug.hpp"
#include "playfield/core/profile.hpp"
#include "playfield/core/sim_manager.hpp"

int main() {
    {
        PROFILE_SCOPE("main");

        SimManager manager;
        if (!manager.init()) {
            return 1;
        }
        manager.run();
    }

    Profiling::Profiler::printStats();
    DebugStats::printCollisionStats();

    return 0;
}
