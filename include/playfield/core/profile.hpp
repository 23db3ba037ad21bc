/**
 * @file profile.hpp
 * @brief Scoped timers for the per-tick systems
 *
 * Sections nest: a section started while another is open becomes its child,
 * and its time is subtracted from the parent's self time. printStats() dumps
 * the tree with call counts and share of the total root time.
 *
 * @code
 * void PolygonBodySystem::update(entt::registry& registry, double dt) {
 *     PROFILE_SCOPE("PolygonBodySystem");
 *     ...
 * }
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing registry (singleton, single-threaded use)
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};
        uint64_t call_count{0};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Print the section tree to stdout.
     */
    static void printStats();

    static void reset();

    /**
     * @brief Recorded data for a section, or nullptr if it never ran.
     */
    static const ProfileData* find(const std::string& name);

private:
    struct OpenSection {
        std::string name;
        Clock::time_point start;
    };

    std::unordered_map<std::string, ProfileData> sections;
    std::vector<OpenSection> open;

    Profiler() = default;
    static Profiler& instance();

    void printNode(const std::string& name, const std::string& prefix, bool isLast, Duration total) const;
};

/**
 * @brief RAII guard that times the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PLAYFIELD_PROFILE_CONCAT_INNER(a, b) a##b
#define PLAYFIELD_PROFILE_CONCAT(a, b) PLAYFIELD_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PLAYFIELD_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
