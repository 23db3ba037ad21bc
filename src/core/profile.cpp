/**
 * @file profile.cpp
 * @brief Implementation of the scoped timers described in profile.hpp
 */

#include "playfield/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::instance() {
    static Profiler profiler;
    return profiler;
}

void Profiler::startSection(const std::string& name) {
    auto& self = instance();
    auto& data = self.sections[name];

    std::string const parent = self.open.empty() ? std::string() : self.open.back().name;
    if (data.parent_name != parent) {
        // Re-parent: drop from the previous parent's child list
        if (!data.parent_name.empty()) {
            auto& oldKids = self.sections[data.parent_name].children;
            oldKids.erase(std::remove(oldKids.begin(), oldKids.end(), name), oldKids.end());
        }
        data.parent_name = parent;
    }
    if (!parent.empty()) {
        auto& kids = self.sections[parent].children;
        if (std::find(kids.begin(), kids.end(), name) == kids.end()) {
            kids.push_back(name);
        }
    }

    self.open.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& self = instance();
    if (self.open.empty() || self.open.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") does not match the open section.\n";
        return;
    }

    Duration const elapsed = std::chrono::duration_cast<Duration>(Clock::now() - self.open.back().start);
    self.open.pop_back();

    auto& data = self.sections[name];
    data.total_time += elapsed;
    data.self_time  += elapsed;
    data.call_count += 1;
    data.max_time = std::max(data.max_time, elapsed);

    if (!data.parent_name.empty()) {
        self.sections[data.parent_name].self_time -= elapsed;
    }
}

const Profiler::ProfileData* Profiler::find(const std::string& name) {
    auto& self = instance();
    auto it = self.sections.find(name);
    return it == self.sections.end() ? nullptr : &it->second;
}

void Profiler::printStats() {
    const auto& self = instance();

    std::vector<std::string> roots;
    Duration total{0};
    for (const auto& [name, data] : self.sections) {
        if (data.parent_name.empty()) {
            roots.push_back(name);
            total += data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    std::cout << "\nProfiling Statistics:\n";
    for (size_t i = 0; i < roots.size(); ++i) {
        self.printNode(roots[i], "", i + 1 == roots.size(), total);
    }
}

void Profiler::printNode(const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration total) const
{
    const auto& pd = sections.at(name);

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (total.count() > 0) {
        totalPercent = 100.0 * static_cast<double>(pd.total_time.count()) / static_cast<double>(total.count());
        selfPercent  = 100.0 * static_cast<double>(pd.self_time.count()) / static_cast<double>(total.count());
    }
    auto const totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(pd.total_time).count();

    std::cout << prefix << (isLast ? "└── " : "├── ")
              << name << " [" << pd.call_count << " calls] "
              << totalMs << "ms (total: "
              << std::fixed << std::setprecision(2) << totalPercent << "%, "
              << "self: " << selfPercent << "%)\n";

    std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
    for (size_t i = 0; i < pd.children.size(); ++i) {
        printNode(pd.children[i], childPrefix, i + 1 == pd.children.size(), total);
    }
}

void Profiler::reset() {
    auto& self = instance();
    self.sections.clear();
    self.open.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
