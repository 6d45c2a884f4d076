#include <collaborators/profiler.hpp>
#include <cstdio>


static std::string entryKey(const std::string& directive, const PathXml& where) {
    return where.ref + " " + where.path + " " + directive;
}


void CountingProfiler::enter(const std::string& directive, const PathXml& where) {
    started.push_back(std::chrono::steady_clock::now());
}

void CountingProfiler::leave(const std::string& directive, const PathXml& where) {
    if (started.size() == 0) {
        printf(WARNING "Profiler left %s without entering it\n", directive.c_str());
        return;
    }
    std::chrono::duration<double> spent = std::chrono::steady_clock::now() - started.back();
    started.pop_back();
    ProfileEntry& entry = entries[entryKey(directive, where)];
    entry.count ++;
    entry.seconds += spent.count();
}

void CountingProfiler::report() {
    for (auto& entry : entries) {
        printf(PROFILE "%s: %zu runs, %.3fms\n", entry.first.c_str(), entry.second.count, entry.second.seconds * 1000);
    }
}
