// Profiling of compiled templates: with the profile option on, every directive reports when it starts and when its output is done.
#pragma once
#include <defs.h>
#include <errors.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>


struct ProfileTracker {
    virtual ~ProfileTracker() {}

    virtual void enter(const std::string& directive, const PathXml& where) = 0;

    virtual void leave(const std::string& directive, const PathXml& where) = 0;
};


struct ProfileEntry {
    size_t count = 0;
    double seconds = 0;
};


struct CountingProfiler : ProfileTracker {
    std::map<std::string, ProfileEntry> entries; // "ref path directive"
    std::vector<std::chrono::steady_clock::time_point> started;

    void enter(const std::string& directive, const PathXml& where);

    void leave(const std::string& directive, const PathXml& where);

    void report(); // one PROFILE line per entry
};
