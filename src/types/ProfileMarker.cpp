#include <types/ProfileMarker.hpp>
#include <blockrunner.hpp>
#include <session.hpp>
#include <engine.hpp>


void ProfileMarker::run(BlockRunner* runner) {
    ProfileTracker* profiler = runner -> session -> engine -> profiler;
    if (leave) {
        profiler -> leave(directive, where);
    }
    else {
        profiler -> enter(directive, where);
    }
}
