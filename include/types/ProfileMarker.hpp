#pragma once
#include <instruction.hpp>
#include <string>
#include <defs.h>


struct ProfileMarker : Instruction { // brackets the code of one directive when profiling
    std::string directive;
    bool leave;

    ProfileMarker(std::string d, bool l, PathXml at) : directive(d), leave(l) { where = at; }

    void run(BlockRunner* runner);
};
