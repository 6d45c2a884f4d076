#pragma once
#include <instruction.hpp>
#include <string>
#include <defs.h>


struct DebuggerStatement : Instruction { // t-debug, dev mode only
    std::string debugger;

    DebuggerStatement(std::string d) : debugger(d) {}

    void run(BlockRunner* runner);
};
