#pragma once
#include <instruction.hpp>
#include <string>
#include <defs.h>


struct PlainText : Instruction { // literal markup, joined at compile time
    std::string data;

    PlainText(std::string d);

    void run(BlockRunner* runner);
};
