#pragma once
#include <instruction.hpp>
#include <string>
#include <defs.h>


struct TagAttributes : Instruction { // writes out (and consumes) the pending attributes, between "<tag" and ">"
    std::string tag;

    TagAttributes(std::string t) : tag(t) {}

    void run(BlockRunner* runner);
};


void sanitizeAttributes(Mapping& attrs); // blank out url attributes carrying javascript:

std::string renderAttributes(const Mapping& attrs); // ' name="value"' for every value worth writing
