// Compiled templates are lists of Instructions. Running an instruction either produces output on the block runner or hands it more
// code to run (the body of an if, one pass of a loop): control flow never recurses on the native stack.
#pragma once
#include <defs.h>
#include <errors.hpp>


struct Instruction {
    PathXml where; // the element this was compiled from, for error reports. empty for plain text

    virtual ~Instruction() {}

    virtual void run(BlockRunner* runner) = 0;
};


void deleteCode(Code& code); // delete every instruction and empty the list
