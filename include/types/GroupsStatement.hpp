#pragma once
#include <instruction.hpp>
#include <string>
#include <defs.h>


struct GroupsStatement : Instruction { // the body only shows for users the AccessControl lets through
    std::string groups;
    Code body;

    ~GroupsStatement();

    void run(BlockRunner* runner);
};
