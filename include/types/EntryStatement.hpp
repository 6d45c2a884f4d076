#pragma once
#include <instruction.hpp>
#include <string>
#include <defs.h>


struct EntryStatement : Instruction { // the whole of a template's entry block: default bindings, then the body
    std::string xmlid; // ref name
    std::string viewid; // ref
    std::string body; // block name

    void run(BlockRunner* runner);
};


struct NotFoundStatement : Instruction { // the whole of a template that could not be loaded
    std::string ref;
    std::string message;

    void run(BlockRunner* runner);
};
