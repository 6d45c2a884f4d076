#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <defs.h>


struct IfStatement : Instruction { // t-if; t-elif and t-else chains compile into orelse
    std::shared_ptr<Expression> condition;
    Code body;
    Code orelse;

    ~IfStatement();

    void run(BlockRunner* runner);
};
