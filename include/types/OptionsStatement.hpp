#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <defs.h>


struct OptionsStatement : Instruction { // t-options and t-options-*, for the output or call on the same element
    std::shared_ptr<Expression> options; // NULL without t-options
    std::vector<std::pair<std::string, std::shared_ptr<Expression>>> entries;

    void run(BlockRunner* runner);
};
