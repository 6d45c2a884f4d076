#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <string>
#include <vector>
#include <defs.h>


struct AttributeEntry {
    enum Kind {
        Static,
        Format, // t-attf-name
        Expr, // t-att-name
        Spread // t-att: a dict, a (name, value) pair or a list of pairs
    } kind = Static;

    std::string name;
    std::string value; // Static
    std::shared_ptr<Expression> expr;
    std::shared_ptr<FormatString> format;
};


struct AttsStatement : Instruction { // builds the attributes the next opening tag writes out
    std::vector<AttributeEntry> entries;

    void run(BlockRunner* runner);
};


void mergePairs(Mapping& target, const Value& pairs); // the t-att and t-args forms
