#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <string>
#include <vector>
#include <defs.h>


struct CallArgument {
    enum Kind {
        Expr, // name="expr"
        Format, // name.f="format"
        Spread // t-args
    } kind = Expr;

    std::string name;
    std::shared_ptr<Expression> expr;
    std::shared_ptr<FormatString> format;
};


struct CallStatement : Instruction { // t-call
    std::shared_ptr<FormatString> target; // NULL for a numeric id
    std::string ref; // the numeric id
    std::string contentBlock; // the body, handed over in "0". empty when there's no body
    std::vector<CallArgument> args;

    void run(BlockRunner* runner);
};
