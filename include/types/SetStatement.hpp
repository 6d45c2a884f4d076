#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <string>
#include <defs.h>


struct SetStatement : Instruction {
    enum Kind {
        FromValue, // t-value
        FromFormat, // t-valuef
        Merge, // t-set="{...}"
        FromContent, // the element's content, as a ContentValue
        Empty // no value and no content
    } kind = Empty;

    std::string name;
    std::shared_ptr<Expression> value;
    std::shared_ptr<FormatString> format;
    std::string block; // FromContent

    void run(BlockRunner* runner);
};
