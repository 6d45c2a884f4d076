#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <string>
#include <defs.h>


struct OutStatement : Instruction { // t-out, t-esc, t-raw and t-field
    enum Kind {
        Out,
        Esc,
        Raw, // marks the value safe
        Field // record.field through the FieldConverter
    } kind = Out;

    std::shared_ptr<Expression> expr; // Field: the record part
    std::string source; // as written
    std::string fieldName;
    std::string tag;
    bool slot = false; // t-out="0"
    bool widget = false; // t-options were given: goes through the FieldConverter's widget path
    Code display; // the tag around the value
    Code fallback; // the tag around the default content. empty when there's no default content
    Code forced; // the bare tag, for converters that force display

    ~OutStatement();

    void run(BlockRunner* runner);
};


struct EmitStatement : Instruction { // the value itself, inside OutStatement::display
    bool slot = false; // the "0" binding, unescaped, instead of the value being shown

    EmitStatement(bool s = false) : slot(s) {}

    void run(BlockRunner* runner);
};
