#pragma once
#include <instruction.hpp>
#include <evals/evals.hpp>
#include <memory>
#include <string>
#include <defs.h>


struct LoopState { // one running t-foreach. Items are produced one pass at a time, never all up front
    enum Source {
        Count, // 0 .. size - 1
        Items, // the elements of a list or tuple, read live
        Pairs, // the (key, value) pairs of a dict, read live
        Characters // a string, split once
    } source = Count;

    std::string as;
    Value collection; // what Items and Pairs read from
    Sequence characters;
    int64_t size = 0; // as it was when the loop started
    int64_t index = -1;
    std::shared_ptr<Mapping> outer; // the bindings around the loop. never written to

    bool advance(BlockRunner* runner); // point the runner at fresh bindings for the next item. false when there's none left
};


struct ForLoop : Instruction {
    std::shared_ptr<Expression> iterable; // NULL when the loop count was a literal
    int64_t count = 0;
    std::string as;
    Code body;

    ~ForLoop();

    void run(BlockRunner* runner);
};
