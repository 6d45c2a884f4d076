// What it takes to start running a block in a new stack frame. Produced by t-call, and wrapped by every ContentValue.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <errors.hpp>
#include <memory>
#include <string>


struct CallParameters {
    enum ScopeMode {
        Shared, // run on the caller's own bindings
        Copy, // on a copy of the caller's bindings
        Root // on a copy of the bindings the render started with
    } scope = Shared;

    Mapping context; // options applied to the callee (lang, ...)
    std::string ref; // template to compile, unless compiled is set
    std::string block; // empty for the template's entry block
    std::shared_ptr<const CompiledTemplate> compiled; // for blocks of a template that's already loaded
    std::shared_ptr<Mapping> values; // merged over the callee's bindings; may be NULL
    std::string directive; // t-call, t-set, inner-content, render
    PathXml path; // the calling element

    std::string describe() const;
};
