// Session holds the state of one render: the engine it runs on, the options and root bindings it was started with, and the templates
// it already resolved. Sessions are cheap; make one per render (per thread). Nested renders forced by content values share it, and
// with it the stack depth budget.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <options.hpp>
#include <map>
#include <memory>
#include <string>


struct Session {
    Engine* engine;
    RenderOptions options;
    std::shared_ptr<Mapping> values; // the bindings the first frame runs on
    std::shared_ptr<Mapping> rootValues; // a copy taken before anything ran: what Root scope calls start from
    std::map<std::string, std::shared_ptr<const CompiledTemplate>> loaded; // templates already resolved in this render
    size_t depth = 0; // frames alive, across every stack of this render

    Session(Engine* engine, const Mapping& values, RenderOptions options);

    std::shared_ptr<const CompiledTemplate> compile(const std::string& ref, const RenderOptions& options);

    std::string render(std::shared_ptr<CallParameters> params); // run a render stack to completion
};
