// The product of compiling one template: a set of named blocks plus the options it was compiled under.
// A CompiledTemplate is never modified once the compiler hands it over; the cache and any number of renders share it.
#pragma once
#include <defs.h>
#include <options.hpp>
#include <errors.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>


struct Block {
    std::string name;
    Code code;

    Block(std::string n) : name(n) {}

    Block(const Block&) = delete;

    ~Block();
};


struct CompiledTemplate {
    std::string ref; // template id, or whatever identifies an inline template
    std::string refName; // t-name or key
    std::string entry; // the block a plain call starts at
    std::map<std::string, Block*> blocks;
    RenderOptions options; // snapshot of the cache key options
    std::string document; // source xml, kept for profiling
    std::vector<std::string> diagnostics; // unknown directives and unused attributes
    std::shared_ptr<CompileError> failure; // compiling failed: every use rethrows this

    CompiledTemplate() {}

    CompiledTemplate(const CompiledTemplate&) = delete;

    ~CompiledTemplate();

    const Block* block(const std::string& name) const; // throws KeyError

    std::string displayName() const; // refName, or ref when there is none
};
