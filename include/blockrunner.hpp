// BlockRunner walks a compiled block one instruction at a time, keeping its position on an explicit cursor stack: entering an
// if body or a loop pass pushes a cursor, finishing one pops it. Output comes out as Items, one at a time, to the render stack.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <errors.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>


struct LoopState;


struct Item {
    enum Kind {
        Text,
        Call, // run another template (or block) in a new frame
        Content // a ContentValue to render in place
    } kind = Text;

    std::string text;
    std::shared_ptr<CallParameters> call;
    std::shared_ptr<ContentValue> content;
};


struct Cursor {
    const Code* code;
    size_t pc = 0;
    std::shared_ptr<LoopState> loop; // when set, the code runs again for every remaining item
    std::shared_ptr<Mapping> restore; // bindings to go back to once the cursor is done
};


struct BlockRunner {
    Session* session;
    std::shared_ptr<const CompiledTemplate> compiled;
    const RenderOptions* options;
    std::shared_ptr<Mapping> values;
    std::shared_ptr<Mapping> pendingAttrs; // built by t-att & co, consumed by the next opening tag
    std::shared_ptr<Mapping> pendingOptions; // built by t-options, consumed by the next output or call
    Value current; // the value an output directive is in the middle of showing
    PathXml lastPath; // the last element that ran, for errors
    std::vector<Cursor> cursors;
    std::deque<Item> pending;

    BlockRunner(Session* session, std::shared_ptr<const CompiledTemplate> compiled, const Code& code, std::shared_ptr<Mapping> values, const RenderOptions* options);

    bool next(Item& out); // false once the block is done

    void enter(const Code& code); // run code before carrying on with the current cursor

    void loop(const Code& code, std::shared_ptr<LoopState> state); // run code once per loop item, on per-item bindings

    void emit(const std::string& text);

    void emit(std::shared_ptr<CallParameters> call);

    void emitValue(const Value& v, bool escape); // content values are handed over, everything else becomes text

    std::shared_ptr<Mapping> takeOptions(); // pendingOptions, or an empty mapping; pendingOptions is cleared either way
};
