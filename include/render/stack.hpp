// The render stack machine. Every frame runs one block; calls to other templates (and content values being shown) push frames
// instead of recursing, so the only limit on nesting is WEFT_MAX_STACK_DEPTH.
#pragma once
#include <defs.h>
#include <options.hpp>
#include <errors.hpp>
#include <memory>
#include <string>
#include <deque>


struct StackFrame {
    std::shared_ptr<CallParameters> params;
    std::shared_ptr<const CompiledTemplate> compiled;
    RenderOptions options;
    BlockRunner* runner = NULL; // owned
};


struct RenderStack {
    enum Step {
        Chunk, // text is waiting in chunk
        Entered, // a frame was pushed
        Left, // a frame was popped
        Done
    };

    Session* session;
    std::deque<StackFrame> frames; // deque: runners point at their frame's options
    std::shared_ptr<CallParameters> start; // the first frame, until the first step pushes it
    std::string chunk;

    RenderStack(Session* session, std::shared_ptr<CallParameters> params);

    RenderStack(const RenderStack&) = delete;

    ~RenderStack();

    Step step();

    std::string run();

    void run(WriteOutput& out);

    size_t depth() const { return frames.size(); }

private:
    Step advance();

    void push(std::shared_ptr<CallParameters> params);

    void pop();

    void annotate(TemplateError& error);
};
