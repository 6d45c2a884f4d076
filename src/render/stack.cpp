#include <render/stack.hpp>
#include <render/callparams.hpp>
#include <render/content.hpp>
#include <blockrunner.hpp>
#include <template.hpp>
#include <session.hpp>
#include <writer.hpp>


RenderStack::RenderStack(Session* s, std::shared_ptr<CallParameters> params) : session(s), start(params) {}

RenderStack::~RenderStack() {
    while (frames.size() > 0) {
        pop();
    }
}

void RenderStack::push(std::shared_ptr<CallParameters> params) {
    if (session -> depth >= WEFT_MAX_STACK_DEPTH) {
        throw RecursionError();
    }
    StackFrame frame;
    frame.params = params;
    StackFrame* parent = frames.size() > 0 ? &frames.back() : NULL;
    frame.options = (parent != NULL ? parent -> options : session -> options).overlay(params -> context);
    frame.compiled = params -> compiled != NULL ? params -> compiled : session -> compile(params -> ref, frame.options);
    const Block* block = frame.compiled -> block(params -> block.size() > 0 ? params -> block : frame.compiled -> entry);

    std::shared_ptr<Mapping> values = parent != NULL ? parent -> runner -> values : session -> values;
    if (params -> scope == CallParameters::Root) {
        values = std::make_shared<Mapping>(*session -> rootValues);
    }
    else if (params -> scope == CallParameters::Copy) {
        values = std::make_shared<Mapping>(*values);
    }
    if (params -> values != NULL) {
        values -> update(*params -> values);
    }

    frames.push_back(frame);
    frames.back().runner = new BlockRunner(session, frame.compiled, block -> code, values, &frames.back().options);
    session -> depth ++;
}

void RenderStack::pop() {
    delete frames.back().runner;
    frames.pop_back();
    session -> depth --;
}

RenderStack::Step RenderStack::advance() {
    if (start != NULL) {
        push(start);
        start = NULL;
        return Entered;
    }
    if (frames.size() == 0) {
        return Done;
    }
    Item item;
    if (!frames.back().runner -> next(item)) {
        pop();
        return Left;
    }
    if (item.kind == Item::Text) {
        chunk = item.text;
        return Chunk;
    }
    if (item.kind == Item::Content) {
        if (item.content -> done) {
            chunk = item.content -> rendered;
            return Chunk;
        }
        push(item.content -> params);
        return Entered;
    }
    push(item.call);
    return Entered;
}

RenderStack::Step RenderStack::step() {
    try {
        return advance();
    }
    catch (StorageConflictError&) {
        throw;
    }
    catch (TemplateError& error) {
        annotate(error);
        throw;
    }
    catch (std::exception& e) {
        RenderError error("RuntimeError", e.what());
        annotate(error);
        throw error;
    }
}

void RenderStack::annotate(TemplateError& error) {
    std::vector<PathXml> chain;
    for (StackFrame& frame : frames) {
        if (!frame.params -> path.empty()) {
            chain.push_back(frame.params -> path);
        }
    }
    if (error.annotated) { // thrown by a nested render: it knows where it broke, we only know how we got there
        error.info.source.insert(error.info.source.begin(), chain.begin(), chain.end());
        return;
    }
    error.annotated = true;
    error.info.error = error.kind + ": " + error.message();
    error.info.source = chain;
    if (error.info.path.size() > 0) { // the compiler already said where
        return;
    }
    if (frames.size() == 0) {
        if (start != NULL) {
            error.info.ref = start -> ref;
        }
        return;
    }
    StackFrame& top = frames.back();
    error.info.templateName = top.compiled -> displayName();
    error.info.ref = top.compiled -> ref;
    const PathXml& at = top.runner -> lastPath;
    if (!at.empty()) {
        error.info.path = at.path;
        error.info.element = at.xml;
    }
}

std::string RenderStack::run() {
    std::string ret;
    Step s;
    while ((s = step()) != Done) {
        if (s == Chunk) {
            ret += chunk;
        }
    }
    return ret;
}

void RenderStack::run(WriteOutput& out) {
    Step s;
    while ((s = step()) != Done) {
        if (s == Chunk) {
            out.write(chunk);
        }
    }
}
