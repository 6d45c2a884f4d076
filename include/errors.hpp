// Everything that goes wrong while compiling or rendering a template is thrown as a TemplateError.
// The render stack annotates a TemplateError exactly once, with the template, the element being run and the chain of callers.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>


struct PathXml { // where an instruction came from: template reference, element path, element snippet
    std::string ref;
    std::string path;
    std::string xml;

    bool empty() const;

    bool operator==(const PathXml& other) const;

    std::string toString() const; // ('ref', 'path', 'xml')
};


struct ErrorInfo {
    std::string error; // "Kind: message"
    std::string templateName; // empty means unknown
    std::string ref;
    std::string path;
    std::string element;
    std::vector<PathXml> source; // outermost caller first

    std::string toString() const;
};


struct TemplateError : std::runtime_error {
    std::string kind; // the error class reported to template authors: KeyError, SyntaxError, ...
    ErrorInfo info;
    bool annotated = false;

    TemplateError(std::string kind, std::string message);

    std::string message() const;

    std::string describe() const; // multi-line report; just "Kind: message" until annotated
};


struct CompileError : TemplateError { // the template (or an expression in it) is malformed. Never retried.
    CompileError(std::string message, std::string kind = "SyntaxError");
};


struct TemplateNotFound : TemplateError {
    TemplateNotFound(std::string message);
};


struct EvalError : TemplateError { // an expression failed while rendering: KeyError, TypeError, ZeroDivisionError...
    EvalError(std::string kind, std::string message);
};


struct RenderError : TemplateError { // anything else that broke inside a compiled block (a collaborator failing, usually)
    RenderError(std::string kind, std::string message);
};


struct RecursionError : TemplateError {
    RecursionError();
};


struct StorageConflictError : std::runtime_error { // transient; never annotated, the caller is expected to retry the whole render
    StorageConflictError(std::string message);
};
