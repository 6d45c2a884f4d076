// The directive compiler: walks a template's element tree (a private copy of it) and turns it into the blocks of a CompiledTemplate.
// Directives on one element are handled in the fixed order of the directive table (see directives.hpp); the handlers that wrap
// the rest of the element (if, foreach, groups) carry on down the table for it themselves.
#pragma once
#include <defs.h>
#include <template.hpp>
#include <options.hpp>
#include <errors.hpp>
#include <xml/node.hpp>
#include <memory>
#include <string>
#include <vector>


struct DirectiveHandler;


struct TemplateSource {
    const XmlElement* element = NULL; // not modified: the compiler works on a copy
    std::string ref;
    std::string refName;
    std::string document;
    std::string defName; // prefix of every block name
};


struct CodeBuffer { // instructions that don't have an owner yet
    Code code;

    CodeBuffer() {}

    CodeBuffer(const CodeBuffer&) = delete;

    ~CodeBuffer();

    void moveTo(Code& out);
};


struct TemplateCompiler {
    RenderOptions options;
    std::string ref;
    std::string refName;
    std::string defName;
    CompiledTemplate* target; // receives the blocks and diagnostics
    size_t nameCounter = 0;
    std::vector<std::string> textConcat; // literal text not yet turned into a PlainText
    Namespaces nsmap; // namespaces already declared by the output so far
    PathXml lastPath; // the element being compiled, for errors
    size_t* directiveCursor = NULL; // how far down the directive table the current element is

    std::string makeName(const std::string& prefix); // <def>_<prefix>_<n>

    void appendText(const std::string& text);

    std::string rstripText(); // strip "\n[ \t]*" off the pending text, returning what was stripped

    void flushText(Code& code, bool rstrip = false);

    void addBlock(const std::string& name, CodeBuffer& code);

    void warn(const std::string& message); // a diagnostic: logged and kept on the template

    bool isStaticNode(const XmlElement* el);

    void compileNode(XmlElement* el, Code& code);

    void compileStaticNode(XmlElement* el, Code& code);

    void compileDirectives(XmlElement* el, Code& code); // the rest of the directive table, for el

    void compileDirective(XmlElement* el, const DirectiveHandler* handler, Code& code);

    void compileDirective(XmlElement* el, const std::string& name, Code& code);

    void tagOpen(const std::string& tag, bool closes, Code& code); // "<tag", the pending attributes, then ">" or "/>"

    void tagClose(const std::string& tag, Code& code);
};


std::string localName(const std::string& tag); // svg:rect -> rect

std::shared_ptr<CompiledTemplate> compileTemplate(const TemplateSource& source, const RenderOptions& options); // throws CompileError

std::shared_ptr<CompiledTemplate> notFoundTemplate(const std::string& ref, const std::string& message, const RenderOptions& options);
