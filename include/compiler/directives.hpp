// One handler per directive, in the order directives on a single element are applied. The table is the only thing that decides
// that order; the order of the attributes in the source never matters.
#pragma once
#include <defs.h>
#include <xml/node.hpp>
#include <string>
#include <vector>


struct TemplateCompiler;


struct DirectiveHandler {
    std::string name; // "if", "call-assets"...

    DirectiveHandler(std::string n) : name(n) {}

    virtual ~DirectiveHandler() {}

    virtual bool applies(const XmlElement* el) const; // is t-<name> on the element?

    virtual void compile(TemplateCompiler& c, XmlElement* el, Code& code) const = 0;
};


const std::vector<const DirectiveHandler*>& directiveTable();

const DirectiveHandler* findDirective(const std::string& name); // NULL if there's none

bool isSpecialAttribute(const std::string& name); // t-translation, t-ignore and t-title are left alone
