// Template documents are small and trusted to be well formed; the parser is a straight scan over a MapView.
// Malformed input throws a CompileError of kind XMLSyntaxError that names the line.
#pragma once
#include <mapview.hpp>
#include <xml/node.hpp>
#include <string>


struct XmlParser {
    MapView origin; // the whole document, kept for line numbers
    MapView file; // what's left to parse
    std::string source; // filename or "<string>"

    XmlParser(MapView data, std::string source);

    XmlElement* parse(); // ALLOCATES! the caller owns the root

private:
    [[noreturn]] void fail(std::string message);

    size_t line();

    void skipMisc(); // whitespace, comments, processing instructions, doctype

    std::string name();

    std::string decode(MapView raw, bool attribute);

    XmlElement* element();

    void content(XmlElement* el);
};


XmlElement* parseXml(const std::string& data, std::string source = "<string>"); // ALLOCATES!

XmlElement* parseXml(MapView data, std::string source); // ALLOCATES!
