// Template storage. The engine asks a TemplateLoader for the resolved element of a reference; the loader owns the element
// and keeps it alive for as long as it is registered (the compiler works on its own copy).
#pragma once
#include <defs.h>
#include <fileman.hpp>
#include <xml/node.hpp>
#include <map>
#include <string>
#include <vector>


struct LoadedTemplate {
    const XmlElement* element = NULL;
    std::string document; // the whole source document, as text
    std::string id; // numeric id, as a string
    std::string key; // the t-name
};


struct TemplateLoader {
    virtual ~TemplateLoader() {}

    virtual LoadedTemplate load(const std::string& ref) = 0; // by id (all digits) or by t-name. throws TemplateNotFound
};


struct MemoryLoader : TemplateLoader { // templates registered as xml text
    std::vector<XmlElement*> documents; // owned roots
    std::map<std::string, LoadedTemplate> byName;
    std::map<std::string, LoadedTemplate> byId;
    int nextId = 1;

    MemoryLoader() {}

    MemoryLoader(const MemoryLoader&) = delete;

    ~MemoryLoader();

    std::vector<std::string> add(const std::string& xml, const std::string& source = "<string>"); // returns the names registered. throws CompileError

    void clear();

    LoadedTemplate load(const std::string& ref);

private:
    void index(XmlElement* el, const std::string& document, const std::string& source, std::vector<std::string>& names);
};


struct DirectoryLoader : MemoryLoader { // every *.xml file under a directory
    FileMan files;

    DirectoryLoader(std::string dir);

    void reload(); // forget everything and read the directory again
};
