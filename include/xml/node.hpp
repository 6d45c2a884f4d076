// A small XML tree with lxml's shape: text is what comes before an element's first child, tail is what comes after an element's close tag.
// Templates are compiled from a private deep copy of the tree, since compiling pops attributes as directives get consumed.
#pragma once
#include <string>
#include <vector>
#include <utility>
#include <defs.h>


struct XmlAttribute {
    std::string name;
    std::string value;
};


typedef std::vector<std::pair<std::string, std::string>> Namespaces; // prefix -> uri; the default namespace has an empty prefix


struct XmlNode {
    enum Type {
        Element,
        Comment,
        ProcessingInstruction
    } type;

    std::string tail;
    XmlElement* parent = NULL;
    bool detached = false; // removed from the parent, but still owned by it so an iteration over the children can finish

    XmlNode(Type t) : type(t) {}

    virtual ~XmlNode() {}

    virtual XmlNode* clone() const = 0; // deep copy. ALLOCATES!

    virtual std::string serialize() const = 0;

    XmlNode* getnext(); // the next sibling still attached, or NULL
};


struct XmlComment : XmlNode {
    std::string text;

    XmlComment(std::string t);

    XmlNode* clone() const;

    std::string serialize() const;
};


struct XmlPI : XmlNode {
    std::string target;
    std::string text;

    XmlPI(std::string tg, std::string t);

    XmlNode* clone() const;

    std::string serialize() const;
};


struct XmlElement : XmlNode {
    std::string tag;
    std::string text;
    std::vector<XmlAttribute> attributes; // source order
    Namespaces nsdecls; // namespaces declared on this very element
    std::vector<XmlNode*> children;

    XmlElement(std::string t);

    ~XmlElement();

    XmlNode* clone() const;

    XmlElement* cloneElement() const;

    bool has(const std::string& name) const;

    std::string get(const std::string& name, const std::string& fallback = "") const;

    bool pop(const std::string& name, std::string& out); // remove an attribute, handing back its value. false if there wasn't one

    void set(const std::string& name, const std::string& value); // replaces in place, or appends

    void remove(const std::string& name);

    std::vector<std::string> attributeNames() const;

    void append(XmlNode* child); // takes ownership

    void detach(XmlNode* child); // see XmlNode::detached

    size_t elementCount() const; // attached element children

    Namespaces nsmap() const; // every namespace in scope here, outermost first

    std::string path() const; // /t/div[2]/span, like lxml's getpath

    std::string snippet() const; // just the start tag with attributes, self-closed: <div t-if="x"/>

    XmlElement* findNamed(const std::string& attribute); // depth-first, self included: the first element carrying attribute

    std::string serialize() const;
};
