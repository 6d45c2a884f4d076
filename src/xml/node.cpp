#include <xml/node.hpp>
#include <util.hpp>


static std::string escapeSnippetAttribute(const std::string& value) {
    std::string ret;
    for (char c : value) {
        switch (c) {
            case '&': ret += "&amp;"; break;
            case '<': ret += "&lt;"; break;
            case '>': ret += "&gt;"; break;
            case '"': ret += "&quot;"; break;
            case '\n': ret += "&#10;"; break;
            case '\t': ret += "&#9;"; break;
            case '\r': ret += "&#13;"; break;
            default: ret += c;
        }
    }
    return ret;
}


XmlNode* XmlNode::getnext() {
    if (parent == NULL) {
        return NULL;
    }
    bool found = false;
    for (XmlNode* sibling : parent -> children) {
        if (found && !sibling -> detached) {
            return sibling;
        }
        if (sibling == this) {
            found = true;
        }
    }
    return NULL;
}


XmlComment::XmlComment(std::string t) : XmlNode(Comment), text(t) {}

XmlNode* XmlComment::clone() const {
    XmlComment* ret = new XmlComment(text);
    ret -> tail = tail;
    return ret;
}

std::string XmlComment::serialize() const {
    return "<!--" + text + "-->" + escapeText(tail);
}


XmlPI::XmlPI(std::string tg, std::string t) : XmlNode(ProcessingInstruction), target(tg), text(t) {}

XmlNode* XmlPI::clone() const {
    XmlPI* ret = new XmlPI(target, text);
    ret -> tail = tail;
    return ret;
}

std::string XmlPI::serialize() const {
    return "<?" + target + (text.size() ? " " + text : "") + "?>" + escapeText(tail);
}


XmlElement::XmlElement(std::string t) : XmlNode(Element), tag(t) {}

XmlElement::~XmlElement() {
    for (XmlNode* child : children) {
        delete child;
    }
}

XmlNode* XmlElement::clone() const {
    return cloneElement();
}

XmlElement* XmlElement::cloneElement() const {
    XmlElement* ret = new XmlElement(tag);
    ret -> text = text;
    ret -> tail = tail;
    ret -> attributes = attributes;
    ret -> nsdecls = nsdecls;
    for (XmlNode* child : children) {
        if (!child -> detached) {
            ret -> append(child -> clone());
        }
    }
    return ret;
}

bool XmlElement::has(const std::string& name) const {
    for (const XmlAttribute& attr : attributes) {
        if (attr.name == name) {
            return true;
        }
    }
    return false;
}

std::string XmlElement::get(const std::string& name, const std::string& fallback) const {
    for (const XmlAttribute& attr : attributes) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return fallback;
}

bool XmlElement::pop(const std::string& name, std::string& out) {
    for (size_t i = 0; i < attributes.size(); i ++) {
        if (attributes[i].name == name) {
            out = attributes[i].value;
            attributes.erase(attributes.begin() + i);
            return true;
        }
    }
    return false;
}

void XmlElement::set(const std::string& name, const std::string& value) {
    for (XmlAttribute& attr : attributes) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    attributes.push_back(XmlAttribute{ name, value });
}

void XmlElement::remove(const std::string& name) {
    std::string dummy;
    pop(name, dummy);
}

std::vector<std::string> XmlElement::attributeNames() const {
    std::vector<std::string> ret;
    for (const XmlAttribute& attr : attributes) {
        ret.push_back(attr.name);
    }
    return ret;
}

void XmlElement::append(XmlNode* child) {
    child -> parent = this;
    children.push_back(child);
}

void XmlElement::detach(XmlNode* child) {
    child -> detached = true;
}

size_t XmlElement::elementCount() const {
    size_t ret = 0;
    for (XmlNode* child : children) {
        if (!child -> detached && child -> type == Element) {
            ret ++;
        }
    }
    return ret;
}

Namespaces XmlElement::nsmap() const {
    Namespaces ret;
    if (parent != NULL) {
        ret = parent -> nsmap();
    }
    for (auto& decl : nsdecls) {
        bool replaced = false;
        for (auto& existing : ret) {
            if (existing.first == decl.first) {
                existing.second = decl.second;
                replaced = true;
            }
        }
        if (!replaced) {
            ret.push_back(decl);
        }
    }
    return ret;
}

std::string XmlElement::path() const {
    if (parent == NULL) {
        return "/" + tag;
    }
    size_t sameTag = 0;
    size_t index = 0;
    for (XmlNode* sibling : parent -> children) {
        if (sibling -> detached || sibling -> type != Element) {
            continue;
        }
        if (((XmlElement*)sibling) -> tag == tag) {
            sameTag ++;
            if (sibling == this) {
                index = sameTag;
            }
        }
    }
    std::string ret = parent -> path() + "/" + tag;
    if (sameTag > 1) {
        ret += "[" + std::to_string(index) + "]";
    }
    return ret;
}

std::string XmlElement::snippet() const {
    std::string ret = "<" + tag;
    for (const XmlAttribute& attr : attributes) {
        ret += " " + attr.name + "=\"" + escapeSnippetAttribute(attr.value) + "\"";
    }
    return ret + "/>";
}

XmlElement* XmlElement::findNamed(const std::string& attribute) {
    if (has(attribute)) {
        return this;
    }
    for (XmlNode* child : children) {
        if (!child -> detached && child -> type == Element) {
            XmlElement* found = ((XmlElement*)child) -> findNamed(attribute);
            if (found != NULL) {
                return found;
            }
        }
    }
    return NULL;
}

std::string XmlElement::serialize() const {
    std::string ret = "<" + tag;
    for (auto& decl : nsdecls) {
        ret += decl.first.size() ? " xmlns:" + decl.first : " xmlns";
        ret += "=\"" + escapeSnippetAttribute(decl.second) + "\"";
    }
    for (const XmlAttribute& attr : attributes) {
        ret += " " + attr.name + "=\"" + escapeSnippetAttribute(attr.value) + "\"";
    }
    bool empty = text.size() == 0;
    for (XmlNode* child : children) {
        if (!child -> detached) {
            empty = false;
        }
    }
    if (empty) {
        ret += "/>";
    }
    else {
        ret += ">" + escapeText(text);
        for (XmlNode* child : children) {
            if (!child -> detached) {
                ret += child -> serialize();
            }
        }
        ret += "</" + tag + ">";
    }
    return ret + escapeText(tail);
}
