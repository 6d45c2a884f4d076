#include <xml/parser.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <cstdlib>


static bool isNameChar(char c) {
    return !(c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '/' || c == '>' || c == '=' || c == '<' || c == '"' || c == '\'' || c == EOF);
}


XmlParser::XmlParser(MapView data, std::string s) : origin(data), file(data), source(s) {}

void XmlParser::fail(std::string message) {
    throw CompileError(message + ", line " + std::to_string(line()) + " (" + source + ")", "XMLSyntaxError");
}

size_t XmlParser::line() {
    size_t ret = 1;
    size_t upto = file.offset() - origin.offset();
    for (size_t i = 0; i < upto; i ++) {
        if (origin[i] == '\n') {
            ret ++;
        }
    }
    return ret;
}

void XmlParser::skipMisc() {
    while (true) {
        file.trim();
        if (file.cmp("<?")) {
            file.consumeUntil("?>");
            file += 2;
        }
        else if (file.cmp("<!--")) {
            file.consumeUntil("-->");
            file += 3;
        }
        else if (file.cmp("<!DOCTYPE")) {
            int depth = 0; // an internal subset can hold its own <...> declarations
            while (file.len() > 0) {
                char c = ++file;
                if (c == '<') {
                    depth ++;
                }
                else if (c == '>') {
                    depth --;
                    if (depth == 0) {
                        break;
                    }
                }
            }
        }
        else {
            return;
        }
    }
}

std::string XmlParser::name() {
    std::string ret;
    while (file.len() > 0 && isNameChar(file[0])) {
        ret += ++file;
    }
    if (ret.size() == 0) {
        fail("StartTag: invalid element name");
    }
    return ret;
}

std::string XmlParser::decode(MapView raw, bool attribute) {
    std::string ret;
    while (raw.len() > 0) {
        char c = ++raw;
        if (c == '&') {
            MapView entity = raw.consume(';');
            if (raw.len() == 0) {
                fail("EntityRef: expecting ';'");
            }
            raw ++;
            std::string e = entity.toString();
            if (e == "amp") ret += '&';
            else if (e == "lt") ret += '<';
            else if (e == "gt") ret += '>';
            else if (e == "quot") ret += '"';
            else if (e == "apos") ret += '\'';
            else if (e.size() > 1 && e[0] == '#') {
                bool hex = e[1] == 'x' || e[1] == 'X';
                char* end = NULL;
                const char* digits = e.c_str() + (hex ? 2 : 1);
                unsigned long cp = strtoul(digits, &end, hex ? 16 : 10);
                if (*digits == 0 || *end != 0 || cp > 0x10FFFF) {
                    fail("CharRef: invalid xmlChar value");
                }
                appendUtf8(ret, (uint32_t)cp);
            }
            else {
                fail("Entity '" + e + "' not defined");
            }
        }
        else if (c == '\r') {
            if (raw[0] == '\n') {
                raw ++;
            }
            ret += attribute ? ' ' : '\n';
        }
        else if (attribute && (c == '\n' || c == '\t')) {
            ret += ' '; // attribute value normalization
        }
        else if (!attribute || c != '<') {
            ret += c;
        }
        else {
            fail("Unescaped '<' not allowed in attributes values");
        }
    }
    return ret;
}

XmlElement* XmlParser::element() {
    file ++; // <
    XmlElement* el = new XmlElement(name());
    try {
        while (true) {
            file.trim();
            if (file.len() == 0) {
                fail("Couldn't find end of Start Tag " + el -> tag);
            }
            if (file.cmp("/>")) {
                file += 2;
                return el;
            }
            if (file[0] == '>') {
                file ++;
                content(el);
                return el;
            }
            std::string attr = name();
            file.trim();
            if (file[0] != '=') {
                fail("Specification mandates value for attribute " + attr);
            }
            file ++;
            file.trim();
            char quote = file[0];
            if (quote != '"' && quote != '\'') {
                fail("AttValue: \" or ' expected");
            }
            file ++;
            MapView raw = file.consume(quote);
            if (file.len() == 0) {
                fail("AttValue: ' expected");
            }
            file ++;
            std::string value = decode(raw, true);
            if (attr == "xmlns") {
                el -> nsdecls.push_back({ "", value });
            }
            else if (startsWith(attr, "xmlns:")) {
                el -> nsdecls.push_back({ attr.substr(6), value });
            }
            else if (el -> has(attr)) {
                fail("Attribute " + attr + " redefined");
            }
            else {
                el -> attributes.push_back(XmlAttribute{ attr, value });
            }
        }
    }
    catch (...) {
        delete el;
        throw;
    }
}

void XmlParser::content(XmlElement* el) {
    auto addText = [el](const std::string& text) {
        if (el -> children.size() == 0) {
            el -> text += text;
        }
        else {
            el -> children.back() -> tail += text;
        }
    };
    while (true) {
        if (file.len() == 0) {
            fail("Premature end of data in tag " + el -> tag);
        }
        if (file.cmp("</")) {
            file += 2;
            std::string closing = name();
            if (closing != el -> tag) {
                fail("Opening and ending tag mismatch: " + el -> tag + " and " + closing);
            }
            file.trim();
            if (file[0] != '>') {
                fail("expected '>'");
            }
            file ++;
            return;
        }
        else if (file.cmp("<!--")) {
            file += 4;
            MapView text = file.consumeUntil("-->");
            if (file.len() == 0) {
                fail("Comment not terminated");
            }
            file += 3;
            el -> append(new XmlComment(text.toString()));
        }
        else if (file.cmp("<![CDATA[")) {
            file += 9;
            MapView text = file.consumeUntil("]]>");
            if (file.len() == 0) {
                fail("CData section not finished");
            }
            file += 3;
            addText(text.toString());
        }
        else if (file.cmp("<?")) {
            file += 2;
            std::string target = name();
            file.trim();
            MapView text = file.consumeUntil("?>");
            if (file.len() == 0) {
                fail("ParsePI: PI " + target + " never end");
            }
            file += 2;
            el -> append(new XmlPI(target, text.toString()));
        }
        else if (file[0] == '<') {
            el -> append(element());
        }
        else {
            MapView raw = file.consume('<');
            addText(decode(raw, false));
        }
    }
}

XmlElement* XmlParser::parse() {
    if (!file.isValid()) {
        fail("Document is empty");
    }
    if (file.cmp("\xEF\xBB\xBF")) {
        file += 3;
    }
    skipMisc();
    if (file.len() == 0 || file[0] != '<') {
        fail("Start tag expected, '<' not found");
    }
    XmlElement* root = element();
    skipMisc();
    if (file.len() > 0) {
        delete root;
        fail("Extra content at the end of the document");
    }
    return root;
}


XmlElement* parseXml(const std::string& data, std::string source) {
    return parseXml(MapView::fromString(data), source);
}

XmlElement* parseXml(MapView data, std::string source) {
    XmlParser parser(data, source);
    return parser.parse();
}
