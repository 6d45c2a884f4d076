#include <compiler/compiler.hpp>
#include <compiler/directives.hpp>
#include <instruction.hpp>
#include <types/PlainText.hpp>
#include <types/TagAttributes.hpp>
#include <types/ProfileMarker.hpp>
#include <types/EntryStatement.hpp>
#include <util.hpp>
#include <cstdio>


CodeBuffer::~CodeBuffer() {
    deleteCode(code);
}

void CodeBuffer::moveTo(Code& out) {
    out.insert(out.end(), code.begin(), code.end());
    code.clear();
}


std::string localName(const std::string& tag) {
    size_t colon = tag.find(':');
    return colon == std::string::npos ? tag : tag.substr(colon + 1);
}


std::string TemplateCompiler::makeName(const std::string& prefix) {
    return defName + "_" + prefix + "_" + std::to_string(nameCounter ++);
}

void TemplateCompiler::appendText(const std::string& text) {
    textConcat.push_back(text);
}

std::string TemplateCompiler::rstripText() {
    if (textConcat.size() == 0) {
        return "";
    }
    return rstripNewline(textConcat.back());
}

void TemplateCompiler::flushText(Code& code, bool rstrip) {
    if (textConcat.size() == 0) {
        return;
    }
    if (rstrip) {
        rstripText();
    }
    std::string text;
    for (const std::string& chunk : textConcat) {
        text += chunk;
    }
    textConcat.clear();
    if (text.size() > 0) {
        code.push_back(new PlainText(text));
    }
}

void TemplateCompiler::addBlock(const std::string& name, CodeBuffer& code) {
    Block* block = new Block(name);
    target -> blocks[name] = block;
    code.moveTo(block -> code);
}

void TemplateCompiler::warn(const std::string& message) {
    printf(WARNING "%s\n", message.c_str());
    target -> diagnostics.push_back(message);
}

bool TemplateCompiler::isStaticNode(const XmlElement* el) {
    if (localName(el -> tag) == "t" || el -> has("groups")) {
        return false;
    }
    for (const XmlAttribute& attr : el -> attributes) {
        if (startsWith(attr.name, "t-") && attr.name != "t-tag-open" && attr.name != "t-inner-content") {
            return false;
        }
    }
    return true;
}

void TemplateCompiler::compileNode(XmlElement* el, Code& code) {
    if (el -> has("t-qweb-skip")) {
        return;
    }
    if (isStaticNode(el)) {
        compileStaticNode(el, code);
        return;
    }
    lastPath = PathXml{ ref, el -> path(), el -> snippet() }; // paths start at the template element, not its document

    if (localName(el -> tag) != "t") {
        el -> set("t-tag-open", el -> tag);
        if (!isVoidElement(el -> tag)) {
            el -> set("t-tag-close", el -> tag);
        }
    }
    if (!el -> has("t-out") && !el -> has("t-esc") && !el -> has("t-raw") && !el -> has("t-field")) {
        el -> set("t-inner-content", "True");
    }
    std::string callOptions;
    if (el -> pop("t-call-options", callOptions)) {
        el -> set("t-options", callOptions);
    }

    size_t cursor = 0;
    size_t* outer = directiveCursor;
    directiveCursor = &cursor;
    compileDirectives(el, code);
    directiveCursor = outer;
}

void TemplateCompiler::compileStaticNode(XmlElement* el, Code& code) {
    std::vector<std::pair<std::string, std::string>> attrib;
    for (auto& decl : el -> nsdecls) {
        bool known = false;
        for (auto& existing : nsmap) {
            if (existing == decl) {
                known = true;
            }
        }
        if (!known) {
            attrib.push_back({ decl.first.size() ? "xmlns:" + decl.first : "xmlns", decl.second });
        }
    }
    for (const XmlAttribute& attr : el -> attributes) {
        std::string name = attr.name;
        if (endsWith(name, ".translate")) {
            name = name.substr(0, name.size() - 10);
        }
        std::string value = attr.value;
        if (isUrlAttribute(name) && isMaliciousUrl(value)) {
            value = "";
        }
        attrib.push_back({ name, value });
    }

    bool isTag = localName(el -> tag) != "t";
    if (isTag) {
        std::string open = "<" + el -> tag;
        for (auto& attr : attrib) {
            open += " " + attr.first + "=\"" + escapeHtml(attr.second) + "\"";
        }
        appendText(open);
        appendText(isVoidElement(el -> tag) ? "/>" : ">");
    }
    el -> attributes.clear();
    compileDirective(el, "inner-content", code);
    if (isTag && !isVoidElement(el -> tag)) {
        appendText("</" + el -> tag + ">");
    }
}

void TemplateCompiler::compileDirectives(XmlElement* el, Code& code) {
    if (isStaticNode(el)) {
        el -> remove("t-tag-open");
        el -> remove("t-inner-content");
        el -> remove("t-tag-close");
        compileStaticNode(el, code);
        return;
    }

    const std::vector<const DirectiveHandler*>& table = directiveTable();
    while (*directiveCursor < table.size()) {
        const DirectiveHandler* handler = table[*directiveCursor];
        (*directiveCursor) ++;
        if (handler -> applies(el)) {
            compileDirective(el, handler, code);
        }
    }

    // directives that are only valid beside another one
    if (el -> has("t-value")) {
        throw CompileError("t-value must be on the same node of t-set");
    }
    if (el -> has("t-valuef")) {
        throw CompileError("t-valuef must be on the same node of t-set");
    }
    if (el -> has("t-consumed-options")) {
        throw CompileError("the t-options must be on the same tag as a directive that consumes it (for example: t-out, t-field, t-call)");
    }

    std::vector<std::string> remaining;
    for (const std::string& name : el -> attributeNames()) {
        if (!isSpecialAttribute(name)) {
            remaining.push_back(name);
        }
    }
    if (remaining.size() > 0) {
        std::string names;
        for (const std::string& name : remaining) {
            names += (names.size() ? ", " : "") + name;
            el -> remove(name); // reported once
        }
        warn("Unknown directives or unused attributes: " + names + " in " + (refName.size() ? refName : ref) + "\n\tat " + lastPath.path);
    }
}

void TemplateCompiler::compileDirective(XmlElement* el, const DirectiveHandler* handler, Code& code) {
    const std::string& name = handler -> name;
    if (!options.profile || name == "inner-content" || name == "tag-open" || name == "tag-close") {
        handler -> compile(*this, el, code);
        return;
    }
    PathXml at = lastPath;
    CodeBuffer inner;
    handler -> compile(*this, el, inner.code);
    if (inner.code.size() > 0) {
        code.push_back(new ProfileMarker(name, false, at));
        inner.moveTo(code);
        code.push_back(new ProfileMarker(name, true, at));
    }
}

void TemplateCompiler::compileDirective(XmlElement* el, const std::string& name, Code& code) {
    compileDirective(el, findDirective(name), code);
}

void TemplateCompiler::tagOpen(const std::string& tag, bool closes, Code& code) {
    if (tag.size() == 0) {
        return;
    }
    code.push_back(new PlainText("<" + tag));
    code.push_back(new TagAttributes(tag));
    code.push_back(new PlainText(closes ? ">" : "/>"));
}

void TemplateCompiler::tagClose(const std::string& tag, Code& code) {
    if (tag.size() > 0) {
        code.push_back(new PlainText("</" + tag + ">"));
    }
}


std::shared_ptr<CompiledTemplate> compileTemplate(const TemplateSource& source, const RenderOptions& options) {
    std::shared_ptr<CompiledTemplate> ret = std::make_shared<CompiledTemplate>();
    ret -> ref = source.ref;
    ret -> refName = source.refName;
    ret -> entry = source.defName;
    ret -> options = options;
    ret -> document = source.document;

    std::unique_ptr<XmlElement> el(source.element -> cloneElement());
    el -> nsdecls = source.element -> nsmap(); // the copy has lost its ancestors
    el -> remove("t-name");
    if (el -> text.size() > 0) {
        el -> text = collapseFirstNewlines(el -> text);
    }

    TemplateCompiler c;
    c.options = options;
    c.ref = source.ref;
    c.refName = source.refName;
    c.defName = source.defName;
    c.target = ret.get();

    try {
        CodeBuffer content;
        c.appendText("");
        c.compileNode(el.get(), content.code);
        c.flushText(content.code, true);
        c.addBlock(source.defName + "_content", content);
    }
    catch (CompileError& e) {
        if (e.info.path.size() == 0) {
            e.info.templateName = source.refName;
            e.info.ref = source.ref;
            e.info.path = c.lastPath.path;
            e.info.element = c.lastPath.xml;
        }
        throw;
    }

    int64_t id;
    if (isNumber(source.ref) && !toInteger(source.ref, id)) {
        throw CompileError("template id too large: " + source.ref, "OverflowError");
    }
    EntryStatement* entry = new EntryStatement;
    entry -> xmlid = source.refName;
    entry -> viewid = source.ref;
    entry -> body = source.defName + "_content";
    Block* block = new Block(source.defName);
    block -> code.push_back(entry);
    ret -> blocks[source.defName] = block;
    return ret;
}

std::shared_ptr<CompiledTemplate> notFoundTemplate(const std::string& ref, const std::string& message, const RenderOptions& options) {
    std::shared_ptr<CompiledTemplate> ret = std::make_shared<CompiledTemplate>();
    ret -> ref = ref;
    ret -> entry = "not_found_template";
    ret -> options = options;
    NotFoundStatement* notFound = new NotFoundStatement;
    notFound -> ref = ref;
    notFound -> message = message;
    Block* block = new Block(ret -> entry);
    block -> code.push_back(notFound);
    ret -> blocks[ret -> entry] = block;
    return ret;
}
