#include <compiler/directives.hpp>
#include <compiler/compiler.hpp>
#include <evals/evals.hpp>
#include <types/PlainText.hpp>
#include <types/IfStatement.hpp>
#include <types/GroupsStatement.hpp>
#include <types/ForLoop.hpp>
#include <types/SetStatement.hpp>
#include <types/OptionsStatement.hpp>
#include <types/AttsStatement.hpp>
#include <types/TagAttributes.hpp>
#include <types/OutStatement.hpp>
#include <types/CallStatement.hpp>
#include <types/AssetsStatement.hpp>
#include <types/DebuggerStatement.hpp>
#include <util.hpp>
#include <cstdio>
#include <memory>
#include <set>


bool DirectiveHandler::applies(const XmlElement* el) const {
    return el -> has("t-" + name);
}

bool isSpecialAttribute(const std::string& name) {
    return name == "t-translation" || name == "t-ignore" || name == "t-title";
}


static std::string popAttribute(XmlElement* el, const std::string& name, const std::string& fallback = "") {
    std::string ret;
    if (!el -> pop(name, ret)) {
        return fallback;
    }
    return ret;
}

static std::string withoutSuffix(const std::string& name, const std::string& suffix) {
    return endsWith(name, suffix) ? name.substr(0, name.size() - suffix.size()) : name;
}

static bool isTElement(const XmlElement* el) {
    return localName(el -> tag) == "t";
}


struct IfDirective : DirectiveHandler {
    IfDirective() : DirectiveHandler("if") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string expr;
        if (!el -> pop("t-if", expr)) {
            el -> pop("t-elif", expr);
        }
        if (expr.size() == 0 || isBlank(expr)) {
            throw CompileError("t-if or t-elif expression should not be empty.");
        }

        std::string strip = c.rstripText(); // the whitespace only shows if the content does
        if (isTElement(el) && lstripNewline(el -> text)) {
            strip = "";
        }
        c.flushText(code);

        std::unique_ptr<IfStatement> stmt(new IfStatement);
        stmt -> where = c.lastPath;
        stmt -> condition = compileExpression(expr);
        if (strip.size() > 0) {
            c.appendText(strip);
        }
        c.compileDirectives(el, stmt -> body);
        c.flushText(stmt -> body, true);

        std::vector<XmlNode*> comments;
        XmlNode* next = el -> getnext();
        while (next != NULL && next -> type == XmlNode::Comment) {
            comments.push_back(next);
            next = next -> getnext();
        }
        if (next != NULL && next -> type == XmlNode::Element) {
            XmlElement* branch = (XmlElement*)next;
            if (branch -> has("t-else") || branch -> has("t-elif")) {
                branch -> set("t-else-valid", "True");
                for (XmlNode* comment : comments) {
                    el -> parent -> detach(comment);
                }
                if (el -> tail.size() > 0 && !isBlank(el -> tail)) {
                    throw CompileError("Unexpected non-whitespace characters between t-if and t-else directives");
                }
                el -> tail = "";
                if (strip.size() > 0) {
                    c.appendText(strip);
                }
                c.compileNode(branch, stmt -> orelse);
                c.flushText(stmt -> orelse, true);
                branch -> set("t-qweb-skip", "True"); // compiled here, not by the parent's content
            }
        }
        code.push_back(stmt.release());
    }
};

static IfDirective ifDirective;


struct ElifDirective : DirectiveHandler {
    ElifDirective() : DirectiveHandler("elif") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        if (!el -> has("t-else-valid")) {
            throw CompileError("t-elif directive must be preceded by t-if or t-elif directive");
        }
        el -> remove("t-else-valid");
        ifDirective.compile(c, el, code);
    }
};


struct ElseDirective : DirectiveHandler {
    ElseDirective() : DirectiveHandler("else") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        if (!el -> has("t-else-valid")) {
            throw CompileError("t-else directive must be preceded by t-if or t-elif directive");
        }
        el -> remove("t-else-valid");
        el -> remove("t-else");
    }
};


struct DebugDirective : DirectiveHandler {
    DebugDirective() : DirectiveHandler("debug") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string debugger = popAttribute(el, "t-debug");
        if (c.options.devMode) {
            DebuggerStatement* stmt = new DebuggerStatement(debugger);
            stmt -> where = c.lastPath;
            code.push_back(stmt);
        }
        else {
            printf(WARNING "@t-debug in template is only available in dev mode\n\tat %s\n", c.lastPath.path.c_str());
        }
    }
};


struct GroupsDirective : DirectiveHandler {
    GroupsDirective() : DirectiveHandler("groups") {}

    bool applies(const XmlElement* el) const {
        return el -> has("t-groups") || el -> has("groups");
    }

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string groups;
        if (!el -> pop("t-groups", groups)) {
            el -> pop("groups", groups);
        }
        std::string strip = c.rstripText();
        c.flushText(code);
        std::unique_ptr<GroupsStatement> stmt(new GroupsStatement);
        stmt -> where = c.lastPath;
        stmt -> groups = groups;
        if (strip.size() > 0 && !isTElement(el)) {
            c.appendText(strip);
        }
        c.compileDirectives(el, stmt -> body);
        c.flushText(stmt -> body, true);
        code.push_back(stmt.release());
    }
};


struct AsDirective : DirectiveHandler {
    AsDirective() : DirectiveHandler("as") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        if (!el -> has("t-foreach")) {
            throw CompileError("t-as must be on the same node of t-foreach");
        }
    }
};


struct ForeachDirective : DirectiveHandler {
    ForeachDirective() : DirectiveHandler("foreach") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string expr = popAttribute(el, "t-foreach");
        std::string as = popAttribute(el, "t-as");
        if (as.size() == 0) {
            throw CompileError("'t-as'", "KeyError");
        }
        if (!isVarname(as)) {
            throw CompileError("The varname '" + as + "' can only contain alphanumeric characters and underscores.", "ValueError");
        }
        if (isTElement(el)) {
            c.rstripText();
        }
        c.flushText(code);

        std::unique_ptr<ForLoop> loop(new ForLoop);
        loop -> where = c.lastPath;
        loop -> as = as;
        if (isNumber(expr)) {
            if (!toInteger(expr, loop -> count)) {
                throw CompileError("t-foreach count too large: " + expr, "OverflowError");
            }
        }
        else {
            loop -> iterable = compileExpression(expr);
        }
        c.compileDirectives(el, loop -> body);
        c.flushText(loop -> body, true);
        code.push_back(loop.release());
    }
};


struct CallAssetsDirective : DirectiveHandler {
    CallAssetsDirective() : DirectiveHandler("call-assets") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        if (el -> elementCount() > 0) {
            throw CompileError("t-call-assets cannot contain children nodes");
        }
        c.flushText(code);
        AssetsStatement* stmt = new AssetsStatement;
        stmt -> where = c.lastPath;
        stmt -> bundle = popAttribute(el, "t-call-assets");
        stmt -> css = compileBool(popAttribute(el, "t-css"), true);
        stmt -> js = compileBool(popAttribute(el, "t-js"), true);
        stmt -> deferLoad = compileBool(popAttribute(el, "defer_load"), false);
        stmt -> lazyLoad = compileBool(popAttribute(el, "lazy_load"), false);
        stmt -> media = popAttribute(el, "media");
        stmt -> autoprefix = compileBool(popAttribute(el, "t-autoprefix"), false);
        code.push_back(stmt);
    }
};


struct LangDirective : DirectiveHandler {
    LangDirective() : DirectiveHandler("lang") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        if (!el -> has("t-call")) {
            throw CompileError("t-lang is an alias of t-options-lang but only available on the same node of t-call");
        }
        el -> set("t-options-lang", popAttribute(el, "t-lang"));
        c.compileNode(el, code);
    }
};


struct OptionsDirective : DirectiveHandler {
    OptionsDirective() : DirectiveHandler("options") {}

    bool applies(const XmlElement* el) const {
        if (el -> has("t-options")) {
            return true;
        }
        for (const XmlAttribute& attr : el -> attributes) {
            if (startsWith(attr.name, "t-options-")) {
                return true;
            }
        }
        return false;
    }

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::unique_ptr<OptionsStatement> stmt(new OptionsStatement);
        stmt -> where = c.lastPath;
        for (const std::string& name : el -> attributeNames()) {
            if (startsWith(name, "t-options-")) {
                std::string value = popAttribute(el, name);
                stmt -> entries.push_back({ name.substr(10), compileExpression(value) });
            }
        }
        std::string options = popAttribute(el, "t-options");
        if (options.size() > 0) {
            stmt -> options = compileExpression(options);
        }
        el -> set("t-consumed-options", "True");
        code.push_back(stmt.release());
    }
};


struct CallDirective : DirectiveHandler {
    CallDirective() : DirectiveHandler("call") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string expr = popAttribute(el, "t-call");
        std::string local = localName(el -> tag);
        if (local != "t") {
            throw CompileError("t-call must be on a <t> element (actually on <" + local + ">).");
        }
        c.flushText(code, true);
        el -> remove("t-consumed-options");

        std::unique_ptr<CallStatement> call(new CallStatement);
        call -> where = c.lastPath;

        bool hasContent = el -> text.size() > 0;
        for (XmlNode* child : el -> children) {
            hasContent = hasContent || !child -> detached;
        }
        if (hasContent) {
            std::string name = c.makeName("t_call");
            CodeBuffer content;
            c.compileDirective(el, "inner-content", content.code);
            c.appendText(""); // the rstrip below only ever touches this
            c.flushText(content.code, true);
            c.addBlock(name, content);
            call -> contentBlock = name;
        }

        for (const std::string& key : el -> attributeNames()) {
            CallArgument arg;
            if (endsWith(key, ".f") || endsWith(key, ".translate")) {
                arg.kind = CallArgument::Format;
                arg.name = withoutSuffix(withoutSuffix(key, ".translate"), ".f");
                arg.format = compileFormat(popAttribute(el, key));
            }
            else if (!startsWith(key, "t-")) {
                arg.kind = CallArgument::Expr;
                arg.name = key;
                arg.expr = compileExpression(popAttribute(el, key));
            }
            else if (key == "t-args") {
                arg.kind = CallArgument::Spread;
                arg.expr = compileExpression(popAttribute(el, key));
            }
            else {
                continue;
            }
            call -> args.push_back(arg);
        }

        if (isNumber(expr)) {
            call -> ref = expr;
        }
        else {
            call -> target = compileFormat(expr);
        }
        code.push_back(call.release());
    }
};


struct AttDirective : DirectiveHandler {
    AttDirective() : DirectiveHandler("att") {}

    bool applies(const XmlElement* el) const {
        return true;
    }

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::unique_ptr<AttsStatement> stmt(new AttsStatement);
        stmt -> where = c.lastPath;
        for (auto& decl : el -> nsdecls) { // namespaces this element introduces
            bool known = false;
            for (auto& existing : c.nsmap) {
                if (existing == decl) {
                    known = true;
                }
            }
            if (!known) {
                AttributeEntry entry;
                entry.name = decl.first.size() ? "xmlns:" + decl.first : "xmlns";
                entry.value = decl.second;
                stmt -> entries.push_back(entry);
            }
        }
        for (const std::string& name : el -> attributeNames()) {
            if (!startsWith(name, "t-")) {
                AttributeEntry entry;
                entry.name = withoutSuffix(name, ".translate");
                entry.value = popAttribute(el, name);
                stmt -> entries.push_back(entry);
            }
        }
        for (const std::string& name : el -> attributeNames()) {
            AttributeEntry entry;
            if (startsWith(name, "t-attf-")) {
                entry.kind = AttributeEntry::Format;
                entry.name = withoutSuffix(name.substr(7), ".translate");
                entry.format = compileFormat(popAttribute(el, name));
            }
            else if (startsWith(name, "t-att-")) {
                entry.kind = AttributeEntry::Expr;
                entry.name = name.substr(6);
                entry.expr = compileExpression(popAttribute(el, name));
            }
            else if (name == "t-att") {
                entry.kind = AttributeEntry::Spread;
                entry.expr = compileExpression(popAttribute(el, name));
            }
            else {
                continue;
            }
            stmt -> entries.push_back(entry);
        }
        if (stmt -> entries.size() > 0 || el -> has("t-tag-open")) {
            code.push_back(stmt.release());
        }
    }
};


struct OutDirective : DirectiveHandler { // t-out, and the core of t-esc, t-raw and t-field
    OutDirective(std::string name = "out") : DirectiveHandler(name) {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::unique_ptr<OutStatement> out(new OutStatement);
        std::string expr;
        if (el -> pop("t-out", expr)) {
            out -> kind = OutStatement::Out;
        }
        else if (el -> pop("t-field", expr)) {
            out -> kind = OutStatement::Field;
        }
        else if (el -> pop("t-esc", expr)) {
            out -> kind = OutStatement::Esc;
        }
        else {
            expr = popAttribute(el, "t-raw");
            out -> kind = OutStatement::Raw;
        }
        c.flushText(code);
        out -> where = c.lastPath;
        out -> source = expr;
        out -> tag = el -> tag;

        bool consumedOptions = popAttribute(el, "t-consumed-options") == "True";
        std::string open = popAttribute(el, "t-tag-open");
        std::string close = popAttribute(el, "t-tag-close");
        CodeBuffer defaultBody;
        c.compileDirective(el, "inner-content", defaultBody.code);
        c.flushText(defaultBody.code);

        if (expr == WEFT_CALL_SLOT && !consumedOptions) {
            c.tagOpen(open, close.size() > 0, code);
            code.push_back(new EmitStatement(true));
            c.tagClose(close, code);
            return;
        }
        if (out -> kind == OutStatement::Field) {
            size_t dot = expr.rfind('.');
            out -> expr = compileExpression(expr.substr(0, dot), true);
            out -> fieldName = expr.substr(dot + 1);
        }
        else {
            out -> slot = expr == WEFT_CALL_SLOT;
            if (!out -> slot) {
                out -> expr = compileExpression(expr);
            }
            out -> widget = consumedOptions;
        }

        c.tagOpen(open, close.size() > 0, out -> display);
        out -> display.push_back(new EmitStatement());
        c.tagClose(close, out -> display);
        if (defaultBody.code.size() > 0) {
            c.tagOpen(open, close.size() > 0, out -> fallback);
            defaultBody.moveTo(out -> fallback);
            c.tagClose(close, out -> fallback);
        }
        else if (out -> kind == OutStatement::Field || out -> widget) {
            c.tagOpen(open, close.size() > 0, out -> forced);
            c.tagClose(close, out -> forced);
        }
        code.push_back(out.release());
    }
};

static OutDirective outDirective;


struct EscDirective : OutDirective {
    EscDirective() : OutDirective("esc") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        if (c.options.devMode) {
            printf(WARNING "Found deprecated directive @t-esc=\"%s\" in template %s. Replace by @t-out\n", el -> get("t-esc").c_str(), c.ref.c_str());
        }
        OutDirective::compile(c, el, code);
    }
};


struct RawDirective : OutDirective {
    RawDirective() : OutDirective("raw") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        printf(WARNING "Found deprecated directive @t-raw=\"%s\" in template %s. Replace by @t-out, and explicitly wrap content in Markup if necessary\n", el -> get("t-raw").c_str(), c.ref.c_str());
        OutDirective::compile(c, el, code);
    }
};


struct FieldDirective : OutDirective {
    FieldDirective() : OutDirective("field") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        static const std::set<std::string> structural = { "table", "tbody", "thead", "tfoot", "tr", "td", "li", "ul", "ol", "dl", "dt", "dd" };
        if (structural.count(el -> tag) > 0) {
            throw CompileError("QWeb widgets do not work correctly on '" + el -> tag + "' elements", "AssertionError");
        }
        if (isTElement(el)) {
            throw CompileError("t-field can not be used on a t element, provide an actual HTML node", "AssertionError");
        }
        if (el -> get("t-field").find('.') == std::string::npos) {
            throw CompileError("t-field must have at least a dot like 'record.field_name'", "AssertionError");
        }
        OutDirective::compile(c, el, code);
    }
};


struct TagOpenDirective : DirectiveHandler {
    TagOpenDirective() : DirectiveHandler("tag-open") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string tag = popAttribute(el, "t-tag-open");
        if (tag.size() == 0) {
            return;
        }
        c.appendText("<" + tag);
        c.flushText(code);
        code.push_back(new TagAttributes(tag));
        c.appendText(el -> has("t-tag-close") ? ">" : "/>");
    }
};


struct TagCloseDirective : DirectiveHandler {
    TagCloseDirective() : DirectiveHandler("tag-close") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        std::string tag = popAttribute(el, "t-tag-close");
        if (tag.size() > 0) {
            c.appendText("</" + tag + ">");
        }
    }
};


struct SetDirective : DirectiveHandler {
    SetDirective() : DirectiveHandler("set") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        c.flushText(code, toLower(el -> tag) == "t");
        std::string name = popAttribute(el, "t-set");
        if (name.size() == 0) {
            throw CompileError("'t-set'", "KeyError");
        }
        if (name != WEFT_CALL_SLOT && name[0] != '{' && !isVarname(name)) {
            throw CompileError("The varname can only contain alphanumeric characters and underscores.");
        }
        if (name.find("__") != std::string::npos) {
            throw CompileError("Using variable names with '__' is not allowed: '" + name + "'");
        }
        bool valued = el -> has("t-value") || el -> has("t-valuef") || el -> has("t-valuef.translate") || name[0] == '{';
        if (valued) {
            el -> remove("t-inner-content"); // the content is ignored
            if (name == WEFT_CALL_SLOT) {
                throw CompileError("t-set=\"0\" should not be set from t-value or t-valuef");
            }
        }

        std::unique_ptr<SetStatement> stmt(new SetStatement);
        stmt -> where = c.lastPath;
        stmt -> name = name;
        std::string value;
        if (el -> pop("t-value", value)) {
            stmt -> kind = SetStatement::FromValue;
            stmt -> value = compileExpression(value.size() ? value : "None");
        }
        else if (el -> pop("t-valuef", value) || el -> pop("t-valuef.translate", value)) {
            stmt -> kind = SetStatement::FromFormat;
            stmt -> format = compileFormat(value);
        }
        else if (name[0] == '{') {
            stmt -> kind = SetStatement::Merge;
            stmt -> value = compileExpression(name);
        }
        else {
            CodeBuffer content;
            c.compileDirective(el, "inner-content", content.code);
            c.flushText(content.code);
            if (content.code.size() > 0) {
                stmt -> kind = SetStatement::FromContent;
                stmt -> block = c.makeName("t_set");
                c.addBlock(stmt -> block, content);
            }
            else {
                stmt -> kind = SetStatement::Empty;
            }
        }
        code.push_back(stmt.release());
    }
};


struct InnerContentDirective : DirectiveHandler {
    InnerContentDirective() : DirectiveHandler("inner-content") {}

    void compile(TemplateCompiler& c, XmlElement* el, Code& code) const {
        el -> remove("t-inner-content");
        Namespaces outer = c.nsmap;
        for (auto& decl : el -> nsdecls) {
            bool replaced = false;
            for (auto& existing : c.nsmap) {
                if (existing.first == decl.first) {
                    existing.second = decl.second;
                    replaced = true;
                }
            }
            if (!replaced) {
                c.nsmap.push_back(decl);
            }
        }

        if (el -> text.size() > 0) {
            c.appendText(escapeText(el -> text)); // the parser decoded the entities
        }
        std::vector<XmlNode*> children = el -> children; // compiling a t-if detaches the comments after it
        for (XmlNode* child : children) {
            if (child -> detached) {
                continue;
            }
            if (child -> type == XmlNode::Comment) {
                if (c.options.preserveComments) {
                    c.appendText("<!--" + ((XmlComment*)child) -> text + "-->");
                }
            }
            else if (child -> type == XmlNode::ProcessingInstruction) {
                if (c.options.preserveComments) {
                    XmlPI* pi = (XmlPI*)child;
                    c.appendText("<?" + pi -> target + " " + pi -> text + "?>");
                }
            }
            else {
                c.compileNode((XmlElement*)child, code);
            }
            if (child -> tail.size() > 0) {
                c.appendText(escapeText(child -> tail));
            }
        }
        c.nsmap = outer;
    }
};


static ElifDirective elifDirective;
static ElseDirective elseDirective;
static DebugDirective debugDirective;
static GroupsDirective groupsDirective;
static AsDirective asDirective;
static ForeachDirective foreachDirective;
static CallAssetsDirective callAssetsDirective;
static LangDirective langDirective;
static OptionsDirective optionsDirective;
static CallDirective callDirective;
static AttDirective attDirective;
static FieldDirective fieldDirective;
static EscDirective escDirective;
static RawDirective rawDirective;
static TagOpenDirective tagOpenDirective;
static SetDirective setDirective;
static InnerContentDirective innerContentDirective;
static TagCloseDirective tagCloseDirective;


const std::vector<const DirectiveHandler*>& directiveTable() {
    static const std::vector<const DirectiveHandler*> table = {
        &elifDirective, // compiled by the t-if before, so these two come first
        &elseDirective,
        &debugDirective,
        &groupsDirective,
        &asDirective,
        &foreachDirective,
        &ifDirective,
        &callAssetsDirective,
        &langDirective,
        &optionsDirective,
        &callDirective,
        &attDirective,
        &fieldDirective,
        &escDirective,
        &rawDirective,
        &outDirective,
        &tagOpenDirective,
        &setDirective,
        &innerContentDirective,
        &tagCloseDirective
    };
    return table;
}

const DirectiveHandler* findDirective(const std::string& name) {
    for (const DirectiveHandler* handler : directiveTable()) {
        if (handler -> name == name) {
            return handler;
        }
    }
    return NULL;
}
