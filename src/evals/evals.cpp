#include <evals/evals.hpp>
#include <evals/parser.hpp>
#include <evals/tokens.hpp>
#include <errors.hpp>
#include <util.hpp>


Expression::~Expression() {
    for (ExprNode* node : nodes) {
        delete node;
    }
}

Value Expression::eval(std::shared_ptr<Mapping> values) const {
    Scope scope{ values };
    return root -> eval(this, scope);
}


std::string FormatString::render(std::shared_ptr<Mapping> values) const {
    std::string ret = literals[0];
    for (size_t i = 0; i < parts.size(); i ++) {
        ret += toText(parts[i] -> eval(values));
        ret += literals[i + 1];
    }
    return ret;
}


std::shared_ptr<Expression> compileExpression(const std::string& expr, bool raiseOnMissing) {
    std::shared_ptr<Expression> ret = std::make_shared<Expression>();
    ret -> source = expr;
    std::vector<Token> tokens = tokenize(expr);
    ret -> rewritten = rewrite(tokens, raiseOnMissing);
    ExprParser parser(ret.get(), tokens);
    ret -> root = parser.parse();
    validate(*ret);
    return ret;
}


static size_t closing(const std::string& format, size_t from, const char* close) { // npos if a newline comes first
    size_t end = format.find(close, from);
    if (end == std::string::npos) {
        return end;
    }
    if (format.find('\n', from) < end) {
        return std::string::npos;
    }
    return end;
}

std::shared_ptr<FormatString> compileFormat(const std::string& format) {
    std::shared_ptr<FormatString> ret = std::make_shared<FormatString>();
    ret -> source = format;
    std::string literal;
    size_t i = 0;
    while (i < format.size()) {
        // #{expr} and {{expr}}: the shortest non-empty expression, all on one line
        bool hash = format.compare(i, 2, "#{") == 0;
        bool braces = format.compare(i, 2, "{{") == 0;
        if (hash || braces) {
            size_t end = (hash && format[i + 2] != '\n') ? closing(format, i + 3, "}") : std::string::npos;
            size_t len = 1;
            if (end == std::string::npos && braces && i + 2 < format.size() && format[i + 2] != '\n') {
                end = closing(format, i + 3, "}}");
                len = 2;
            }
            if (end != std::string::npos) {
                ret -> literals.push_back(literal);
                literal = "";
                ret -> parts.push_back(compileExpression(format.substr(i + 2, end - i - 2)));
                i = end + len;
                continue;
            }
        }
        literal += format[i];
        i ++;
    }
    ret -> literals.push_back(literal);
    return ret;
}


std::string toText(const Value& v) {
    if (v.isNone() || (v.kind == Value::Bool && !v.b)) {
        return "";
    }
    return v.toString();
}


bool compileBool(const std::string& attr, bool fallback) {
    std::string lower = toLower(attr);
    if (lower == "false" || lower == "0") {
        return false;
    }
    if (lower == "true" || lower == "1") {
        return true;
    }
    return fallback;
}
