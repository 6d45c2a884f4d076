#include <evals/parser.hpp>
#include <evals/evals.hpp>
#include <evals/builtins.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>


static const char* keywords[] = { "and", "or", "not", "in", "is", "if", "else", "elif", "for", "lambda", "as", "None", "True", "False", NULL };


ExprParser::ExprParser(Expression* t, const std::vector<Token>& all) : target(t) {
    for (const Token& token : all) {
        if (token.type != Token::Newline && token.type != Token::Comment) {
            tokens.push_back(&token);
        }
    }
}

template <typename T>
T* ExprParser::make(T* node) {
    target -> nodes.push_back(node);
    return node;
}

void ExprParser::fail(const std::string& why) {
    throw CompileError(why + " in expression: " + target -> source, "SyntaxError");
}

const Token* ExprParser::peek(size_t ahead) {
    if (pos + ahead < tokens.size()) {
        return tokens[pos + ahead];
    }
    return NULL;
}

bool ExprParser::isOp(const char* op, size_t ahead) {
    const Token* t = peek(ahead);
    return t != NULL && t -> type == Token::Op && t -> text == op;
}

bool ExprParser::isKeyword(const char* word, size_t ahead) {
    const Token* t = peek(ahead);
    return t != NULL && t -> type == Token::Name && t -> lookup == Token::Verbatim && t -> text == word;
}

bool ExprParser::acceptOp(const char* op) {
    if (isOp(op)) {
        pos ++;
        return true;
    }
    return false;
}

bool ExprParser::acceptKeyword(const char* word) {
    if (isKeyword(word)) {
        pos ++;
        return true;
    }
    return false;
}

void ExprParser::expectOp(const char* op) {
    if (!acceptOp(op)) {
        fail();
    }
}

bool ExprParser::atExpressionEnd() {
    return peek() == NULL || isOp(")") || isOp("]") || isOp("}") || isOp(",") || isOp(":");
}


ExprNode* ExprParser::parse() {
    // the tokenizer wrapped everything in a single pair of parentheses
    ExprNode* root = atom();
    if (pos != tokens.size()) {
        fail();
    }
    return root;
}


ExprNode* ExprParser::test() {
    if (isKeyword("lambda")) {
        return lambda();
    }
    ExprNode* body = orTest();
    if (acceptKeyword("if")) {
        ExprNode* condition = orTest();
        if (!acceptKeyword("else")) {
            fail("expected 'else' after 'if' expression");
        }
        ExprNode* orelse = test();
        return make(new IfExpNode(condition, body, orelse));
    }
    return body;
}

ExprNode* ExprParser::namedTest() {
    const Token* t = peek();
    if (t != NULL && t -> type == Token::Name && isOp(":=", 1)) {
        std::string name = t -> text;
        pos += 2;
        ExprNode* value = test();
        return make(new NamedExprNode(name, value));
    }
    return test();
}

ExprNode* ExprParser::lambda() {
    pos ++; // lambda
    LambdaNode* node = make(new LambdaNode());
    while (!acceptOp(":")) {
        const Token* t = peek();
        if (t == NULL || t -> type != Token::Name || t -> lookup != Token::Local) {
            fail();
        }
        node -> params.push_back(t -> text);
        pos ++;
        if (!isOp(":")) {
            expectOp(",");
        }
    }
    node -> body = test();
    return node;
}

ExprNode* ExprParser::orTest() {
    ExprNode* first = andTest();
    if (!isKeyword("or")) {
        return first;
    }
    BoolOpNode* node = make(new BoolOpNode(false));
    node -> values.push_back(first);
    while (acceptKeyword("or")) {
        node -> values.push_back(andTest());
    }
    return node;
}

ExprNode* ExprParser::andTest() {
    ExprNode* first = notTest();
    if (!isKeyword("and")) {
        return first;
    }
    BoolOpNode* node = make(new BoolOpNode(true));
    node -> values.push_back(first);
    while (acceptKeyword("and")) {
        node -> values.push_back(notTest());
    }
    return node;
}

ExprNode* ExprParser::notTest() {
    if (acceptKeyword("not")) {
        return make(new UnaryOpNode("not", notTest()));
    }
    return comparison();
}

ExprNode* ExprParser::comparison() {
    ExprNode* left = binary(0);
    CompareNode* node = NULL;
    while (true) {
        std::string op;
        if (isOp("==") || isOp("!=") || isOp("<") || isOp("<=") || isOp(">") || isOp(">=")) {
            op = peek() -> text;
            pos ++;
        }
        else if (isKeyword("in")) {
            op = "in";
            pos ++;
        }
        else if (isKeyword("not") && isKeyword("in", 1)) {
            op = "not in";
            pos += 2;
        }
        else if (isKeyword("is")) {
            pos ++;
            op = acceptKeyword("not") ? "is not" : "is";
        }
        else {
            break;
        }
        if (node == NULL) {
            node = make(new CompareNode(left));
        }
        node -> ops.push_back(op);
        node -> comparators.push_back(binary(0));
    }
    return node == NULL ? left : node;
}

static const char* binaryLevels[][6] = { // loosest first
    { "|", NULL },
    { "^", NULL },
    { "&", NULL },
    { "<<", ">>", NULL },
    { "+", "-", NULL },
    { "*", "/", "//", "%", "@", NULL }
};

ExprNode* ExprParser::binary(int level) {
    if (level == 6) {
        return factor();
    }
    ExprNode* left = binary(level + 1);
    while (true) {
        const char* matched = NULL;
        for (size_t n = 0; binaryLevels[level][n] != NULL; n ++) {
            if (isOp(binaryLevels[level][n])) {
                matched = binaryLevels[level][n];
                break;
            }
        }
        if (matched == NULL) {
            return left;
        }
        pos ++;
        left = make(new BinOpNode(matched, left, binary(level + 1)));
    }
}

ExprNode* ExprParser::factor() {
    if (isOp("-") || isOp("+") || isOp("~")) {
        std::string op = peek() -> text;
        pos ++;
        return make(new UnaryOpNode(op, factor()));
    }
    return power();
}

ExprNode* ExprParser::power() {
    ExprNode* base = trailers(atom());
    if (acceptOp("**")) {
        return make(new BinOpNode("**", base, factor()));
    }
    return base;
}

ExprNode* ExprParser::trailers(ExprNode* node) {
    while (true) {
        if (acceptOp(".")) {
            const Token* t = peek();
            if (t == NULL || t -> type != Token::Name) {
                fail();
            }
            pos ++;
            node = make(new AttributeNode(node, t -> text));
        }
        else if (acceptOp("(")) {
            node = call(node);
        }
        else if (acceptOp("[")) {
            ExprNode* index = subscriptItem();
            if (isOp(",")) {
                DisplayNode* tuple = make(new DisplayNode(Value::Tuple));
                tuple -> elements.push_back(index);
                while (acceptOp(",") && !isOp("]")) {
                    tuple -> elements.push_back(subscriptItem());
                }
                index = tuple;
            }
            expectOp("]");
            node = make(new SubscriptNode(node, index));
        }
        else {
            return node;
        }
    }
}

ExprNode* ExprParser::subscriptItem() {
    ExprNode* lower = NULL;
    if (!isOp(":")) {
        lower = test();
        if (!isOp(":")) {
            return lower;
        }
    }
    pos ++; // :
    ExprNode* upper = NULL;
    ExprNode* step = NULL;
    if (!atExpressionEnd()) {
        upper = test();
    }
    if (acceptOp(":") && !atExpressionEnd()) {
        step = test();
    }
    return make(new SliceNode(lower, upper, step));
}

ExprNode* ExprParser::atom() {
    const Token* t = peek();
    if (t == NULL) {
        fail("unexpected end");
    }
    if (t -> type == Token::Number) {
        pos ++;
        return number(t -> text);
    }
    if (t -> type == Token::String) {
        return strings();
    }
    if (t -> type == Token::Name) {
        if (t -> lookup == Token::Verbatim) {
            if (t -> text == "None") {
                pos ++;
                return make(new LiteralNode(Value::none()));
            }
            if (t -> text == "True" || t -> text == "False") {
                pos ++;
                return make(new LiteralNode(Value::boolean(t -> text == "True")));
            }
            for (size_t n = 0; keywords[n] != NULL; n ++) {
                if (t -> text == keywords[n]) {
                    fail();
                }
            }
        }
        pos ++;
        return make(new NameNode(t -> text, t -> lookup));
    }
    if (acceptOp("(")) {
        return parenthesized();
    }
    if (acceptOp("[")) {
        return bracketed();
    }
    if (acceptOp("{")) {
        return braced();
    }
    fail();
}

ExprNode* ExprParser::number(const std::string& raw) {
    std::string text;
    for (char c : raw) {
        if (c != '_') {
            text += c;
        }
    }
    errno = 0;
    if (text.size() > 2 && text[0] == '0' && strchr("xXoObB", text[1])) {
        int base = (text[1] == 'x' || text[1] == 'X') ? 16 : (text[1] == 'o' || text[1] == 'O') ? 8 : 2;
        char* end;
        long long v = strtoll(text.c_str() + 2, &end, base);
        if (*end != 0) {
            fail("invalid number literal '" + raw + "'");
        }
        if (errno == ERANGE) {
            throw CompileError("integer literal too large: " + raw, "OverflowError");
        }
        return make(new LiteralNode(Value::integer(v)));
    }
    if (text.find_first_of(".eE") != std::string::npos) {
        char* end;
        double v = strtod(text.c_str(), &end);
        if (*end != 0) {
            fail("invalid number literal '" + raw + "'");
        }
        return make(new LiteralNode(Value::number(v)));
    }
    if (text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos) {
        fail("leading zeros in decimal integer literals are not permitted");
    }
    char* end;
    long long v = strtoll(text.c_str(), &end, 10);
    if (*end != 0) {
        fail("invalid number literal '" + raw + "'");
    }
    if (errno == ERANGE) {
        throw CompileError("integer literal too large: " + raw, "OverflowError");
    }
    return make(new LiteralNode(Value::integer(v)));
}

ExprNode* ExprParser::strings() {
    std::string value;
    while (peek() != NULL && peek() -> type == Token::String) {
        value += decodeStringLiteral(peek() -> text);
        pos ++;
    }
    return make(new LiteralNode(Value::str(value)));
}

ExprNode* ExprParser::starOrTest() {
    if (acceptOp("*")) {
        return make(new StarredNode(binary(0), false));
    }
    return namedTest();
}

void ExprParser::comprehension(ComprehensionNode* node) {
    while (acceptKeyword("for")) {
        Generator g;
        g.unpack = false;
        while (!acceptKeyword("in")) {
            const Token* t = peek();
            if (t == NULL) {
                fail();
            }
            if (t -> type == Token::Name && t -> lookup == Token::Local) {
                g.targets.push_back(t -> text);
            }
            else if (isOp(",")) {
                g.unpack = true;
            }
            else if (!isOp("(") && !isOp(")")) {
                fail();
            }
            pos ++;
        }
        if (g.targets.size() == 0) {
            fail();
        }
        g.iter = orTest();
        while (acceptKeyword("if")) {
            g.conditions.push_back(orTest());
        }
        node -> generators.push_back(g);
    }
}

ExprNode* ExprParser::parenthesized() {
    if (acceptOp(")")) {
        return make(new DisplayNode(Value::Tuple));
    }
    ExprNode* first = starOrTest();
    if (isKeyword("for")) {
        ComprehensionNode* node = make(new ComprehensionNode(ComprehensionNode::GeneratorOf));
        node -> element = first;
        comprehension(node);
        expectOp(")");
        return node;
    }
    if (acceptOp(")")) {
        if (first -> kind == ExprNode::Starred) {
            fail("can't use starred expression here");
        }
        return first;
    }
    DisplayNode* tuple = make(new DisplayNode(Value::Tuple));
    tuple -> elements.push_back(first);
    while (acceptOp(",")) {
        if (isOp(")")) {
            break;
        }
        tuple -> elements.push_back(starOrTest());
    }
    expectOp(")");
    return tuple;
}

ExprNode* ExprParser::bracketed() {
    if (acceptOp("]")) {
        return make(new DisplayNode(Value::List));
    }
    ExprNode* first = starOrTest();
    if (isKeyword("for")) {
        ComprehensionNode* node = make(new ComprehensionNode(ComprehensionNode::ListOf));
        node -> element = first;
        comprehension(node);
        expectOp("]");
        return node;
    }
    DisplayNode* list = make(new DisplayNode(Value::List));
    list -> elements.push_back(first);
    while (acceptOp(",")) {
        if (isOp("]")) {
            break;
        }
        list -> elements.push_back(starOrTest());
    }
    expectOp("]");
    return list;
}

ExprNode* ExprParser::braced() {
    if (acceptOp("}")) {
        return make(new DictDisplayNode());
    }
    ExprNode* first = NULL;
    if (!isOp("**")) {
        first = starOrTest();
        if (!isOp(":")) { // a set
            if (isKeyword("for")) {
                ComprehensionNode* node = make(new ComprehensionNode(ComprehensionNode::SetOf));
                node -> element = first;
                comprehension(node);
                expectOp("}");
                return node;
            }
            DisplayNode* set = make(new DisplayNode(Value::List, true));
            set -> elements.push_back(first);
            while (acceptOp(",")) {
                if (isOp("}")) {
                    break;
                }
                set -> elements.push_back(starOrTest());
            }
            expectOp("}");
            return set;
        }
    }
    DictDisplayNode* dict = make(new DictDisplayNode());
    if (first != NULL) {
        pos ++; // :
        ExprNode* value = test();
        if (isKeyword("for")) {
            ComprehensionNode* node = make(new ComprehensionNode(ComprehensionNode::DictOf));
            node -> element = first;
            node -> value = value;
            comprehension(node);
            expectOp("}");
            return node;
        }
        dict -> keys.push_back(first);
        dict -> values.push_back(value);
        if (!acceptOp(",")) {
            expectOp("}");
            return dict;
        }
    }
    while (!acceptOp("}")) {
        if (acceptOp("**")) {
            dict -> keys.push_back(NULL);
            dict -> values.push_back(binary(0));
        }
        else {
            dict -> keys.push_back(test());
            expectOp(":");
            dict -> values.push_back(test());
        }
        if (!isOp("}")) {
            expectOp(",");
        }
    }
    return dict;
}

ExprNode* ExprParser::call(ExprNode* function) {
    CallNode* node = make(new CallNode(function));
    while (!acceptOp(")")) {
        const Token* t = peek();
        if (t != NULL && t -> type == Token::Name && isOp("=", 1)) {
            pos += 2;
            node -> keywords.push_back({ t -> text, test() });
        }
        else if (acceptOp("**")) {
            node -> keywords.push_back({ "", make(new StarredNode(test(), true)) });
        }
        else if (acceptOp("*")) {
            if (node -> keywords.size() > 0) {
                fail("iterable argument unpacking follows keyword argument unpacking");
            }
            node -> args.push_back(make(new StarredNode(test(), false)));
        }
        else {
            if (node -> keywords.size() > 0) {
                fail("positional argument follows keyword argument");
            }
            ExprNode* arg = test();
            if (isKeyword("for")) {
                ComprehensionNode* generator = make(new ComprehensionNode(ComprehensionNode::GeneratorOf));
                generator -> element = arg;
                comprehension(generator);
                arg = generator;
            }
            node -> args.push_back(arg);
        }
        if (!isOp(")")) {
            expectOp(",");
        }
    }
    return node;
}


std::string decodeStringLiteral(const std::string& token) {
    size_t n = 0;
    bool raw = false;
    while (n < token.size() && token[n] != '\'' && token[n] != '"') {
        if (token[n] == 'r' || token[n] == 'R') {
            raw = true;
        }
        n ++;
    }
    char quote = token[n];
    size_t quoteLen = token.compare(n, 3, std::string(3, quote)) == 0 && token.size() - n >= 6 ? 3 : 1;
    std::string body = token.substr(n + quoteLen, token.size() - n - 2 * quoteLen);
    if (raw) {
        return body;
    }
    std::string out;
    for (size_t i = 0; i < body.size(); i ++) {
        if (body[i] != '\\' || i + 1 >= body.size()) {
            out += body[i];
            continue;
        }
        char c = body[++ i];
        switch (c) {
            case '\n': break;
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"': out += '"'; break;
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'v': out += '\v'; break;
            case 'x':
            case 'u':
            case 'U': {
                size_t digits = c == 'x' ? 2 : c == 'u' ? 4 : 8;
                std::string hex = body.substr(i + 1, digits);
                if (hex.size() != digits || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                    throw CompileError(std::string("truncated \\") + c + " escape in string literal", "SyntaxError");
                }
                appendUtf8(out, (uint32_t)strtoul(hex.c_str(), NULL, 16));
                i += digits;
                break;
            }
            default:
                if (c >= '0' && c <= '7') {
                    uint32_t cp = c - '0';
                    for (int d = 0; d < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; d ++) {
                        cp = cp * 8 + (body[++ i] - '0');
                    }
                    appendUtf8(out, cp);
                }
                else {
                    out += '\\';
                    out += c;
                }
        }
    }
    return out;
}


static const char* forbiddenOperation(const ExprNode* node) {
    switch (node -> kind) {
        case ExprNode::NamedExpr:
            return "assignment";
        case ExprNode::BinOp:
            if (((const BinOpNode*)node) -> op == "@") {
                return "matrix multiplication";
            }
            return NULL;
        case ExprNode::Name: {
            const NameNode* name = (const NameNode*)node;
            if (name -> name.find("__") != std::string::npos) {
                return "dunder access";
            }
            if (name -> lookup == Token::Verbatim && !isBuiltin(name -> name)) {
                return "global lookup";
            }
            return NULL;
        }
        case ExprNode::Attribute:
            if (startsWith(((const AttributeNode*)node) -> name, "_")) {
                return "private attribute access";
            }
            return NULL;
        case ExprNode::Literal:
        case ExprNode::Subscript:
        case ExprNode::Slice:
        case ExprNode::Call:
        case ExprNode::Starred:
        case ExprNode::BoolOp:
        case ExprNode::UnaryOp:
        case ExprNode::Compare:
        case ExprNode::IfExp:
        case ExprNode::Lambda:
        case ExprNode::Comprehension:
        case ExprNode::Display:
        case ExprNode::DictDisplay:
            return NULL;
    }
    return "unknown operation";
}

void validate(const Expression& expr) {
    std::vector<const ExprNode*> pending = { expr.root };
    while (pending.size() > 0) {
        const ExprNode* node = pending.back();
        pending.pop_back();
        const char* forbidden = forbiddenOperation(node);
        if (forbidden != NULL) {
            throw CompileError("forbidden operation in " + Value::str(expr.source).repr() + ": " + forbidden, "ValueError");
        }
        node -> children(pending);
    }
}
