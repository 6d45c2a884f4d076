#include <evals/tokens.hpp>
#include <evals/builtins.hpp>
#include <errors.hpp>
#include <algorithm>
#include <cstring>
#include <cctype>


static const char* operators[] = { // longest first
    "**=", "//=", ">>=", "<<=", "...",
    "**", "//", "==", "!=", "<=", ">=", "<<", ">>", ":=", "->", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+", "-", "*", "/", "%", "@", "&", "|", "^", "~", "<", ">", "(", ")", "[", "]", "{", "}", ",", ":", ".", ";", "=",
    NULL
};

static bool isIdentStart(char c) {
    return isalpha((unsigned char)c) || c == '_' || (unsigned char)c >= 0x80;
}

static bool isIdentChar(char c) {
    return isIdentStart(c) || isdigit((unsigned char)c);
}

static bool isOpen(const Token& t) {
    return t.type == Token::Op && (t.text == "(" || t.text == "[" || t.text == "{");
}

static bool isClose(const Token& t) {
    return t.type == Token::Op && (t.text == ")" || t.text == "]" || t.text == "}");
}


std::vector<Token> tokenize(const std::string& expr) {
    std::string source = "(" + expr + ")";
    std::vector<Token> tokens;
    int row = 1;
    int col = 0;
    size_t n = 0;
    int depth = 0;
    auto invalid = [&expr]() {
        return CompileError("Can not compile expression: " + expr, "ValueError");
    };
    auto push = [&tokens, &row, &col](Token::Type type, const std::string& text, int startRow, int startCol) {
        Token t;
        t.type = type;
        t.text = text;
        t.row = startRow;
        t.col = startCol;
        t.endRow = row;
        t.endCol = col;
        tokens.push_back(t);
    };
    while (n < source.size()) {
        char c = source[n];
        int startRow = row;
        int startCol = col;
        if (c == ' ' || c == '\t' || c == '\f') {
            n ++;
            col ++;
        }
        else if (c == '\r' || c == '\n') {
            n ++;
            if (c == '\r' && n < source.size() && source[n] == '\n') {
                n ++;
            }
            col ++;
            push(Token::Newline, "\n", startRow, startCol);
            row ++;
            col = 0;
        }
        else if (c == '#') {
            size_t start = n;
            while (n < source.size() && source[n] != '\n' && source[n] != '\r') {
                n ++;
                col ++;
            }
            push(Token::Comment, source.substr(start, n - start), startRow, startCol);
        }
        else if (c == '\\') {
            throw invalid();
        }
        else if (isIdentStart(c) || c == '"' || c == '\'') {
            size_t start = n;
            while (n < source.size() && isIdentChar(source[n])) {
                n ++;
                col ++;
            }
            std::string prefix = source.substr(start, n - start);
            if (n < source.size() && (source[n] == '"' || source[n] == '\'') && prefix.size() <= 2) {
                std::string lower;
                for (char p : prefix) {
                    lower += tolower((unsigned char)p);
                }
                if (lower.find('f') != std::string::npos) {
                    throw CompileError("f-strings are not supported in template expressions: " + expr, "SyntaxError");
                }
                if (lower.find('b') != std::string::npos) {
                    throw CompileError("bytes literals are not supported in template expressions: " + expr, "SyntaxError");
                }
                if (lower != "" && lower != "r" && lower != "u") {
                    throw CompileError("invalid string prefix in expression: " + expr, "SyntaxError");
                }
                char quote = source[n];
                bool triple = source.compare(n, 3, std::string(3, quote)) == 0;
                size_t quoteLen = triple ? 3 : 1;
                n += quoteLen;
                col += quoteLen;
                while (true) {
                    if (n >= source.size()) {
                        throw invalid();
                    }
                    if (source[n] == '\\' && n + 1 < source.size()) {
                        if (source[n + 1] == '\n') {
                            row ++;
                            col = 0;
                            n += 2;
                            continue;
                        }
                        n += 2;
                        col += 2;
                        continue;
                    }
                    if (source.compare(n, quoteLen, std::string(quoteLen, quote)) == 0) {
                        n += quoteLen;
                        col += quoteLen;
                        break;
                    }
                    if (source[n] == '\n') {
                        if (!triple) {
                            throw invalid();
                        }
                        row ++;
                        col = 0;
                        n ++;
                        continue;
                    }
                    n ++;
                    col ++;
                }
                push(Token::String, source.substr(start, n - start), startRow, startCol);
            }
            else {
                push(Token::Name, prefix, startRow, startCol);
            }
        }
        else if (isdigit((unsigned char)c) || (c == '.' && n + 1 < source.size() && isdigit((unsigned char)source[n + 1]))) {
            size_t start = n;
            if (c == '0' && n + 1 < source.size() && strchr("xXoObB", source[n + 1])) {
                n += 2;
                while (n < source.size() && (isxdigit((unsigned char)source[n]) || source[n] == '_')) n ++;
            }
            else {
                while (n < source.size() && (isdigit((unsigned char)source[n]) || source[n] == '_')) n ++;
                if (n < source.size() && source[n] == '.') {
                    n ++;
                    while (n < source.size() && (isdigit((unsigned char)source[n]) || source[n] == '_')) n ++;
                }
                if (n < source.size() && (source[n] == 'e' || source[n] == 'E')) {
                    size_t save = n;
                    n ++;
                    if (n < source.size() && (source[n] == '+' || source[n] == '-')) n ++;
                    if (n < source.size() && isdigit((unsigned char)source[n])) {
                        while (n < source.size() && isdigit((unsigned char)source[n])) n ++;
                    }
                    else {
                        n = save;
                    }
                }
            }
            if (n < source.size() && (source[n] == 'j' || source[n] == 'J')) {
                throw CompileError("complex numbers are not supported in template expressions: " + expr, "SyntaxError");
            }
            col += n - start;
            push(Token::Number, source.substr(start, n - start), startRow, startCol);
        }
        else {
            const char* matched = NULL;
            for (size_t o = 0; operators[o] != NULL; o ++) {
                if (source.compare(n, strlen(operators[o]), operators[o]) == 0) {
                    matched = operators[o];
                    break;
                }
            }
            if (matched == NULL) {
                throw CompileError("invalid character '" + std::string(1, c) + "' in expression: " + expr, "SyntaxError");
            }
            n += strlen(matched);
            col += strlen(matched);
            push(Token::Op, matched, startRow, startCol);
            if (isOpen(tokens.back())) {
                depth ++;
            }
            else if (isClose(tokens.back())) {
                depth --;
                if (depth < 0) {
                    throw invalid();
                }
            }
        }
    }
    if (depth != 0) {
        throw invalid();
    }
    return tokens;
}


struct RewriteItem { // one token of a bracket level, or a whole bracketed group standing in for its tokens
    size_t first;
    size_t last;
    bool group;
    std::string code;
};

static std::string argumentName(const std::string& name) {
    return "_arg_" + name + "__";
}

static std::string rewriteLevel(std::vector<Token>& tokens, size_t lo, size_t hi, std::vector<std::string> argumentNames, bool raiseOnMissing) {
    // names bound at this bracket level by lambdas and comprehensions
    int depth = 0;
    for (size_t index = lo; index < hi; index ++) {
        Token& t = tokens[index];
        if (isOpen(t)) {
            depth ++;
        }
        else if (isClose(t)) {
            depth --;
        }
        else if (depth == 0 && t.type == Token::Name) {
            if (t.text == "lambda") {
                for (size_t i = index + 1; i < hi; i ++) {
                    Token& a = tokens[i];
                    if (a.type == Token::Name) {
                        argumentNames.push_back(a.text);
                    }
                    else if (a.type == Token::Op && a.text == ",") {
                    }
                    else if (a.type == Token::Op && a.text == ":") {
                        break;
                    }
                    else if (a.type == Token::Op && a.text == "=") {
                        throw CompileError("Lambda default values are not supported", "NotImplementedError");
                    }
                    else {
                        throw CompileError("This lambda code style is not implemented.", "NotImplementedError");
                    }
                }
            }
            else if (t.text == "for") {
                for (size_t i = index + 1; i < hi; i ++) {
                    Token& a = tokens[i];
                    if (a.type == Token::Name) {
                        if (a.text == "in") {
                            break;
                        }
                        argumentNames.push_back(a.text);
                    }
                    else if (a.type == Token::Op && (a.text == "," || a.text == "(" || a.text == ")")) {
                    }
                    else {
                        throw CompileError("This loop code style is not implemented.", "NotImplementedError");
                    }
                }
            }
        }
    }

    // nested brackets are rewritten first, each becoming a single item
    std::vector<RewriteItem> items;
    depth = 0;
    size_t openIndex = 0;
    for (size_t index = lo; index < hi; index ++) {
        Token& t = tokens[index];
        if (isOpen(t)) {
            if (depth == 0) {
                openIndex = index;
            }
            depth ++;
        }
        else if (isClose(t)) {
            depth --;
            if (depth == 0) {
                std::string inner = rewriteLevel(tokens, openIndex + 1, index, argumentNames, raiseOnMissing);
                items.push_back(RewriteItem{ openIndex, index, true, tokens[openIndex].text + inner + t.text });
            }
        }
        else if (depth == 0) {
            items.push_back(RewriteItem{ index, index, false, "" });
        }
    }

    auto isOp = [&tokens, &items](size_t i, const char* op) {
        return i < items.size() && !items[i].group && tokens[items[i].first].type == Token::Op && tokens[items[i].first].text == op;
    };

    std::string code;
    if (items.size() == 0) {
        return code;
    }
    int posRow = tokens[items[0].first].row;
    int posCol = tokens[items[0].first].col;
    for (size_t index = 0; index < items.size(); index ++) {
        Token* start = &tokens[items[index].first];
        Token* end = &tokens[items[index].last];
        if (start -> row != posRow) {
            posCol = 0;
            posRow = start -> row;
        }
        int space = start -> col - posCol;
        if (space > 0) {
            code += std::string(space, ' ');
        }
        posRow = start -> row;
        posCol = start -> col;

        if (items[index].group) {
            code += items[index].code;
        }
        else if (start -> type == Token::Name) {
            Token& t = *start;
            if (t.text.find("__") != std::string::npos) {
                throw CompileError("Using variable names with '__' is not allowed: '" + t.text + "'", "SyntaxError");
            }
            if (t.text == "lambda") {
                t.lookup = Token::Verbatim;
                code += "lambda ";
                index ++;
                while (index < items.size()) {
                    end = &tokens[items[index].last];
                    Token& a = tokens[items[index].first];
                    if (!items[index].group && a.type == Token::Name && std::find(argumentNames.begin(), argumentNames.end(), a.text) != argumentNames.end()) {
                        a.lookup = Token::Local;
                        code += argumentName(a.text);
                    }
                    if (isOp(index, ",") || isOp(index, ":")) {
                        code += a.text;
                    }
                    if (isOp(index, ":")) {
                        break;
                    }
                    index ++;
                }
                if (index >= items.size()) {
                    break;
                }
            }
            else if (std::find(argumentNames.begin(), argumentNames.end(), t.text) != argumentNames.end()) {
                t.lookup = Token::Local;
                code += argumentName(t.text);
            }
            else if (isBuiltin(t.text)) {
                t.lookup = Token::Verbatim;
                code += t.text;
            }
            else if (isOp(index + 1, "=")) { // keyword argument
                t.lookup = Token::Verbatim;
                code += t.text;
            }
            else if (index > 0 && isOp(index - 1, ".")) {
                t.lookup = Token::Verbatim;
                code += t.text;
            }
            else if (raiseOnMissing || (index + 1 < items.size() && (items[index + 1].group || isOp(index + 1, ".")))) {
                // values['product'].price fails on 'product' rather than with an attribute error on None
                t.lookup = Token::MustExist;
                code += "values['" + t.text + "']";
            }
            else {
                t.lookup = Token::Get;
                code += "values.get('" + t.text + "')";
            }
        }
        else {
            code += start -> text;
        }

        if (end -> endRow != posRow) {
            posRow = end -> endRow;
            posCol = 0;
        }
        else {
            posCol = end -> endCol;
        }
    }
    return code;
}

std::string rewrite(std::vector<Token>& tokens, bool raiseOnMissing) {
    return rewriteLevel(tokens, 0, tokens.size(), {}, raiseOnMissing);
}
