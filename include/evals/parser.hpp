// builds the typed tree out of the rewritten tokens. The grammar is the expression part of python's; anything that isn't an
// expression (statements, assignment, semicolons) fails to parse, and the validator rejects the rest.
#pragma once
#include <evals/ast.hpp>
#include <evals/tokens.hpp>
#include <string>
#include <vector>


struct ExprParser {
    Expression* target; // receives every node built
    std::vector<const Token*> tokens; // newlines and comments dropped
    size_t pos = 0;

    ExprParser(Expression* target, const std::vector<Token>& all);

    ExprNode* parse(); // throws CompileError

private:
    template <typename T>
    T* make(T* node);

    [[noreturn]] void fail(const std::string& why = "invalid syntax");

    const Token* peek(size_t ahead = 0);

    bool isOp(const char* op, size_t ahead = 0);

    bool isKeyword(const char* word, size_t ahead = 0);

    bool acceptOp(const char* op);

    bool acceptKeyword(const char* word);

    void expectOp(const char* op);

    bool atExpressionEnd(); // a closing bracket, a comma, a colon, the end

    ExprNode* test();

    ExprNode* namedTest(); // test, or name := test

    ExprNode* lambda();

    ExprNode* orTest();

    ExprNode* andTest();

    ExprNode* notTest();

    ExprNode* comparison();

    ExprNode* binary(int level);

    ExprNode* factor();

    ExprNode* power();

    ExprNode* trailers(ExprNode* node);

    ExprNode* subscriptItem();

    ExprNode* atom();

    ExprNode* number(const std::string& text);

    ExprNode* strings();

    ExprNode* starOrTest(); // display elements and call arguments can be *starred

    void comprehension(ComprehensionNode* node);

    ExprNode* parenthesized();

    ExprNode* bracketed();

    ExprNode* braced();

    ExprNode* call(ExprNode* function);
};


void validate(const Expression& expr); // the allow-list walk. throws CompileError

std::string decodeStringLiteral(const std::string& token); // 'a\tb', r"x", u'''y''' -> the value
