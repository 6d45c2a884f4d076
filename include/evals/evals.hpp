// The template expression language: a sandboxed subset of python expressions.
// An expression is compiled exactly once (tokens, namespacing, parse, validation) and then evaluated directly against the
// render values. Nothing is ever handed to an interpreter.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <evals/ast.hpp>
#include <memory>
#include <string>
#include <vector>


struct Expression : std::enable_shared_from_this<Expression> {
    std::string source; // as written in the template
    std::string rewritten; // the namespaced python equivalent: (5 + values.get('a') + values['b'].c)
    ExprNode* root = NULL;
    std::vector<ExprNode*> nodes; // every node of the tree, owned

    Expression() {}

    Expression(const Expression&) = delete;

    Expression& operator=(const Expression&) = delete;

    ~Expression();

    Value eval(std::shared_ptr<Mapping> values) const;
};


struct FormatString { // "Hello #{name}" and "Hello {{name}}"
    std::string source;
    std::vector<std::string> literals; // always one more than parts
    std::vector<std::shared_ptr<Expression>> parts;

    std::string render(std::shared_ptr<Mapping> values) const;
};


std::shared_ptr<Expression> compileExpression(const std::string& expr, bool raiseOnMissing = false); // throws CompileError

std::shared_ptr<FormatString> compileFormat(const std::string& format); // throws CompileError

std::string toText(const Value& v); // None and False are '', the rest is str()

bool compileBool(const std::string& attr, bool fallback = false); // "true"/"1" and "false"/"0", anything else falls back
