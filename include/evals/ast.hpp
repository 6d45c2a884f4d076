// typed expression trees. The parser only knows how to build the node kinds below, and the validator checks every tree against
// an allow-list of them before anything gets evaluated. Nodes are owned by the Expression that parsed them (see evals.hpp).
#pragma once
#include <evals/value.hpp>
#include <evals/tokens.hpp>
#include <memory>
#include <string>
#include <vector>


struct Locals { // lambda arguments and comprehension targets, innermost first
    std::shared_ptr<const Locals> parent;
    Kwargs names;

    const Value* find(const std::string& name) const;
};


struct Scope {
    std::shared_ptr<Mapping> values;
    std::shared_ptr<const Locals> locals;
};


struct ExprNode {
    enum Kind {
        Literal,
        Name,
        Attribute,
        Subscript,
        Slice,
        Call,
        Starred,
        BinOp,
        BoolOp,
        UnaryOp,
        Compare,
        IfExp,
        Lambda,
        Comprehension,
        Display, // list, tuple and set displays
        DictDisplay,
        NamedExpr // (x := 1) parses, but never validates
    } kind;

    ExprNode(Kind k) : kind(k) {}

    virtual ~ExprNode() {}

    virtual Value eval(const Expression* owner, const Scope& scope) const = 0;

    virtual void children(std::vector<const ExprNode*>& out) const {}
};


struct LiteralNode : ExprNode {
    Value value;

    LiteralNode(Value v) : ExprNode(Literal), value(v) {}

    Value eval(const Expression* owner, const Scope& scope) const;
};


struct NameNode : ExprNode {
    std::string name;
    Token::Lookup lookup;

    NameNode(std::string n, Token::Lookup l) : ExprNode(Name), name(n), lookup(l) {}

    Value eval(const Expression* owner, const Scope& scope) const;
};


struct AttributeNode : ExprNode {
    ExprNode* object;
    std::string name;

    AttributeNode(ExprNode* o, std::string n) : ExprNode(Attribute), object(o), name(n) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct SliceNode : ExprNode { // only ever the index of a SubscriptNode
    ExprNode* lower;
    ExprNode* upper;
    ExprNode* step;

    SliceNode(ExprNode* l, ExprNode* u, ExprNode* s) : ExprNode(Slice), lower(l), upper(u), step(s) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct SubscriptNode : ExprNode {
    ExprNode* object;
    ExprNode* index;

    SubscriptNode(ExprNode* o, ExprNode* i) : ExprNode(Subscript), object(o), index(i) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct StarredNode : ExprNode { // *args in calls and displays; **kwargs in calls when doubled
    ExprNode* value;
    bool doubled;

    StarredNode(ExprNode* v, bool d) : ExprNode(Starred), value(v), doubled(d) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct CallNode : ExprNode {
    ExprNode* function;
    std::vector<ExprNode*> args;
    std::vector<std::pair<std::string, ExprNode*>> keywords; // a StarredNode with an empty name for **kwargs

    CallNode(ExprNode* f) : ExprNode(Call), function(f) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct BinOpNode : ExprNode {
    std::string op;
    ExprNode* left;
    ExprNode* right;

    BinOpNode(std::string o, ExprNode* l, ExprNode* r) : ExprNode(BinOp), op(o), left(l), right(r) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct BoolOpNode : ExprNode { // and/or: returns the deciding operand, not a bool
    bool isAnd;
    std::vector<ExprNode*> values;

    BoolOpNode(bool a) : ExprNode(BoolOp), isAnd(a) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct UnaryOpNode : ExprNode {
    std::string op;
    ExprNode* operand;

    UnaryOpNode(std::string o, ExprNode* v) : ExprNode(UnaryOp), op(o), operand(v) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct CompareNode : ExprNode { // a < b <= c
    ExprNode* left;
    std::vector<std::string> ops;
    std::vector<ExprNode*> comparators;

    CompareNode(ExprNode* l) : ExprNode(Compare), left(l) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct IfExpNode : ExprNode {
    ExprNode* test;
    ExprNode* body;
    ExprNode* orelse;

    IfExpNode(ExprNode* t, ExprNode* b, ExprNode* o) : ExprNode(IfExp), test(t), body(b), orelse(o) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct LambdaNode : ExprNode {
    std::vector<std::string> params;
    ExprNode* body;

    LambdaNode() : ExprNode(Lambda), body(NULL) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct Generator { // for <targets> in <iter> if <cond>...
    std::vector<std::string> targets;
    bool unpack; // "for a, b in" rather than "for a in"
    ExprNode* iter;
    std::vector<ExprNode*> conditions;
};


struct ComprehensionNode : ExprNode {
    enum Produces {
        ListOf,
        SetOf,
        DictOf,
        GeneratorOf // generator expressions are evaluated eagerly into a list
    } produces;
    ExprNode* element; // the key, for dicts
    ExprNode* value; // dicts only
    std::vector<Generator> generators;

    ComprehensionNode(Produces p) : ExprNode(Comprehension), produces(p), element(NULL), value(NULL) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;

private:
    void run(const Expression* owner, const Scope& scope, size_t generator, Sequence& out, Mapping& dict) const;
};


struct DisplayNode : ExprNode {
    Value::Kind produces; // List or Tuple
    bool unique; // a set display: a list without the duplicates
    std::vector<ExprNode*> elements;

    DisplayNode(Value::Kind p, bool u = false) : ExprNode(Display), produces(p), unique(u) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct DictDisplayNode : ExprNode {
    std::vector<ExprNode*> keys; // NULL key: **other
    std::vector<ExprNode*> values;

    DictDisplayNode() : ExprNode(DictDisplay) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct NamedExprNode : ExprNode {
    std::string target;
    ExprNode* value;

    NamedExprNode(std::string t, ExprNode* v) : ExprNode(NamedExpr), target(t), value(v) {}

    Value eval(const Expression* owner, const Scope& scope) const;

    void children(std::vector<const ExprNode*>& out) const;
};


struct LambdaFunction : Callable {
    std::shared_ptr<const Expression> owner; // keeps the tree alive as long as the function value is
    const LambdaNode* node;
    Scope scope;

    LambdaFunction(std::shared_ptr<const Expression> owner, const LambdaNode* node, Scope scope);

    Value call(Sequence& args, Kwargs& kwargs);
};
