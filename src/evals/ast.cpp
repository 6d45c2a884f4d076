#include <evals/ast.hpp>
#include <evals/evals.hpp>
#include <evals/ops.hpp>
#include <evals/builtins.hpp>
#include <errors.hpp>


const Value* Locals::find(const std::string& name) const {
    for (const Locals* l = this; l != NULL; l = l -> parent.get()) {
        for (auto& binding : l -> names) {
            if (binding.first == name) {
                return &binding.second;
            }
        }
    }
    return NULL;
}


Value LiteralNode::eval(const Expression* owner, const Scope& scope) const {
    return value;
}


Value NameNode::eval(const Expression* owner, const Scope& scope) const {
    switch (lookup) {
        case Token::Local: {
            const Value* found = scope.locals ? scope.locals -> find(name) : NULL;
            if (found == NULL) {
                throw EvalError("NameError", "name '" + name + "' is not defined");
            }
            return *found;
        }
        case Token::Verbatim:
            return builtin(name);
        case Token::MustExist: {
            const Value* found = scope.values -> find(name);
            if (found == NULL) {
                throw EvalError("KeyError", "'" + name + "'");
            }
            return *found;
        }
        default:
            return scope.values -> get(name);
    }
}


Value AttributeNode::eval(const Expression* owner, const Scope& scope) const {
    return getAttribute(object -> eval(owner, scope), name);
}

void AttributeNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(object);
}


Value SliceNode::eval(const Expression* owner, const Scope& scope) const {
    throw EvalError("TypeError", "a slice only makes sense inside []");
}

void SliceNode::children(std::vector<const ExprNode*>& out) const {
    for (ExprNode* n : { lower, upper, step }) {
        if (n != NULL) {
            out.push_back(n);
        }
    }
}


Value SubscriptNode::eval(const Expression* owner, const Scope& scope) const {
    Value obj = object -> eval(owner, scope);
    if (index -> kind == Slice) {
        const SliceNode* s = (const SliceNode*)index;
        Value lo = s -> lower ? s -> lower -> eval(owner, scope) : Value::none();
        Value hi = s -> upper ? s -> upper -> eval(owner, scope) : Value::none();
        Value by = s -> step ? s -> step -> eval(owner, scope) : Value::none();
        return sliceOf(obj, lo, hi, by);
    }
    return subscript(obj, index -> eval(owner, scope));
}

void SubscriptNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(object);
    out.push_back(index);
}


Value StarredNode::eval(const Expression* owner, const Scope& scope) const {
    return value -> eval(owner, scope);
}

void StarredNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(value);
}


static void evalElements(const Expression* owner, const Scope& scope, const std::vector<ExprNode*>& elements, Sequence& out) {
    for (ExprNode* e : elements) {
        if (e -> kind == ExprNode::Starred) {
            Sequence expanded = iterate(e -> eval(owner, scope));
            out.insert(out.end(), expanded.begin(), expanded.end());
        }
        else {
            out.push_back(e -> eval(owner, scope));
        }
    }
}

Value CallNode::eval(const Expression* owner, const Scope& scope) const {
    Value f = function -> eval(owner, scope);
    Sequence callArgs;
    evalElements(owner, scope, args, callArgs);
    Kwargs callKwargs;
    for (auto& kw : keywords) {
        Value v = kw.second -> eval(owner, scope);
        if (kw.first.size() == 0) {
            if (v.kind != Value::Dict) {
                throw EvalError("TypeError", "argument after ** must be a mapping, not " + v.typeName());
            }
            for (auto& item : v.map -> items) {
                callKwargs.push_back(item);
            }
        }
        else {
            callKwargs.push_back({ kw.first, v });
        }
    }
    return callValue(f, callArgs, callKwargs);
}

void CallNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(function);
    out.insert(out.end(), args.begin(), args.end());
    for (auto& kw : keywords) {
        out.push_back(kw.second);
    }
}


Value BinOpNode::eval(const Expression* owner, const Scope& scope) const {
    Value l = left -> eval(owner, scope);
    Value r = right -> eval(owner, scope);
    return binaryOp(op, l, r);
}

void BinOpNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(left);
    out.push_back(right);
}


Value BoolOpNode::eval(const Expression* owner, const Scope& scope) const {
    Value v;
    for (ExprNode* e : values) {
        v = e -> eval(owner, scope);
        if (v.truthy() != isAnd) {
            return v;
        }
    }
    return v;
}

void BoolOpNode::children(std::vector<const ExprNode*>& out) const {
    out.insert(out.end(), values.begin(), values.end());
}


Value UnaryOpNode::eval(const Expression* owner, const Scope& scope) const {
    return unaryOp(op, operand -> eval(owner, scope));
}

void UnaryOpNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(operand);
}


Value CompareNode::eval(const Expression* owner, const Scope& scope) const {
    Value l = left -> eval(owner, scope);
    for (size_t n = 0; n < ops.size(); n ++) {
        Value r = comparators[n] -> eval(owner, scope);
        if (!compareOp(ops[n], l, r)) {
            return Value::boolean(false);
        }
        l = r;
    }
    return Value::boolean(true);
}

void CompareNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(left);
    out.insert(out.end(), comparators.begin(), comparators.end());
}


Value IfExpNode::eval(const Expression* owner, const Scope& scope) const {
    return test -> eval(owner, scope).truthy() ? body -> eval(owner, scope) : orelse -> eval(owner, scope);
}

void IfExpNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(test);
    out.push_back(body);
    out.push_back(orelse);
}


Value LambdaNode::eval(const Expression* owner, const Scope& scope) const {
    return Value::function(std::make_shared<LambdaFunction>(owner -> shared_from_this(), this, scope));
}

void LambdaNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(body);
}


LambdaFunction::LambdaFunction(std::shared_ptr<const Expression> o, const LambdaNode* n, Scope s) : owner(o), node(n), scope(s) {
    name = "<lambda>";
}

Value LambdaFunction::call(Sequence& args, Kwargs& kwargs) {
    if (args.size() > node -> params.size()) {
        throw EvalError("TypeError", "<lambda>() takes " + std::to_string(node -> params.size()) + " positional arguments but " + std::to_string(args.size()) + " were given");
    }
    auto locals = std::make_shared<Locals>();
    locals -> parent = scope.locals;
    for (size_t n = 0; n < node -> params.size(); n ++) {
        const std::string& param = node -> params[n];
        if (n < args.size()) {
            locals -> names.push_back({ param, args[n] });
            continue;
        }
        bool found = false;
        for (auto& kw : kwargs) {
            if (kw.first == param) {
                locals -> names.push_back({ param, kw.second });
                found = true;
            }
        }
        if (!found) {
            throw EvalError("TypeError", "<lambda>() missing required positional argument: '" + param + "'");
        }
    }
    for (auto& kw : kwargs) {
        bool known = false;
        for (size_t n = args.size(); n < node -> params.size(); n ++) {
            if (node -> params[n] == kw.first) {
                known = true;
            }
        }
        if (!known) {
            throw EvalError("TypeError", "<lambda>() got an unexpected keyword argument '" + kw.first + "'");
        }
    }
    Scope inner{ scope.values, locals };
    return node -> body -> eval(owner.get(), inner);
}


void ComprehensionNode::run(const Expression* owner, const Scope& scope, size_t generator, Sequence& out, Mapping& dict) const {
    if (generator == generators.size()) {
        if (produces == DictOf) {
            Value k = element -> eval(owner, scope);
            dict.set(keyOf(k), value -> eval(owner, scope));
        }
        else {
            out.push_back(element -> eval(owner, scope));
        }
        return;
    }
    const Generator& g = generators[generator];
    for (Value& item : iterate(g.iter -> eval(owner, scope))) {
        auto locals = std::make_shared<Locals>();
        locals -> parent = scope.locals;
        if (g.unpack) {
            Sequence parts = iterate(item);
            if (parts.size() < g.targets.size()) {
                throw EvalError("ValueError", "not enough values to unpack (expected " + std::to_string(g.targets.size()) + ", got " + std::to_string(parts.size()) + ")");
            }
            if (parts.size() > g.targets.size()) {
                throw EvalError("ValueError", "too many values to unpack (expected " + std::to_string(g.targets.size()) + ")");
            }
            for (size_t n = 0; n < parts.size(); n ++) {
                locals -> names.push_back({ g.targets[n], parts[n] });
            }
        }
        else {
            locals -> names.push_back({ g.targets[0], item });
        }
        Scope inner{ scope.values, locals };
        bool keep = true;
        for (ExprNode* condition : g.conditions) {
            if (!condition -> eval(owner, inner).truthy()) {
                keep = false;
                break;
            }
        }
        if (keep) {
            run(owner, inner, generator + 1, out, dict);
        }
    }
}

Value ComprehensionNode::eval(const Expression* owner, const Scope& scope) const {
    Sequence out;
    Mapping dict;
    run(owner, scope, 0, out, dict);
    if (produces == DictOf) {
        return Value::dict(dict);
    }
    if (produces == SetOf) {
        return callBuiltin("set", { Value::list(out) });
    }
    return Value::list(out);
}

void ComprehensionNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(element);
    if (value != NULL) {
        out.push_back(value);
    }
    for (const Generator& g : generators) {
        out.push_back(g.iter);
        out.insert(out.end(), g.conditions.begin(), g.conditions.end());
    }
}


Value DisplayNode::eval(const Expression* owner, const Scope& scope) const {
    Sequence out;
    evalElements(owner, scope, elements, out);
    if (unique) {
        return callBuiltin("set", { Value::list(out) });
    }
    return produces == Value::Tuple ? Value::tuple(out) : Value::list(out);
}

void DisplayNode::children(std::vector<const ExprNode*>& out) const {
    out.insert(out.end(), elements.begin(), elements.end());
}


Value DictDisplayNode::eval(const Expression* owner, const Scope& scope) const {
    Value ret = Value::dict();
    for (size_t n = 0; n < keys.size(); n ++) {
        if (keys[n] == NULL) {
            Value other = values[n] -> eval(owner, scope);
            if (other.kind != Value::Dict) {
                throw EvalError("TypeError", "'" + other.typeName() + "' object is not a mapping");
            }
            ret.map -> update(*other.map);
            continue;
        }
        Value k = keys[n] -> eval(owner, scope);
        ret.map -> set(keyOf(k), values[n] -> eval(owner, scope));
    }
    return ret;
}

void DictDisplayNode::children(std::vector<const ExprNode*>& out) const {
    for (size_t n = 0; n < keys.size(); n ++) {
        if (keys[n] != NULL) {
            out.push_back(keys[n]);
        }
        out.push_back(values[n]);
    }
}


Value NamedExprNode::eval(const Expression* owner, const Scope& scope) const {
    throw EvalError("SyntaxError", "assignment expressions are not allowed");
}

void NamedExprNode::children(std::vector<const ExprNode*>& out) const {
    out.push_back(value);
}
