// the functions templates can call without going through the values dict, and the methods of the builtin types
#pragma once
#include <evals/value.hpp>
#include <string>


struct BuiltinFunction : Callable {
    typedef Value (*Impl)(Sequence& args, Kwargs& kwargs);

    Impl impl;

    BuiltinFunction(std::string name, Impl impl);

    Value call(Sequence& args, Kwargs& kwargs);
};


struct BoundMethod : Callable { // "abc".upper, d.items, l.append
    Value self;

    BoundMethod(Value self, std::string name);

    Value call(Sequence& args, Kwargs& kwargs);
};


bool isBuiltin(const std::string& name); // names the expression compiler leaves alone (keywords included)

Value builtin(const std::string& name); // NameError if there's no such function

Value callBuiltin(const std::string& name, Sequence args);

bool hasMethod(const Value& v, const std::string& name);

Value callValue(const Value& f, Sequence& args, Kwargs& kwargs); // TypeError if f isn't callable

Sequence sortValues(Sequence items, const Value& key, bool reverse); // stable, like python's sorted
