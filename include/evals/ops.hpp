// operations on Values. Everything here either returns a fresh Value or throws an EvalError named after the matching python
// exception (TypeError, KeyError, IndexError, ValueError, ZeroDivisionError, AttributeError).
#pragma once
#include <evals/value.hpp>
#include <string>


Value binaryOp(const std::string& op, const Value& a, const Value& b); // + - * / // % ** & | ^ << >>

Value unaryOp(const std::string& op, const Value& a); // - + ~ not

bool compareOp(const std::string& op, const Value& a, const Value& b); // == != < <= > >= in "not in" is "is not"

bool contains(const Value& container, const Value& item);

bool identical(const Value& a, const Value& b);

Value subscript(const Value& obj, const Value& key);

Value sliceOf(const Value& obj, const Value& start, const Value& stop, const Value& step); // None for a bound that wasn't given

Value getAttribute(const Value& obj, const std::string& name);

Sequence iterate(const Value& v);

int64_t length(const Value& v);

int64_t toIndex(const Value& v, const std::string& what); // ints (and bools) only

std::string percentFormat(const std::string& format, const Value& args, bool safe); // "%s: %d" % (a, b). safe: arguments get escaped

std::string formatMethod(const std::string& format, const Sequence& args, const Kwargs& kwargs, bool safe); // "{}: {name}".format(...)

std::string formatSpec(const Value& v, const std::string& spec); // format(v, ".2f")
