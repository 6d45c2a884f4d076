// json.dumps and json.loads for templates. Output matches python's json module with its defaults: ", " and ": " separators,
// non-ASCII escaped, NaN and Infinity written out.
#pragma once
#include <evals/value.hpp>
#include <string>


std::string dumpJson(const Value& v, const std::string& indent = "", bool indented = false, bool sortKeys = false); // throws TypeError for functions

Value loadJson(const std::string& text); // throws JSONDecodeError
