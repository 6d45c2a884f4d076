#include <evals/builtins.hpp>
#include <evals/ops.hpp>
#include <evals/json.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>


static const std::set<std::string> verbatim = {
    "False", "None", "True", "and", "as", "elif", "else", "for", "if", "in", "is", "not", "or",
    // the builtin table of the sandbox; a few of these exist only so that templates written against it keep compiling
    "datetime", "time", "relativedelta", "bytes", "str", "unicode", "bool", "int", "float", "enumerate", "dict", "list",
    "tuple", "map", "abs", "min", "max", "sum", "reduce", "filter", "sorted", "round", "len", "repr", "set", "all", "any",
    "ord", "chr", "divmod", "isinstance", "range", "xrange", "zip", "Exception"
};


static Value argument(Sequence& args, Kwargs& kwargs, size_t index, const std::string& name, const Value& fallback, bool* given = NULL) {
    if (given != NULL) {
        *given = true;
    }
    if (index < args.size()) {
        return args[index];
    }
    for (auto& kw : kwargs) {
        if (kw.first == name) {
            return kw.second;
        }
    }
    if (given != NULL) {
        *given = false;
    }
    return fallback;
}

static void expectArgs(const std::string& fn, Sequence& args, size_t least, size_t most) {
    if (args.size() < least) {
        throw EvalError("TypeError", fn + "() takes at least " + std::to_string(least) + " argument" + (least == 1 ? "" : "s") + " (" + std::to_string(args.size()) + " given)");
    }
    if (args.size() > most) {
        throw EvalError("TypeError", fn + "() takes at most " + std::to_string(most) + " argument" + (most == 1 ? "" : "s") + " (" + std::to_string(args.size()) + " given)");
    }
}

static Value call1(const Value& f, const Value& arg) {
    Sequence args = { arg };
    Kwargs kwargs;
    return callValue(f, args, kwargs);
}

static int64_t integerOf(const Value& v) {
    return v.kind == Value::Bool ? (int64_t)v.b : v.i;
}


static int64_t integralOf(double d) { // the int() of a float, when it fits
    if (!std::isfinite(d)) {
        throw EvalError(std::isnan(d) ? "ValueError" : "OverflowError", "cannot convert float " + floatRepr(d) + " to integer");
    }
    if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
        throw EvalError("OverflowError", "int too large to convert: " + floatRepr(d));
    }
    return (int64_t)d;
}

static Value builtinStr(Sequence& args, Kwargs& kwargs) {
    expectArgs("str", args, 0, 1);
    return Value::str(args.size() ? args[0].toString() : "");
}

static Value builtinBool(Sequence& args, Kwargs& kwargs) {
    expectArgs("bool", args, 0, 1);
    return Value::boolean(args.size() ? args[0].truthy() : false);
}

static Value builtinInt(Sequence& args, Kwargs& kwargs) {
    expectArgs("int", args, 0, 2);
    Value x = argument(args, kwargs, 0, "x", Value::integer(0));
    int base = (int)integerOf(argument(args, kwargs, 1, "base", Value::integer(10)));
    if (x.isNumeric()) {
        if (x.kind == Value::Float) {
            return Value::integer(integralOf(x.f));
        }
        return Value::integer(integerOf(x));
    }
    if (x.isText()) {
        std::string text = stripWhitespace(x.toString());
        char* end = NULL;
        errno = 0;
        long long n = strtoll(text.c_str(), &end, base);
        if (text.size() == 0 || *end != 0) {
            throw EvalError("ValueError", "invalid literal for int() with base " + std::to_string(base) + ": " + x.repr());
        }
        if (errno == ERANGE) {
            throw EvalError("OverflowError", "int too large to convert: " + x.repr());
        }
        return Value::integer(n);
    }
    throw EvalError("TypeError", "int() argument must be a string, a bytes-like object or a real number, not '" + x.typeName() + "'");
}

static Value builtinFloat(Sequence& args, Kwargs& kwargs) {
    expectArgs("float", args, 0, 1);
    if (args.size() == 0) {
        return Value::number(0);
    }
    Value x = args[0];
    if (x.isNumeric()) {
        return Value::number(x.asDouble());
    }
    if (x.isText()) {
        std::string text = toLower(stripWhitespace(x.toString()));
        if (text == "inf" || text == "+inf" || text == "infinity") return Value::number(INFINITY);
        if (text == "-inf" || text == "-infinity") return Value::number(-INFINITY);
        if (text == "nan") return Value::number(NAN);
        char* end = NULL;
        double d = strtod(text.c_str(), &end);
        if (text.size() == 0 || *end != 0 || text.find_first_of("xp") != std::string::npos) {
            throw EvalError("ValueError", "could not convert string to float: " + x.repr());
        }
        return Value::number(d);
    }
    throw EvalError("TypeError", "float() argument must be a string or a real number, not '" + x.typeName() + "'");
}

static Value builtinEnumerate(Sequence& args, Kwargs& kwargs) {
    Value it = argument(args, kwargs, 0, "iterable", Value::none());
    int64_t start = integerOf(argument(args, kwargs, 1, "start", Value::integer(0)));
    Sequence ret;
    for (Value& v : iterate(it)) {
        ret.push_back(Value::tuple({ Value::integer(start ++), v }));
    }
    return Value::list(ret);
}

static Value builtinDict(Sequence& args, Kwargs& kwargs) {
    expectArgs("dict", args, 0, 1);
    Value ret = Value::dict();
    if (args.size()) {
        if (args[0].kind == Value::Dict) {
            ret.map -> update(*args[0].map);
        }
        else {
            for (Value& pair : iterate(args[0])) {
                Sequence kv = iterate(pair);
                if (kv.size() != 2) {
                    throw EvalError("ValueError", "dictionary update sequence element has length " + std::to_string(kv.size()) + "; 2 is required");
                }
                ret.map -> set(keyOf(kv[0]), kv[1]);
            }
        }
    }
    for (auto& kw : kwargs) {
        ret.map -> set(kw.first, kw.second);
    }
    return ret;
}

static Value builtinList(Sequence& args, Kwargs& kwargs) {
    expectArgs("list", args, 0, 1);
    return Value::list(args.size() ? iterate(args[0]) : Sequence());
}

static Value builtinTuple(Sequence& args, Kwargs& kwargs) {
    expectArgs("tuple", args, 0, 1);
    return Value::tuple(args.size() ? iterate(args[0]) : Sequence());
}

static Value builtinSet(Sequence& args, Kwargs& kwargs) { // sets come out as lists with the duplicates dropped, first occurrence first
    expectArgs("set", args, 0, 1);
    Sequence ret;
    if (args.size()) {
        for (Value& v : iterate(args[0])) {
            bool seen = false;
            for (Value& existing : ret) {
                if (existing.equals(v)) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                ret.push_back(v);
            }
        }
    }
    return Value::list(ret);
}

static Value builtinMap(Sequence& args, Kwargs& kwargs) {
    expectArgs("map", args, 2, 64);
    std::vector<Sequence> iterables;
    size_t shortest = SIZE_MAX;
    for (size_t n = 1; n < args.size(); n ++) {
        iterables.push_back(iterate(args[n]));
        shortest = std::min(shortest, iterables.back().size());
    }
    Sequence ret;
    for (size_t n = 0; n < shortest; n ++) {
        Sequence callArgs;
        for (Sequence& it : iterables) {
            callArgs.push_back(it[n]);
        }
        Kwargs none;
        ret.push_back(callValue(args[0], callArgs, none));
    }
    return Value::list(ret);
}

static Value builtinFilter(Sequence& args, Kwargs& kwargs) {
    expectArgs("filter", args, 2, 2);
    Sequence ret;
    for (Value& v : iterate(args[1])) {
        bool keep = args[0].isNone() ? v.truthy() : call1(args[0], v).truthy();
        if (keep) {
            ret.push_back(v);
        }
    }
    return Value::list(ret);
}

static Value builtinAbs(Sequence& args, Kwargs& kwargs) {
    expectArgs("abs", args, 1, 1);
    Value x = args[0];
    if (x.kind == Value::Float) {
        return Value::number(std::fabs(x.f));
    }
    if (x.isNumeric()) {
        int64_t n = integerOf(x);
        if (n == INT64_MIN) {
            throw EvalError("OverflowError", "abs() of the smallest integer does not fit in 64 bits");
        }
        return Value::integer(n < 0 ? -n : n);
    }
    throw EvalError("TypeError", "bad operand type for abs(): '" + x.typeName() + "'");
}

static Value extreme(const std::string& fn, Sequence& args, Kwargs& kwargs, bool wantMax) {
    if (args.size() == 0) {
        throw EvalError("TypeError", fn + " expected at least 1 argument, got 0");
    }
    Sequence items = args.size() == 1 ? iterate(args[0]) : args;
    bool hasDefault;
    Value fallback = argument(args, kwargs, SIZE_MAX, "default", Value::none(), &hasDefault);
    Value key = argument(args, kwargs, SIZE_MAX, "key", Value::none());
    if (items.size() == 0) {
        if (hasDefault) {
            return fallback;
        }
        throw EvalError("ValueError", fn + "() arg is an empty sequence");
    }
    Value best = items[0];
    Value bestKey = key.isNone() ? best : call1(key, best);
    for (size_t n = 1; n < items.size(); n ++) {
        Value k = key.isNone() ? items[n] : call1(key, items[n]);
        if (compareOp(wantMax ? ">" : "<", k, bestKey)) {
            best = items[n];
            bestKey = k;
        }
    }
    return best;
}

static Value builtinMin(Sequence& args, Kwargs& kwargs) {
    return extreme("min", args, kwargs, false);
}

static Value builtinMax(Sequence& args, Kwargs& kwargs) {
    return extreme("max", args, kwargs, true);
}

static Value builtinSum(Sequence& args, Kwargs& kwargs) {
    expectArgs("sum", args, 1, 2);
    Value total = argument(args, kwargs, 1, "start", Value::integer(0));
    if (total.isText()) {
        throw EvalError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    }
    for (Value& v : iterate(args[0])) {
        total = binaryOp("+", total, v);
    }
    return total;
}

static Value builtinReduce(Sequence& args, Kwargs& kwargs) {
    expectArgs("reduce", args, 2, 3);
    Sequence items = iterate(args[1]);
    size_t n = 0;
    Value acc;
    if (args.size() == 3) {
        acc = args[2];
    }
    else if (items.size()) {
        acc = items[n ++];
    }
    else {
        throw EvalError("TypeError", "reduce() of empty iterable with no initial value");
    }
    for (; n < items.size(); n ++) {
        Sequence callArgs = { acc, items[n] };
        Kwargs none;
        acc = callValue(args[0], callArgs, none);
    }
    return acc;
}

static Value builtinSorted(Sequence& args, Kwargs& kwargs) {
    expectArgs("sorted", args, 1, 1);
    Value key = argument(args, kwargs, SIZE_MAX, "key", Value::none());
    bool reverse = argument(args, kwargs, SIZE_MAX, "reverse", Value::boolean(false)).truthy();
    return Value::list(sortValues(iterate(args[0]), key, reverse));
}

static Value builtinRound(Sequence& args, Kwargs& kwargs) {
    expectArgs("round", args, 1, 2);
    Value x = args[0];
    bool hasDigits;
    Value digits = argument(args, kwargs, 1, "ndigits", Value::none(), &hasDigits);
    if (!x.isNumeric()) {
        throw EvalError("TypeError", "type " + x.typeName() + " doesn't define __round__ method");
    }
    if (!hasDigits || digits.isNone()) {
        return Value::integer(integralOf(std::nearbyint(x.asDouble()))); // ties to even, like python
    }
    int64_t nd = integerOf(digits);
    if (x.kind != Value::Float) {
        if (nd >= 0) {
            return Value::integer(integerOf(x));
        }
        double scale = std::pow(10.0, (double)-nd);
        return Value::integer(integralOf(std::nearbyint(integerOf(x) / scale) * scale));
    }
    double scale = std::pow(10.0, (double)nd);
    double rounded = std::nearbyint(x.f * scale) / scale;
    return Value::number(std::isfinite(rounded) ? rounded : x.f);
}

static Value builtinLen(Sequence& args, Kwargs& kwargs) {
    expectArgs("len", args, 1, 1);
    return Value::integer(length(args[0]));
}

static Value builtinRepr(Sequence& args, Kwargs& kwargs) {
    expectArgs("repr", args, 1, 1);
    return Value::str(args[0].repr());
}

static Value builtinAll(Sequence& args, Kwargs& kwargs) {
    expectArgs("all", args, 1, 1);
    for (Value& v : iterate(args[0])) {
        if (!v.truthy()) {
            return Value::boolean(false);
        }
    }
    return Value::boolean(true);
}

static Value builtinAny(Sequence& args, Kwargs& kwargs) {
    expectArgs("any", args, 1, 1);
    for (Value& v : iterate(args[0])) {
        if (v.truthy()) {
            return Value::boolean(true);
        }
    }
    return Value::boolean(false);
}

static Value builtinOrd(Sequence& args, Kwargs& kwargs) {
    expectArgs("ord", args, 1, 1);
    if (!args[0].isText()) {
        throw EvalError("TypeError", "ord() expected string of length 1, but " + args[0].typeName() + " found");
    }
    std::string c = args[0].toString();
    if (utf8Length(c) != 1) {
        throw EvalError("TypeError", "ord() expected a character, but string of length " + std::to_string(utf8Length(c)) + " found");
    }
    unsigned char lead = c[0];
    uint32_t cp;
    if (lead < 0x80) cp = lead;
    else if (lead < 0xE0) cp = lead & 0x1F;
    else if (lead < 0xF0) cp = lead & 0x0F;
    else cp = lead & 0x07;
    for (size_t n = 1; n < c.size(); n ++) {
        cp = (cp << 6) | (c[n] & 0x3F);
    }
    return Value::integer(cp);
}

static Value builtinChr(Sequence& args, Kwargs& kwargs) {
    expectArgs("chr", args, 1, 1);
    if (args[0].kind != Value::Int && args[0].kind != Value::Bool) {
        throw EvalError("TypeError", "'" + args[0].typeName() + "' object cannot be interpreted as an integer");
    }
    int64_t cp = integerOf(args[0]);
    if (cp < 0 || cp > 0x10FFFF) {
        throw EvalError("ValueError", "chr() arg not in range(0x110000)");
    }
    std::string out;
    appendUtf8(out, (uint32_t)cp);
    return Value::str(out);
}

static Value builtinDivmod(Sequence& args, Kwargs& kwargs) {
    expectArgs("divmod", args, 2, 2);
    return Value::tuple({ binaryOp("//", args[0], args[1]), binaryOp("%", args[0], args[1]) });
}

static Value builtinRange(Sequence& args, Kwargs& kwargs) {
    expectArgs("range", args, 1, 3);
    int64_t start = 0, stop, step = 1;
    if (args.size() == 1) {
        stop = toIndex(args[0], "range");
    }
    else {
        start = toIndex(args[0], "range");
        stop = toIndex(args[1], "range");
        if (args.size() == 3) {
            step = toIndex(args[2], "range");
        }
    }
    if (step == 0) {
        throw EvalError("ValueError", "range() arg 3 must not be zero");
    }
    Sequence ret;
    for (int64_t n = start; step > 0 ? n < stop : n > stop; ) {
        ret.push_back(Value::integer(n));
        if (__builtin_add_overflow(n, step, &n)) {
            break;
        }
    }
    return Value::list(ret);
}

static Value builtinZip(Sequence& args, Kwargs& kwargs) {
    std::vector<Sequence> iterables;
    size_t shortest = args.size() ? SIZE_MAX : 0;
    for (Value& v : args) {
        iterables.push_back(iterate(v));
        shortest = std::min(shortest, iterables.back().size());
    }
    Sequence ret;
    for (size_t n = 0; n < shortest; n ++) {
        Sequence row;
        for (Sequence& it : iterables) {
            row.push_back(it[n]);
        }
        ret.push_back(Value::tuple(row));
    }
    return Value::list(ret);
}

static Value builtinFloor(Sequence& args, Kwargs& kwargs) {
    expectArgs("floor", args, 1, 1);
    if (!args[0].isNumeric()) {
        throw EvalError("TypeError", "must be real number, not " + args[0].typeName());
    }
    return Value::integer(integralOf(std::floor(args[0].asDouble())));
}

static Value builtinCeil(Sequence& args, Kwargs& kwargs) {
    expectArgs("ceil", args, 1, 1);
    if (!args[0].isNumeric()) {
        throw EvalError("TypeError", "must be real number, not " + args[0].typeName());
    }
    return Value::integer(integralOf(std::ceil(args[0].asDouble())));
}


static Value builtinJsonDumps(Sequence& args, Kwargs& kwargs) {
    expectArgs("dumps", args, 0, 1);
    Value obj = argument(args, kwargs, 0, "obj", Value::none());
    Value indent = argument(args, kwargs, SIZE_MAX, "indent", Value::none());
    bool sortKeys = argument(args, kwargs, SIZE_MAX, "sort_keys", Value::boolean(false)).truthy();
    if (indent.isNone()) {
        return Value::str(dumpJson(obj, "", false, sortKeys));
    }
    std::string unit = indent.isText() ? indent.s : std::string(std::max<int64_t>(0, std::min<int64_t>(integerOf(indent), 64)), ' ');
    return Value::str(dumpJson(obj, unit, true, sortKeys));
}

static Value builtinJsonLoads(Sequence& args, Kwargs& kwargs) {
    expectArgs("loads", args, 1, 1);
    if (!args[0].isText()) {
        throw EvalError("TypeError", "the JSON object must be str, not " + args[0].typeName());
    }
    return loadJson(args[0].s);
}

static Value builtinQuotePlus(Sequence& args, Kwargs& kwargs) {
    expectArgs("quote_plus", args, 1, 2);
    std::string safe = argument(args, kwargs, 1, "safe", Value::str("")).toString();
    return Value::str(quotePlus(args[0].toString(), safe));
}


static const std::map<std::string, BuiltinFunction::Impl> table = {
    { "str", builtinStr }, { "unicode", builtinStr }, { "bool", builtinBool }, { "int", builtinInt }, { "float", builtinFloat },
    { "enumerate", builtinEnumerate }, { "dict", builtinDict }, { "list", builtinList }, { "tuple", builtinTuple },
    { "set", builtinSet }, { "map", builtinMap }, { "filter", builtinFilter }, { "abs", builtinAbs }, { "min", builtinMin },
    { "max", builtinMax }, { "sum", builtinSum }, { "reduce", builtinReduce }, { "sorted", builtinSorted },
    { "round", builtinRound }, { "len", builtinLen }, { "repr", builtinRepr }, { "all", builtinAll }, { "any", builtinAny },
    { "ord", builtinOrd }, { "chr", builtinChr }, { "divmod", builtinDivmod }, { "range", builtinRange },
    { "xrange", builtinRange }, { "zip", builtinZip }, { "floor", builtinFloor }, { "ceil", builtinCeil },
    { "json.dumps", builtinJsonDumps }, { "json.loads", builtinJsonLoads }, { "quote_plus", builtinQuotePlus }
};


BuiltinFunction::BuiltinFunction(std::string n, Impl i) : impl(i) {
    name = n;
}

Value BuiltinFunction::call(Sequence& args, Kwargs& kwargs) {
    return impl(args, kwargs);
}

bool isBuiltin(const std::string& name) {
    return verbatim.count(name) > 0;
}

Value builtin(const std::string& name) {
    auto it = table.find(name);
    if (it == table.end()) {
        throw EvalError("NameError", "name '" + name + "' is not defined");
    }
    return Value::function(std::make_shared<BuiltinFunction>(name, it -> second));
}

Value callBuiltin(const std::string& name, Sequence args) {
    Kwargs kwargs;
    return callValue(builtin(name), args, kwargs);
}

Value callValue(const Value& f, Sequence& args, Kwargs& kwargs) {
    if (f.kind != Value::Function) {
        throw EvalError("TypeError", "'" + f.typeName() + "' object is not callable");
    }
    return f.fn -> call(args, kwargs);
}

Sequence sortValues(Sequence items, const Value& key, bool reverse) {
    std::vector<std::pair<Value, size_t>> keyed;
    for (size_t n = 0; n < items.size(); n ++) {
        keyed.push_back({ key.isNone() ? items[n] : call1(key, items[n]), n });
    }
    std::stable_sort(keyed.begin(), keyed.end(), [reverse](const std::pair<Value, size_t>& a, const std::pair<Value, size_t>& b) {
        return reverse ? compareOp("<", b.first, a.first) : compareOp("<", a.first, b.first);
    });
    Sequence ret;
    for (auto& k : keyed) {
        ret.push_back(items[k.second]);
    }
    return ret;
}


static const std::set<std::string> stringMethods = {
    "upper", "lower", "strip", "lstrip", "rstrip", "split", "join", "replace", "startswith", "endswith",
    "capitalize", "title", "find", "count", "isdigit", "zfill", "format"
};

static const std::set<std::string> listMethods = { "append", "index", "count" };

static const std::set<std::string> dictMethods = { "get", "items", "keys", "values" };

bool hasMethod(const Value& v, const std::string& name) {
    switch (v.kind) {
        case Value::Str:
        case Value::Markup:
        case Value::Content: return stringMethods.count(name) > 0;
        case Value::List: return listMethods.count(name) > 0;
        case Value::Tuple: return name == "index" || name == "count";
        case Value::Dict: return dictMethods.count(name) > 0;
        default: return false;
    }
}


BoundMethod::BoundMethod(Value s, std::string n) : self(s) {
    name = n;
}

static std::string stripChars(const std::string& s, const Value& chars, bool left, bool right) {
    std::string set = chars.isNone() ? std::string(" \t\n\r\f\v") : chars.toString();
    size_t from = 0;
    size_t to = s.size();
    if (left) {
        while (from < to && set.find(s[from]) != std::string::npos) from ++;
    }
    if (right) {
        while (to > from && set.find(s[to - 1]) != std::string::npos) to --;
    }
    return s.substr(from, to - from);
}

static Value splitString(const Value& self, const Value& sep, int64_t maxsplit) {
    Sequence ret;
    const std::string& s = self.s;
    auto piece = [&self](const std::string& p) {
        return self.kind == Value::Markup ? Value::markup(p) : Value::str(p);
    };
    if (sep.isNone()) {
        size_t n = 0;
        while (true) {
            while (n < s.size() && isWhitespace(s[n])) n ++;
            if (n >= s.size()) {
                break;
            }
            if (maxsplit >= 0 && (int64_t)ret.size() >= maxsplit) {
                size_t end = s.size();
                while (end > n && isWhitespace(s[end - 1])) end --;
                ret.push_back(piece(s.substr(n, end - n)));
                break;
            }
            size_t start = n;
            while (n < s.size() && !isWhitespace(s[n])) n ++;
            ret.push_back(piece(s.substr(start, n - start)));
        }
        return Value::list(ret);
    }
    std::string separator = sep.toString();
    if (separator.size() == 0) {
        throw EvalError("ValueError", "empty separator");
    }
    size_t start = 0;
    while (true) {
        size_t found = s.find(separator, start);
        if (found == std::string::npos || (maxsplit >= 0 && (int64_t)ret.size() >= maxsplit)) {
            ret.push_back(piece(s.substr(start)));
            break;
        }
        ret.push_back(piece(s.substr(start, found - start)));
        start = found + separator.size();
    }
    return Value::list(ret);
}

static bool affixMatches(const std::string& s, const Value& affix, bool prefix) {
    if (affix.kind == Value::Tuple) {
        for (Value& a : *affix.seq) {
            if (affixMatches(s, a, prefix)) {
                return true;
            }
        }
        return false;
    }
    if (!affix.isText()) {
        throw EvalError("TypeError", std::string(prefix ? "startswith" : "endswith") + " first arg must be str or a tuple of str, not " + affix.typeName());
    }
    return prefix ? startsWith(s, affix.toString()) : endsWith(s, affix.toString());
}

static Value stringMethod(const Value& self, const std::string& name, Sequence& args, Kwargs& kwargs) {
    bool safe = self.kind == Value::Markup;
    auto same = [safe](const std::string& s) { // markup stays markup
        return safe ? Value::markup(s) : Value::str(s);
    };
    auto text = [safe](const Value& v) { // arguments mixed into markup get escaped
        return safe ? v.escaped() : v.toString();
    };
    const std::string& s = self.s;
    if (name == "upper" || name == "lower") {
        std::string ret = s;
        for (char& c : ret) {
            c = name == "upper" ? toupper((unsigned char)c) : tolower((unsigned char)c);
        }
        return same(ret);
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        Value chars = argument(args, kwargs, 0, "chars", Value::none());
        return same(stripChars(s, chars, name != "rstrip", name != "lstrip"));
    }
    if (name == "split") {
        Value sep = argument(args, kwargs, 0, "sep", Value::none());
        int64_t maxsplit = integerOf(argument(args, kwargs, 1, "maxsplit", Value::integer(-1)));
        return splitString(self, sep, maxsplit);
    }
    if (name == "join") {
        expectArgs("join", args, 1, 1);
        std::string ret;
        bool first = true;
        for (Value& v : iterate(args[0])) {
            if (!v.isText()) {
                throw EvalError("TypeError", "sequence item: expected str instance, " + v.typeName() + " found");
            }
            if (!first) {
                ret += s;
            }
            first = false;
            ret += text(v);
        }
        return same(ret);
    }
    if (name == "replace") {
        expectArgs("replace", args, 2, 3);
        std::string from = text(args[0]);
        std::string to = text(args[1]);
        int64_t count = args.size() == 3 ? integerOf(args[2]) : -1;
        std::string ret;
        size_t start = 0;
        while (count != 0) {
            size_t found = from.size() ? s.find(from, start) : std::string::npos;
            if (found == std::string::npos) {
                break;
            }
            ret += s.substr(start, found - start) + to;
            start = found + from.size();
            count --;
        }
        return same(ret + s.substr(start));
    }
    if (name == "startswith" || name == "endswith") {
        expectArgs(name, args, 1, 1);
        return Value::boolean(affixMatches(s, args[0], name == "startswith"));
    }
    if (name == "capitalize") {
        std::string ret = s;
        for (size_t n = 0; n < ret.size(); n ++) {
            ret[n] = n == 0 ? toupper((unsigned char)ret[n]) : tolower((unsigned char)ret[n]);
        }
        return same(ret);
    }
    if (name == "title") {
        std::string ret = s;
        bool previousCased = false;
        for (char& c : ret) {
            bool cased = isalpha((unsigned char)c);
            c = (cased && !previousCased) ? toupper((unsigned char)c) : tolower((unsigned char)c);
            previousCased = cased;
        }
        return same(ret);
    }
    if (name == "find" || name == "count") {
        expectArgs(name, args, 1, 1);
        std::string needle = args[0].toString();
        if (name == "find") {
            size_t found = s.find(needle);
            if (found == std::string::npos) {
                return Value::integer(-1);
            }
            return Value::integer(utf8Length(s.substr(0, found)));
        }
        if (needle.size() == 0) {
            return Value::integer(utf8Length(s) + 1);
        }
        int64_t count = 0;
        for (size_t found = s.find(needle); found != std::string::npos; found = s.find(needle, found + needle.size())) {
            count ++;
        }
        return Value::integer(count);
    }
    if (name == "isdigit") {
        return Value::boolean(isNumber(s));
    }
    if (name == "zfill") {
        expectArgs("zfill", args, 1, 1);
        int64_t width = integerOf(args[0]);
        int64_t len = utf8Length(s);
        if (len >= width) {
            return same(s);
        }
        size_t signLen = (s.size() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
        return same(s.substr(0, signLen) + std::string(width - len, '0') + s.substr(signLen));
    }
    if (name == "format") {
        return same(formatMethod(s, args, kwargs, safe));
    }
    throw EvalError("AttributeError", "'" + self.typeName() + "' object has no attribute '" + name + "'");
}

Value BoundMethod::call(Sequence& args, Kwargs& kwargs) {
    switch (self.kind) {
        case Value::Str:
        case Value::Markup:
            return stringMethod(self, name, args, kwargs);
        case Value::List:
        case Value::Tuple:
            if (name == "append") {
                expectArgs("append", args, 1, 1);
                self.seq -> push_back(args[0]);
                return Value::none();
            }
            if (name == "index" || name == "count") {
                expectArgs(name, args, 1, 1);
                int64_t count = 0;
                for (size_t n = 0; n < self.seq -> size(); n ++) {
                    if ((*self.seq)[n].equals(args[0])) {
                        if (name == "index") {
                            return Value::integer(n);
                        }
                        count ++;
                    }
                }
                if (name == "index") {
                    throw EvalError("ValueError", (self.kind == Value::List ? args[0].repr() + " is not in list" : std::string("tuple.index(x): x not in tuple")));
                }
                return Value::integer(count);
            }
            break;
        case Value::Dict:
            if (name == "get") {
                expectArgs("get", args, 1, 2);
                const Value* found = self.map -> find(keyOf(args[0]));
                if (found != NULL) {
                    return *found;
                }
                return args.size() == 2 ? args[1] : Value::none();
            }
            if (name == "items" || name == "keys" || name == "values") {
                expectArgs(name, args, 0, 0);
                Sequence ret;
                for (auto& item : self.map -> items) {
                    if (name == "items") {
                        ret.push_back(Value::tuple({ Value::str(item.first), item.second }));
                    }
                    else {
                        ret.push_back(name == "keys" ? Value::str(item.first) : item.second);
                    }
                }
                return Value::list(ret);
            }
            break;
        default:
            break;
    }
    throw EvalError("AttributeError", "'" + self.typeName() + "' object has no attribute '" + name + "'");
}
