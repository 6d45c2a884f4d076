#include <evals/ops.hpp>
#include <evals/builtins.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>


static Value asText(const Value& v) { // Content takes part in string operations as the markup it renders to
    if (v.kind == Value::Content) {
        return Value::markup(v.content -> html());
    }
    return v;
}

static std::string textOf(const Value& v, bool safe) {
    return safe ? v.escaped() : v.toString();
}

static int64_t intOf(const Value& v) {
    return v.kind == Value::Bool ? (int64_t)v.b : v.i;
}

static bool isInteger(const Value& v) {
    return v.kind == Value::Int || v.kind == Value::Bool;
}

[[noreturn]] static void unsupported(const std::string& op, const Value& a, const Value& b) {
    throw EvalError("TypeError", "unsupported operand type(s) for " + op + ": '" + a.typeName() + "' and '" + b.typeName() + "'");
}

static Value repeat(const Value& thing, int64_t times) {
    size_t size = thing.isSequence() ? thing.seq -> size() : thing.s.size();
    if (times > 0 && size > 0 && (uint64_t)times > WEFT_MAX_REPEAT / size) {
        throw EvalError("MemoryError", "repeating a " + thing.typeName() + " " + std::to_string(times) + " times");
    }
    if (thing.isSequence()) {
        Sequence ret;
        for (int64_t n = 0; n < times; n ++) {
            ret.insert(ret.end(), thing.seq -> begin(), thing.seq -> end());
        }
        return thing.kind == Value::List ? Value::list(ret) : Value::tuple(ret);
    }
    std::string ret;
    for (int64_t n = 0; n < times; n ++) {
        ret += thing.s;
    }
    return thing.kind == Value::Markup ? Value::markup(ret) : Value::str(ret);
}

[[noreturn]] static void overflow(const std::string& op) {
    throw EvalError("OverflowError", "integer result of " + op + " does not fit in 64 bits");
}

static int64_t addInts(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_add_overflow(a, b, &r)) {
        overflow("+");
    }
    return r;
}

static int64_t subInts(int64_t a, int64_t b) {
    int64_t r;
    if (__builtin_sub_overflow(a, b, &r)) {
        overflow("-");
    }
    return r;
}

static int64_t mulInts(int64_t a, int64_t b, const std::string& op = "*") {
    int64_t r;
    if (__builtin_mul_overflow(a, b, &r)) {
        overflow(op);
    }
    return r;
}

static int64_t powInts(int64_t base, int64_t exponent) { // by squaring: at most 64 rounds before it overflows
    int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = mulInts(result, base, "**");
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = mulInts(base, base, "**");
        }
    }
    return result;
}

static int64_t floorDiv(int64_t a, int64_t b) {
    if (a == INT64_MIN && b == -1) {
        overflow("//");
    }
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q --;
    }
    return q;
}

static int64_t floorMod(int64_t a, int64_t b) {
    if (b == -1) { // INT64_MIN % -1 traps
        return 0;
    }
    int64_t m = a % b;
    if (m != 0 && ((m < 0) != (b < 0))) {
        m += b;
    }
    return m;
}

Value binaryOp(const std::string& op, const Value& left, const Value& right) {
    Value a = asText(left);
    Value b = asText(right);
    if (op == "+") {
        if (a.isNumeric() && b.isNumeric()) {
            if (a.kind == Value::Float || b.kind == Value::Float) {
                return Value::number(a.asDouble() + b.asDouble());
            }
            return Value::integer(addInts(intOf(a), intOf(b)));
        }
        if (a.isText() && b.isText()) {
            if (a.isSafe() || b.isSafe()) {
                return Value::markup(a.escaped() + b.escaped());
            }
            return Value::str(a.s + b.s);
        }
        if (a.isSequence() && a.kind == b.kind) {
            Sequence ret = *a.seq;
            ret.insert(ret.end(), b.seq -> begin(), b.seq -> end());
            return a.kind == Value::List ? Value::list(ret) : Value::tuple(ret);
        }
        if (a.isText() || a.isSequence()) {
            throw EvalError("TypeError", "can only concatenate " + (a.isText() ? std::string("str") : a.typeName()) + " (not \"" + b.typeName() + "\") to " + (a.isText() ? std::string("str") : a.typeName()));
        }
        unsupported(op, a, b);
    }
    if (op == "*") {
        if (a.isNumeric() && b.isNumeric()) {
            if (a.kind == Value::Float || b.kind == Value::Float) {
                return Value::number(a.asDouble() * b.asDouble());
            }
            return Value::integer(mulInts(intOf(a), intOf(b)));
        }
        if ((a.isText() || a.isSequence()) && isInteger(b)) {
            return repeat(a, intOf(b));
        }
        if ((b.isText() || b.isSequence()) && isInteger(a)) {
            return repeat(b, intOf(a));
        }
        if (a.isText() || a.isSequence() || b.isText() || b.isSequence()) {
            throw EvalError("TypeError", "can't multiply sequence by non-int of type '" + (a.isText() || a.isSequence() ? b : a).typeName() + "'");
        }
        unsupported(op, a, b);
    }
    if (op == "%" && a.isText()) {
        std::string formatted = percentFormat(a.s, right, a.isSafe());
        return a.isSafe() ? Value::markup(formatted) : Value::str(formatted);
    }
    if (op == "&" || op == "|" || op == "^" || op == "<<" || op == ">>") {
        if (!isInteger(a) || !isInteger(b)) {
            unsupported(op, a, b);
        }
        int64_t x = intOf(a);
        int64_t y = intOf(b);
        if (op == "<<" || op == ">>") {
            if (y < 0) {
                throw EvalError("ValueError", "negative shift count");
            }
            if (op == ">>") {
                return Value::integer(y >= 64 ? (x < 0 ? -1 : 0) : x >> y);
            }
            if (x == 0) {
                return Value::integer(0);
            }
            if (y >= 63) {
                overflow("<<");
            }
            return Value::integer(mulInts(x, (int64_t)1 << y, "<<"));
        }
        int64_t r = op == "&" ? (x & y) : op == "|" ? (x | y) : (x ^ y);
        if (a.kind == Value::Bool && b.kind == Value::Bool) {
            return Value::boolean(r != 0);
        }
        return Value::integer(r);
    }
    if (!a.isNumeric() || !b.isNumeric()) {
        unsupported(op, a, b);
    }
    bool floating = a.kind == Value::Float || b.kind == Value::Float;
    if (op == "-") {
        return floating ? Value::number(a.asDouble() - b.asDouble()) : Value::integer(subInts(intOf(a), intOf(b)));
    }
    if (op == "/") {
        if (b.asDouble() == 0) {
            throw EvalError("ZeroDivisionError", "division by zero");
        }
        return Value::number(a.asDouble() / b.asDouble());
    }
    if (op == "//") {
        if (floating) {
            if (b.asDouble() == 0) {
                throw EvalError("ZeroDivisionError", "float floor division by zero");
            }
            return Value::number(std::floor(a.asDouble() / b.asDouble()));
        }
        if (intOf(b) == 0) {
            throw EvalError("ZeroDivisionError", "integer division or modulo by zero");
        }
        return Value::integer(floorDiv(intOf(a), intOf(b)));
    }
    if (op == "%") {
        if (floating) {
            double y = b.asDouble();
            if (y == 0) {
                throw EvalError("ZeroDivisionError", "float modulo by zero");
            }
            double m = std::fmod(a.asDouble(), y);
            if (m != 0 && ((m < 0) != (y < 0))) {
                m += y;
            }
            return Value::number(m);
        }
        if (intOf(b) == 0) {
            throw EvalError("ZeroDivisionError", "integer modulo by zero");
        }
        return Value::integer(floorMod(intOf(a), intOf(b)));
    }
    if (op == "**") {
        if (!floating && intOf(b) >= 0) {
            return Value::integer(powInts(intOf(a), intOf(b)));
        }
        if (a.asDouble() == 0 && b.asDouble() < 0) {
            throw EvalError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        return Value::number(std::pow(a.asDouble(), b.asDouble()));
    }
    throw EvalError("SyntaxError", "unknown operator " + op);
}

Value unaryOp(const std::string& op, const Value& a) {
    if (op == "not") {
        return Value::boolean(!a.truthy());
    }
    if (op == "-" || op == "+") {
        if (a.kind == Value::Float) {
            return Value::number(op == "-" ? -a.f : a.f);
        }
        if (isInteger(a)) {
            return Value::integer(op == "-" ? subInts(0, intOf(a)) : intOf(a));
        }
    }
    if (op == "~" && isInteger(a)) {
        return Value::integer(~intOf(a));
    }
    throw EvalError("TypeError", "bad operand type for unary " + op + ": '" + a.typeName() + "'");
}

static int order(const std::string& op, const Value& left, const Value& right) { // <0, 0, >0
    Value a = asText(left);
    Value b = asText(right);
    if (a.isNumeric() && b.isNumeric()) {
        if (a.kind == Value::Float || b.kind == Value::Float) {
            double x = a.asDouble();
            double y = b.asDouble();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        int64_t x = intOf(a);
        int64_t y = intOf(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.isText() && b.isText()) {
        int c = a.s.compare(b.s); // utf-8 byte order is code point order
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.isSequence() && a.kind == b.kind) {
        size_t n = 0;
        for (; n < a.seq -> size() && n < b.seq -> size(); n ++) {
            if (!(*a.seq)[n].equals((*b.seq)[n])) {
                return order(op, (*a.seq)[n], (*b.seq)[n]);
            }
        }
        return a.seq -> size() < b.seq -> size() ? -1 : (a.seq -> size() > b.seq -> size() ? 1 : 0);
    }
    throw EvalError("TypeError", "'" + op + "' not supported between instances of '" + a.typeName() + "' and '" + b.typeName() + "'");
}

bool compareOp(const std::string& op, const Value& a, const Value& b) {
    if (op == "==") return asText(a).equals(asText(b));
    if (op == "!=") return !asText(a).equals(asText(b));
    if (op == "<") return order(op, a, b) < 0;
    if (op == "<=") return order(op, a, b) <= 0;
    if (op == ">") return order(op, a, b) > 0;
    if (op == ">=") return order(op, a, b) >= 0;
    if (op == "in") return contains(b, a);
    if (op == "not in") return !contains(b, a);
    if (op == "is") return identical(a, b);
    if (op == "is not") return !identical(a, b);
    throw EvalError("SyntaxError", "unknown comparison " + op);
}

bool contains(const Value& container, const Value& item) {
    Value c = asText(container);
    switch (c.kind) {
        case Value::Str:
        case Value::Markup: {
            Value needle = asText(item);
            if (!needle.isText()) {
                throw EvalError("TypeError", "'in <string>' requires string as left operand, not " + item.typeName());
            }
            return c.s.find(needle.s) != std::string::npos;
        }
        case Value::List:
        case Value::Tuple:
            for (const Value& v : *c.seq) {
                if (v.equals(item)) {
                    return true;
                }
            }
            return false;
        case Value::Dict:
            return c.map -> contains(keyOf(item));
        default:
            throw EvalError("TypeError", "argument of type '" + c.typeName() + "' is not iterable");
    }
}

bool identical(const Value& a, const Value& b) {
    if (a.kind != b.kind) {
        return false;
    }
    switch (a.kind) {
        case Value::None: return true;
        case Value::Bool: return a.b == b.b;
        case Value::Int:
        case Value::Float:
        case Value::Str:
        case Value::Markup: return a.equals(b);
        case Value::List:
        case Value::Tuple: return a.seq == b.seq;
        case Value::Dict: return a.map == b.map;
        case Value::Function: return a.fn == b.fn;
        case Value::Content: return a.content == b.content;
    }
    return false;
}

int64_t toIndex(const Value& v, const std::string& what) {
    if (!isInteger(v)) {
        throw EvalError("TypeError", what + " indices must be integers or slices, not " + v.typeName());
    }
    return intOf(v);
}

Value subscript(const Value& object, const Value& key) {
    Value obj = asText(object);
    switch (obj.kind) {
        case Value::List:
        case Value::Tuple: {
            int64_t n = toIndex(key, obj.typeName());
            int64_t size = obj.seq -> size();
            if (n < 0) {
                n += size;
            }
            if (n < 0 || n >= size) {
                throw EvalError("IndexError", obj.typeName() + " index out of range");
            }
            return (*obj.seq)[n];
        }
        case Value::Str:
        case Value::Markup: {
            int64_t n = toIndex(key, "string");
            std::vector<std::string> chars = utf8Split(obj.s);
            int64_t size = chars.size();
            if (n < 0) {
                n += size;
            }
            if (n < 0 || n >= size) {
                throw EvalError("IndexError", "string index out of range");
            }
            return obj.kind == Value::Markup ? Value::markup(chars[n]) : Value::str(chars[n]);
        }
        case Value::Dict: {
            const Value* found = obj.map -> find(keyOf(key));
            if (found == NULL) {
                throw EvalError("KeyError", key.repr());
            }
            return *found;
        }
        default:
            throw EvalError("TypeError", "'" + obj.typeName() + "' object is not subscriptable");
    }
}

static void sliceIndices(int64_t size, const Value& start, const Value& stop, const Value& step, int64_t& lo, int64_t& hi, int64_t& by) {
    by = step.isNone() ? 1 : toIndex(step, "slice");
    if (by == 0) {
        throw EvalError("ValueError", "slice step cannot be zero");
    }
    auto clamp = [size, by](const Value& bound, bool isStart) -> int64_t {
        if (bound.isNone()) {
            if (by > 0) {
                return isStart ? 0 : size;
            }
            return isStart ? size - 1 : -1;
        }
        int64_t n = toIndex(bound, "slice");
        if (n < 0) {
            n += size;
            if (n < 0) {
                n = by > 0 ? 0 : -1;
            }
        }
        else if (n >= size) {
            n = by > 0 ? size : size - 1;
        }
        return n;
    };
    lo = clamp(start, true);
    hi = clamp(stop, false);
}

Value sliceOf(const Value& object, const Value& start, const Value& stop, const Value& step) {
    Value obj = asText(object);
    std::vector<std::string> chars;
    int64_t size;
    if (obj.kind == Value::Str || obj.kind == Value::Markup) {
        chars = utf8Split(obj.s);
        size = chars.size();
    }
    else if (obj.isSequence()) {
        size = obj.seq -> size();
    }
    else {
        throw EvalError("TypeError", "'" + obj.typeName() + "' object is not subscriptable");
    }
    int64_t lo, hi, by;
    sliceIndices(size, start, stop, step, lo, hi, by);
    std::vector<int64_t> picked;
    for (int64_t n = lo; by > 0 ? n < hi : n > hi; n += by) {
        picked.push_back(n);
    }
    if (obj.isSequence()) {
        Sequence ret;
        for (int64_t n : picked) {
            ret.push_back((*obj.seq)[n]);
        }
        return obj.kind == Value::List ? Value::list(ret) : Value::tuple(ret);
    }
    std::string ret;
    for (int64_t n : picked) {
        ret += chars[n];
    }
    return obj.kind == Value::Markup ? Value::markup(ret) : Value::str(ret);
}

Value getAttribute(const Value& object, const std::string& name) {
    Value obj = asText(object);
    if (obj.kind == Value::Dict) {
        const Value* found = obj.map -> find(name); // dicts double as records: their keys read as attributes
        if (found != NULL) {
            return *found;
        }
    }
    if (hasMethod(obj, name)) {
        return Value::function(std::make_shared<BoundMethod>(obj, name));
    }
    throw EvalError("AttributeError", "'" + obj.typeName() + "' object has no attribute '" + name + "'");
}

Sequence iterate(const Value& object) {
    Value v = asText(object);
    switch (v.kind) {
        case Value::List:
        case Value::Tuple:
            return *v.seq;
        case Value::Str:
        case Value::Markup: {
            Sequence ret;
            for (std::string& c : utf8Split(v.s)) {
                ret.push_back(v.kind == Value::Markup ? Value::markup(c) : Value::str(c));
            }
            return ret;
        }
        case Value::Dict: {
            Sequence ret;
            for (auto& item : v.map -> items) {
                ret.push_back(Value::str(item.first));
            }
            return ret;
        }
        default:
            throw EvalError("TypeError", "'" + v.typeName() + "' object is not iterable");
    }
}

int64_t length(const Value& object) {
    Value v = asText(object);
    switch (v.kind) {
        case Value::Str:
        case Value::Markup: return utf8Length(v.s);
        case Value::List:
        case Value::Tuple: return v.seq -> size();
        case Value::Dict: return v.map -> size();
        default:
            throw EvalError("TypeError", "object of type '" + v.typeName() + "' has no len()");
    }
}


static std::string pad(const std::string& text, size_t width, char align, char fill = ' ') {
    size_t len = utf8Length(text);
    if (len >= width) {
        return text;
    }
    size_t missing = width - len;
    if (align == '<') {
        return text + std::string(missing, fill);
    }
    if (align == '^') {
        return std::string(missing / 2, fill) + text + std::string(missing - missing / 2, fill);
    }
    if (align == '=' && text.size() && (text[0] == '-' || text[0] == '+' || text[0] == ' ')) {
        return text.substr(0, 1) + std::string(missing, fill) + text.substr(1);
    }
    return std::string(missing, fill) + text;
}

static std::string formatNumber(const Value& v, char type, const std::string& flags, int precision) {
    char fmt[32];
    char buf[512];
    if (type == 'd' || type == 'i' || type == 'u' || type == 'x' || type == 'X' || type == 'o') {
        if (!v.isNumeric()) {
            throw EvalError("TypeError", std::string("%") + type + " format: a real number is required, not " + v.typeName());
        }
        if (v.kind == Value::Float && !(v.f < 9223372036854775808.0 && v.f >= -9223372036854775808.0)) {
            throw EvalError("OverflowError", "cannot format float " + floatRepr(v.f) + " as a 64 bit integer");
        }
        int64_t n = v.kind == Value::Float ? (int64_t)v.f : intOf(v);
        char conv = (type == 'i' || type == 'u') ? 'd' : type;
        snprintf(fmt, sizeof(fmt), "%%%sll%c", flags.c_str(), conv);
        snprintf(buf, sizeof(buf), fmt, (long long)n);
        return buf;
    }
    if (!v.isNumeric()) {
        throw EvalError("TypeError", "must be real number, not " + v.typeName());
    }
    snprintf(fmt, sizeof(fmt), "%%%s.%d%c", flags.c_str(), precision < 0 ? 6 : precision, type);
    snprintf(buf, sizeof(buf), fmt, v.asDouble());
    return buf;
}

std::string percentFormat(const std::string& format, const Value& args, bool safe) {
    Sequence positional;
    const Mapping* named = NULL;
    if (args.kind == Value::Tuple) {
        positional = *args.seq;
    }
    else {
        if (args.kind == Value::Dict) {
            named = args.map.get();
        }
        positional.push_back(args);
    }
    size_t next = 0;
    bool usedNamed = false;
    std::string ret;
    for (size_t n = 0; n < format.size(); n ++) {
        if (format[n] != '%') {
            ret += format[n];
            continue;
        }
        n ++;
        if (n >= format.size()) {
            throw EvalError("ValueError", "incomplete format");
        }
        const Value* arg = NULL;
        if (format[n] == '(') {
            size_t close = format.find(')', n);
            if (close == std::string::npos) {
                throw EvalError("ValueError", "incomplete format key");
            }
            if (named == NULL) {
                throw EvalError("TypeError", "format requires a mapping");
            }
            std::string key = format.substr(n + 1, close - n - 1);
            arg = named -> find(key);
            if (arg == NULL) {
                throw EvalError("KeyError", Value::str(key).repr());
            }
            usedNamed = true;
            n = close + 1;
        }
        std::string flags;
        while (n < format.size() && (format[n] == '-' || format[n] == '+' || format[n] == ' ' || format[n] == '#' || format[n] == '0')) {
            flags += format[n ++];
        }
        while (n < format.size() && isdigit(format[n])) {
            flags += format[n ++];
        }
        int precision = -1;
        if (n < format.size() && format[n] == '.') {
            n ++;
            precision = 0;
            while (n < format.size() && isdigit(format[n])) {
                precision = precision * 10 + (format[n ++] - '0');
            }
        }
        if (n >= format.size()) {
            throw EvalError("ValueError", "incomplete format");
        }
        char type = format[n];
        if (type == '%') {
            ret += '%';
            continue;
        }
        if (arg == NULL) {
            if (next >= positional.size()) {
                throw EvalError("TypeError", "not enough arguments for format string");
            }
            arg = &positional[next ++];
        }
        std::string piece;
        switch (type) {
            case 's':
            case 'r':
            case 'a': {
                piece = type == 's' ? textOf(*arg, safe) : (safe ? escapeHtml(arg -> repr()) : arg -> repr());
                if (precision >= 0) {
                    std::vector<std::string> chars = utf8Split(piece);
                    piece = "";
                    for (size_t c = 0; c < chars.size() && c < (size_t)precision; c ++) {
                        piece += chars[c];
                    }
                }
                bool left = flags.find('-') != std::string::npos;
                size_t width = 0;
                for (char c : flags) {
                    if (isdigit(c) && !(c == '0' && width == 0)) {
                        width = width * 10 + (c - '0');
                    }
                }
                piece = pad(piece, width, left ? '<' : '>');
                break;
            }
            case 'c':
                if (arg -> isText()) {
                    piece = arg -> toString();
                }
                else {
                    piece = "";
                    Value ch = callBuiltin("chr", { *arg });
                    piece = ch.s;
                }
                break;
            case 'd': case 'i': case 'u': case 'x': case 'X': case 'o':
            case 'f': case 'F': case 'e': case 'E': case 'g': case 'G':
                piece = formatNumber(*arg, type, flags, precision);
                break;
            default:
                throw EvalError("ValueError", std::string("unsupported format character '") + type + "'");
        }
        ret += piece;
    }
    if (!usedNamed && named == NULL && next < positional.size()) {
        throw EvalError("TypeError", "not all arguments converted during string formatting");
    }
    return ret;
}

static std::string groupThousands(const std::string& number) {
    size_t start = (number.size() && (number[0] == '-' || number[0] == '+')) ? 1 : 0;
    size_t end = number.find_first_of(".eE", start);
    if (end == std::string::npos) {
        end = number.size();
    }
    std::string digits = number.substr(start, end - start);
    std::string grouped;
    for (size_t n = 0; n < digits.size(); n ++) {
        if (n > 0 && (digits.size() - n) % 3 == 0) {
            grouped += ',';
        }
        grouped += digits[n];
    }
    return number.substr(0, start) + grouped + number.substr(end);
}

std::string formatSpec(const Value& v, const std::string& spec) {
    size_t n = 0;
    char fill = ' ';
    char align = 0;
    if (spec.size() >= 2 && (spec[1] == '<' || spec[1] == '>' || spec[1] == '^' || spec[1] == '=')) {
        fill = spec[0];
        align = spec[1];
        n = 2;
    }
    else if (spec.size() >= 1 && (spec[0] == '<' || spec[0] == '>' || spec[0] == '^' || spec[0] == '=')) {
        align = spec[0];
        n = 1;
    }
    std::string sign;
    if (n < spec.size() && (spec[n] == '+' || spec[n] == '-' || spec[n] == ' ')) {
        sign = spec[n ++];
    }
    bool alternate = false;
    if (n < spec.size() && spec[n] == '#') {
        alternate = true;
        n ++;
    }
    if (n < spec.size() && spec[n] == '0') {
        if (align == 0) {
            fill = '0';
            align = '=';
        }
        n ++;
    }
    size_t width = 0;
    while (n < spec.size() && isdigit(spec[n])) {
        width = width * 10 + (spec[n ++] - '0');
    }
    bool grouping = false;
    if (n < spec.size() && spec[n] == ',') {
        grouping = true;
        n ++;
    }
    int precision = -1;
    if (n < spec.size() && spec[n] == '.') {
        n ++;
        precision = 0;
        while (n < spec.size() && isdigit(spec[n])) {
            precision = precision * 10 + (spec[n ++] - '0');
        }
    }
    char type = n < spec.size() ? spec[n ++] : 0;
    if (n != spec.size()) {
        throw EvalError("ValueError", "Invalid format specifier '" + spec + "' for object of type '" + v.typeName() + "'");
    }
    std::string text;
    Value value = asText(v);
    if (value.isText() || (type == 0 && !value.isNumeric()) || type == 's') {
        if (type != 0 && type != 's') {
            throw EvalError("ValueError", std::string("Unknown format code '") + type + "' for object of type '" + value.typeName() + "'");
        }
        text = value.toString();
        if (precision >= 0) {
            std::vector<std::string> chars = utf8Split(text);
            text = "";
            for (size_t c = 0; c < chars.size() && c < (size_t)precision; c ++) {
                text += chars[c];
            }
        }
        return pad(text, width, align ? align : '<', fill);
    }
    std::string flags = sign == "-" ? "" : sign;
    if (alternate) {
        flags += "#";
    }
    if (type == 0) {
        text = precision >= 0 && value.kind == Value::Float ? formatNumber(value, 'g', flags, precision) : value.toString();
        if (sign == "+" && value.asDouble() >= 0) {
            text = "+" + text;
        }
    }
    else if (type == '%') {
        text = formatNumber(Value::number(value.asDouble() * 100), 'f', flags, precision) + "%";
    }
    else if (type == 'b') {
        int64_t x = intOf(value);
        bool negative = x < 0;
        uint64_t u = negative ? -(uint64_t)x : (uint64_t)x;
        do {
            text = (char)('0' + (u & 1)) + text;
            u >>= 1;
        } while (u);
        text = (negative ? "-" : flags.find('+') != std::string::npos ? "+" : "") + std::string(alternate ? "0b" : "") + text;
    }
    else {
        if ((type == 'd' || type == 'x' || type == 'X' || type == 'o') && value.kind == Value::Float) {
            throw EvalError("ValueError", std::string("Unknown format code '") + type + "' for object of type 'float'");
        }
        text = formatNumber(value, type, flags, precision);
    }
    if (grouping) {
        text = groupThousands(text);
    }
    return pad(text, width, align ? align : '>', fill);
}

std::string formatMethod(const std::string& format, const Sequence& args, const Kwargs& kwargs, bool safe) {
    std::string ret;
    size_t autoIndex = 0;
    for (size_t n = 0; n < format.size(); n ++) {
        char c = format[n];
        if (c == '}') {
            if (n + 1 < format.size() && format[n + 1] == '}') {
                ret += '}';
                n ++;
                continue;
            }
            throw EvalError("ValueError", "Single '}' encountered in format string");
        }
        if (c != '{') {
            ret += c;
            continue;
        }
        if (n + 1 < format.size() && format[n + 1] == '{') {
            ret += '{';
            n ++;
            continue;
        }
        size_t close = format.find('}', n);
        if (close == std::string::npos) {
            throw EvalError("ValueError", "Single '{' encountered in format string");
        }
        std::string field = format.substr(n + 1, close - n - 1);
        n = close;
        std::string spec;
        char conversion = 0;
        size_t colon = field.find(':');
        if (colon != std::string::npos) {
            spec = field.substr(colon + 1);
            field = field.substr(0, colon);
        }
        size_t bang = field.find('!');
        if (bang != std::string::npos) {
            conversion = bang + 1 < field.size() ? field[bang + 1] : 0;
            field = field.substr(0, bang);
        }
        Value arg;
        if (field.size() == 0 || isNumber(field)) {
            size_t index = field.size() == 0 ? autoIndex ++ : (size_t)atoll(field.c_str());
            if (index >= args.size()) {
                throw EvalError("IndexError", "Replacement index " + std::to_string(index) + " out of range for positional args tuple");
            }
            arg = args[index];
        }
        else {
            bool found = false;
            for (auto& kw : kwargs) {
                if (kw.first == field) {
                    arg = kw.second;
                    found = true;
                }
            }
            if (!found) {
                throw EvalError("KeyError", Value::str(field).repr());
            }
        }
        std::string piece;
        if (conversion == 'r') {
            piece = arg.repr();
        }
        else if (spec.size()) {
            piece = formatSpec(arg, spec);
        }
        else {
            piece = arg.toString();
        }
        ret += (safe && !(arg.isSafe() && conversion != 'r' && spec.size() == 0)) ? escapeHtml(piece) : piece;
    }
    return ret;
}
