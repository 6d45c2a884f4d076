#include <evals/value.hpp>
#include <util.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>


Value Value::none() {
    return Value();
}

Value Value::boolean(bool v) {
    Value ret;
    ret.kind = Bool;
    ret.b = v;
    return ret;
}

Value Value::integer(int64_t v) {
    Value ret;
    ret.kind = Int;
    ret.i = v;
    return ret;
}

Value Value::number(double v) {
    Value ret;
    ret.kind = Float;
    ret.f = v;
    return ret;
}

Value Value::str(std::string v) {
    Value ret;
    ret.kind = Str;
    ret.s = v;
    return ret;
}

Value Value::markup(std::string v) {
    Value ret;
    ret.kind = Markup;
    ret.s = v;
    return ret;
}

Value Value::list(Sequence items) {
    Value ret;
    ret.kind = List;
    ret.seq = std::make_shared<Sequence>(std::move(items));
    return ret;
}

Value Value::tuple(Sequence items) {
    Value ret;
    ret.kind = Tuple;
    ret.seq = std::make_shared<Sequence>(std::move(items));
    return ret;
}

Value Value::dict() {
    Value ret;
    ret.kind = Dict;
    ret.map = std::make_shared<Mapping>();
    return ret;
}

Value Value::dict(const Mapping& m) {
    Value ret;
    ret.kind = Dict;
    ret.map = std::make_shared<Mapping>(m);
    return ret;
}

Value Value::function(std::shared_ptr<Callable> f) {
    Value ret;
    ret.kind = Function;
    ret.fn = f;
    return ret;
}

Value Value::lazy(std::shared_ptr<LazyContent> c) {
    Value ret;
    ret.kind = Content;
    ret.content = c;
    return ret;
}

bool Value::truthy() const {
    switch (kind) {
        case None: return false;
        case Bool: return b;
        case Int: return i != 0;
        case Float: return f != 0;
        case Str:
        case Markup: return s.size() > 0;
        case List:
        case Tuple: return seq -> size() > 0;
        case Dict: return map -> size() > 0;
        case Function: return true;
        case Content: return content -> html().size() > 0; // python asks len(), which renders
    }
    return false;
}

bool Value::isText() const {
    return kind == Str || kind == Markup || kind == Content;
}

bool Value::isSafe() const {
    return kind == Markup || kind == Content;
}

bool Value::isNumeric() const {
    return kind == Bool || kind == Int || kind == Float;
}

bool Value::isSequence() const {
    return kind == List || kind == Tuple;
}

double Value::asDouble() const {
    switch (kind) {
        case Bool: return b ? 1 : 0;
        case Int: return (double)i;
        case Float: return f;
        default: return 0;
    }
}

std::string floatRepr(double d) {
    if (std::isnan(d)) {
        return "nan";
    }
    if (std::isinf(d)) {
        return d > 0 ? "inf" : "-inf";
    }
    char buf[64];
    int precision;
    for (precision = 1; precision < 17; precision ++) { // the shortest representation that reads back as the same double
        snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
        if (strtod(buf, NULL) == d) {
            break;
        }
    }
    snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
    std::string sci = buf;
    size_t e = sci.find('e');
    int exponent = atoi(sci.c_str() + e + 1);
    std::string mantissa = sci.substr(0, e);
    bool negative = mantissa[0] == '-';
    if (negative) {
        mantissa = mantissa.substr(1);
    }
    std::string digits;
    for (char c : mantissa) {
        if (c != '.') {
            digits += c;
        }
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }
    std::string ret;
    if (exponent < -4 || exponent >= 16) {
        ret = digits.substr(0, 1);
        if (digits.size() > 1) {
            ret += "." + digits.substr(1);
        }
        char exp[16];
        snprintf(exp, sizeof(exp), "e%c%02d", exponent < 0 ? '-' : '+', exponent < 0 ? -exponent : exponent);
        ret += exp;
    }
    else if (exponent < 0) {
        ret = "0." + std::string(-exponent - 1, '0') + digits;
    }
    else if ((size_t)exponent + 1 >= digits.size()) {
        ret = digits + std::string(exponent + 1 - digits.size(), '0') + ".0";
    }
    else {
        ret = digits.substr(0, exponent + 1) + "." + digits.substr(exponent + 1);
    }
    return negative ? "-" + ret : ret;
}

static std::string quoteString(const std::string& s) {
    bool hasSingle = s.find('\'') != std::string::npos;
    bool hasDouble = s.find('"') != std::string::npos;
    char quote = (hasSingle && !hasDouble) ? '"' : '\'';
    std::string ret(1, quote);
    for (unsigned char c : s) {
        if (c == quote || c == '\\') {
            ret += '\\';
            ret += c;
        }
        else if (c == '\n') ret += "\\n";
        else if (c == '\r') ret += "\\r";
        else if (c == '\t') ret += "\\t";
        else if (c < 0x20 || c == 0x7F) {
            char hex[8];
            snprintf(hex, sizeof(hex), "\\x%02x", c);
            ret += hex;
        }
        else {
            ret += c;
        }
    }
    return ret + quote;
}

std::string Value::toString() const {
    switch (kind) {
        case None: return "None";
        case Bool: return b ? "True" : "False";
        case Int: return std::to_string(i);
        case Float: return floatRepr(f);
        case Str:
        case Markup: return s;
        case Content: return content -> html();
        default: return repr();
    }
}

std::string Value::repr() const {
    switch (kind) {
        case Str: return quoteString(s);
        case Markup: return "Markup(" + quoteString(s) + ")";
        case List:
        case Tuple: {
            std::string ret = kind == List ? "[" : "(";
            for (size_t n = 0; n < seq -> size(); n ++) {
                if (n > 0) {
                    ret += ", ";
                }
                ret += (*seq)[n].repr();
            }
            if (kind == Tuple && seq -> size() == 1) {
                ret += ",";
            }
            return ret + (kind == List ? "]" : ")");
        }
        case Dict: {
            std::string ret = "{";
            bool first = true;
            for (auto& item : map -> items) {
                if (!first) {
                    ret += ", ";
                }
                first = false;
                ret += quoteString(item.first) + ": " + item.second.repr();
            }
            return ret + "}";
        }
        case Function: return "<function " + fn -> name + ">";
        case Content: return content -> describe();
        default: return toString();
    }
}

std::string Value::typeName() const {
    switch (kind) {
        case None: return "NoneType";
        case Bool: return "bool";
        case Int: return "int";
        case Float: return "float";
        case Str: return "str";
        case Markup: return "Markup";
        case List: return "list";
        case Tuple: return "tuple";
        case Dict: return "dict";
        case Function: return "function";
        case Content: return "QwebContent";
    }
    return "object";
}

std::string Value::escaped() const {
    if (isSafe()) {
        return toString();
    }
    return escapeHtml(toString());
}

bool Value::equals(const Value& other) const {
    if (isNumeric() && other.isNumeric()) {
        if (kind == Float || other.kind == Float) {
            return asDouble() == other.asDouble();
        }
        int64_t one = kind == Bool ? b : i;
        int64_t two = other.kind == Bool ? other.b : other.i;
        return one == two;
    }
    if ((kind == Str || kind == Markup) && (other.kind == Str || other.kind == Markup)) {
        return s == other.s;
    }
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
        case None: return true;
        case List:
        case Tuple: {
            if (seq == other.seq) {
                return true;
            }
            if (seq -> size() != other.seq -> size()) {
                return false;
            }
            for (size_t n = 0; n < seq -> size(); n ++) {
                if (!(*seq)[n].equals((*other.seq)[n])) {
                    return false;
                }
            }
            return true;
        }
        case Dict: {
            if (map -> size() != other.map -> size()) {
                return false;
            }
            for (auto& item : map -> items) {
                const Value* theirs = other.map -> find(item.first);
                if (theirs == NULL || !item.second.equals(*theirs)) {
                    return false;
                }
            }
            return true;
        }
        case Function: return fn == other.fn;
        case Content: return content == other.content;
        default: return false;
    }
}


std::string keyOf(const Value& key) {
    return key.toString();
}


Mapping::Mapping(std::initializer_list<std::pair<std::string, Value>> init) {
    for (auto& item : init) {
        set(item.first, item.second);
    }
}

Value* Mapping::find(const std::string& key) {
    auto it = index.find(key);
    if (it == index.end()) {
        return NULL;
    }
    return &items[it -> second].second;
}

const Value* Mapping::find(const std::string& key) const {
    auto it = index.find(key);
    if (it == index.end()) {
        return NULL;
    }
    return &items[it -> second].second;
}

bool Mapping::contains(const std::string& key) const {
    return index.count(key) > 0;
}

Value Mapping::get(const std::string& key) const {
    const Value* v = find(key);
    return v == NULL ? Value() : *v;
}

void Mapping::set(const std::string& key, Value value) {
    Value* existing = find(key);
    if (existing != NULL) {
        *existing = value;
        return;
    }
    index[key] = items.size();
    items.push_back({ key, value });
}

void Mapping::setdefault(const std::string& key, Value value) {
    if (!contains(key)) {
        set(key, value);
    }
}

bool Mapping::erase(const std::string& key) {
    auto it = index.find(key);
    if (it == index.end()) {
        return false;
    }
    items.erase(items.begin() + it -> second);
    index.clear();
    for (size_t n = 0; n < items.size(); n ++) {
        index[items[n].first] = n;
    }
    return true;
}

void Mapping::update(const Mapping& other) {
    for (auto& item : other.items) {
        set(item.first, item.second);
    }
}
