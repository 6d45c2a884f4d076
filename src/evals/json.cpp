#include <evals/json.hpp>
#include <errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>


static std::string quoted(const std::string& s) {
    return nlohmann::ordered_json(s).dump(-1, ' ', true, nlohmann::ordered_json::error_handler_t::replace);
}

static std::string number(double d) {
    if (std::isnan(d)) {
        return "NaN";
    }
    if (std::isinf(d)) {
        return d < 0 ? "-Infinity" : "Infinity";
    }
    return floatRepr(d);
}

static void dump(const Value& v, std::string& out, const std::string& indent, bool indented, bool sortKeys, size_t level) {
    std::string newline = "\n";
    for (size_t n = 0; n <= level; n ++) {
        newline += indent;
    }
    std::string closing = newline.substr(0, newline.size() - indent.size());
    std::string separator = indented ? "," + newline : ", ";
    switch (v.kind) {
        case Value::None: out += "null"; return;
        case Value::Bool: out += v.b ? "true" : "false"; return;
        case Value::Int: out += std::to_string(v.i); return;
        case Value::Float: out += number(v.f); return;
        case Value::Str:
        case Value::Markup: out += quoted(v.s); return;
        case Value::Content: out += quoted(v.content -> html()); return; // rendered, like str()
        case Value::List:
        case Value::Tuple: {
            if (v.seq -> size() == 0) {
                out += "[]";
                return;
            }
            out += indented ? "[" + newline : "[";
            for (size_t i = 0; i < v.seq -> size(); i ++) {
                if (i > 0) {
                    out += separator;
                }
                dump((*v.seq)[i], out, indent, indented, sortKeys, level + 1);
            }
            out += indented ? closing + "]" : "]";
            return;
        }
        case Value::Dict: {
            if (v.map -> size() == 0) {
                out += "{}";
                return;
            }
            std::vector<const std::pair<std::string, Value>*> items;
            for (const auto& item : v.map -> items) {
                items.push_back(&item);
            }
            if (sortKeys) {
                std::stable_sort(items.begin(), items.end(), [](auto* a, auto* b) { return a -> first < b -> first; });
            }
            out += indented ? "{" + newline : "{";
            for (size_t i = 0; i < items.size(); i ++) {
                if (i > 0) {
                    out += separator;
                }
                out += quoted(items[i] -> first) + ": ";
                dump(items[i] -> second, out, indent, indented, sortKeys, level + 1);
            }
            out += indented ? closing + "}" : "}";
            return;
        }
        default:
            throw EvalError("TypeError", "Object of type " + v.typeName() + " is not JSON serializable");
    }
}

std::string dumpJson(const Value& v, const std::string& indent, bool indented, bool sortKeys) {
    std::string out;
    dump(v, out, indent, indented, sortKeys, 0);
    return out;
}


static Value fromJson(const nlohmann::ordered_json& j) {
    switch (j.type()) {
        case nlohmann::ordered_json::value_t::null: return Value::none();
        case nlohmann::ordered_json::value_t::boolean: return Value::boolean(j.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer: return Value::integer(j.get<int64_t>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            uint64_t u = j.get<uint64_t>();
            if (u > (uint64_t)INT64_MAX) {
                throw EvalError("OverflowError", "json integer " + std::to_string(u) + " does not fit in 64 bits");
            }
            return Value::integer((int64_t)u);
        }
        case nlohmann::ordered_json::value_t::number_float: return Value::number(j.get<double>());
        case nlohmann::ordered_json::value_t::string: return Value::str(j.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            Sequence items;
            for (const nlohmann::ordered_json& item : j) {
                items.push_back(fromJson(item));
            }
            return Value::list(items);
        }
        case nlohmann::ordered_json::value_t::object: {
            Value ret = Value::dict();
            for (auto it = j.begin(); it != j.end(); ++ it) {
                ret.map -> set(it.key(), fromJson(it.value()));
            }
            return ret;
        }
        default:
            throw EvalError("TypeError", "unsupported json value");
    }
}

Value loadJson(const std::string& text) {
    nlohmann::ordered_json parsed;
    try {
        parsed = nlohmann::ordered_json::parse(text);
    }
    catch (nlohmann::ordered_json::parse_error& e) {
        throw EvalError("JSONDecodeError", e.what());
    }
    return fromJson(parsed);
}
