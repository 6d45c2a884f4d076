#include <collaborators/fields.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <cstdio>


static std::string fieldType(const Value& value, const Mapping& fieldOptions) {
    Value widget = fieldOptions.get("widget");
    if (widget.isText()) {
        return widget.toString();
    }
    switch (value.kind) {
        case Value::Bool:
            return "boolean";
        case Value::Int:
            return "integer";
        case Value::Float:
            return "float";
        case Value::Markup:
            return "html";
        case Value::Dict:
            return "contact";
        default:
            return "char";
    }
}

static std::string fixed(double value, int64_t precision) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.*f", (int)precision, value);
    return buffer;
}

static int64_t precisionOf(const Mapping& fieldOptions, int64_t fallback) {
    Value precision = fieldOptions.get("precision");
    return precision.kind == Value::Int ? precision.i : fallback;
}


Value DefaultFieldConverter::format(const Value& value, const std::string& widget, const Mapping& fieldOptions) {
    if (value.isNone() || (value.kind == Value::Bool && !value.b && widget != "boolean")) {
        return Value::none();
    }
    if (widget == "float") {
        if (!value.isNumeric()) {
            throw RenderError("ValueError", "The float widget needs a number, not " + value.repr());
        }
        return Value::str(fixed(value.asDouble(), precisionOf(fieldOptions, 2)));
    }
    if (widget == "integer") {
        if (!value.isNumeric()) {
            throw RenderError("ValueError", "The integer widget needs a number, not " + value.repr());
        }
        return Value::str(std::to_string((int64_t)value.asDouble()));
    }
    if (widget == "monetary") {
        if (!value.isNumeric()) {
            throw RenderError("ValueError", "The monetary widget needs a number, not " + value.repr());
        }
        std::string symbol = escapeHtml(fieldOptions.get("display_currency").isText() ? fieldOptions.get("display_currency").toString() : "");
        std::string amount = "<span class=\"oe_currency_value\">" + fixed(value.asDouble(), precisionOf(fieldOptions, 2)) + "</span>";
        if (symbol.size() == 0) {
            return Value::markup(amount);
        }
        if (fieldOptions.get("position").toString() == "before") {
            return Value::markup(symbol + "&nbsp;" + amount);
        }
        return Value::markup(amount + "&nbsp;" + symbol);
    }
    if (widget == "boolean") {
        return Value::str(value.truthy() ? "True" : "False");
    }
    if (widget == "text") { // line breaks become <br>
        std::string ret;
        for (char c : escapeHtml(value.toString())) {
            if (c == '\n') {
                ret += "<br>\n";
            }
            else {
                ret += c;
            }
        }
        return Value::markup(ret);
    }
    if (widget == "html") {
        return Value::markup(value.toString());
    }
    if (widget == "contact") {
        if (value.kind != Value::Dict) {
            throw RenderError("ValueError", "The contact widget needs a dict, not " + value.repr());
        }
        static const std::vector<std::string> defaults = { "name", "address", "phone", "mobile", "email" };
        std::vector<std::string> wanted = defaults;
        Value fields = fieldOptions.get("fields");
        if (fields.isSequence()) {
            wanted.clear();
            for (const Value& f : *fields.seq) {
                wanted.push_back(f.toString());
            }
        }
        std::string ret = "<address itemscope=\"itemscope\" itemtype=\"http://schema.org/Organization\">";
        for (const std::string& name : wanted) {
            Value part = value.map -> get(name);
            if (!part.truthy()) {
                continue;
            }
            std::string text = escapeHtml(part.toString());
            if (name == "address") { // one line per address line
                std::string lines;
                for (char c : text) {
                    lines += c == '\n' ? std::string("<br/>") : std::string(1, c);
                }
                text = lines;
            }
            ret += "<div><span itemprop=\"" + escapeHtml(name) + "\">" + text + "</span></div>";
        }
        return Value::markup(ret + "</address>");
    }
    if (widget != "char") {
        printf(WARNING "Unknown widget %s, rendering the value as text\n", widget.c_str());
    }
    return Value::str(value.toString());
}

FieldResult DefaultFieldConverter::field(const Value& record, const std::string& fieldName, const std::string& expression, const std::string& tagName, const Mapping& fieldOptions, const RenderOptions& options) {
    if (record.kind != Value::Dict) {
        throw RenderError("AttributeError", "'" + record.typeName() + "' object has no attribute '" + fieldName + "'");
    }
    const Value* value = record.map -> find(fieldName);
    if (value == NULL) {
        throw RenderError("KeyError", "'" + fieldName + "'");
    }
    std::string type = fieldType(*value, fieldOptions);
    bool branding = options.inheritBranding || options.inheritBrandingAuto;

    FieldResult ret;
    ret.content = format(*value, type, fieldOptions);
    ret.forceDisplay = branding;
    if (branding) {
        const Value* model = record.map -> find("_name");
        const Value* id = record.map -> find("id");
        if (model != NULL) {
            ret.attributes.set("data-oe-model", Value::str(model -> toString()));
        }
        if (id != NULL) {
            ret.attributes.set("data-oe-id", Value::str(id -> toString()));
        }
        ret.attributes.set("data-oe-field", Value::str(fieldName));
        ret.attributes.set("data-oe-type", Value::str(type));
        ret.attributes.set("data-oe-expression", Value::str(expression));
    }
    return ret;
}

FieldResult DefaultFieldConverter::widget(const Value& value, const std::string& expression, const std::string& tagName, const Mapping& fieldOptions, const RenderOptions& options) {
    std::string type = fieldType(value, fieldOptions);
    FieldResult ret;
    ret.content = format(value, type, fieldOptions);
    ret.attributes.set("data-oe-type", Value::str(type));
    ret.attributes.set("data-oe-expression", Value::str(expression));
    ret.forceDisplay = options.inheritBranding;
    return ret;
}
