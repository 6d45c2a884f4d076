#include <session.hpp>
#include <engine.hpp>
#include <evals/builtins.hpp>
#include <render/callparams.hpp>
#include <render/stack.hpp>
#include <cstdio>


Session::Session(Engine* e, const Mapping& v, RenderOptions o) : engine(e), options(o) {
    values = std::make_shared<Mapping>(v);
    if (values -> erase(WEFT_CALL_SLOT)) {
        printf(WARNING "values[\"%s\"] is reserved for the content of a t-call; the value given to render() was dropped\n", WEFT_CALL_SLOT);
    }
    values -> set("true", Value::boolean(true));
    values -> set("false", Value::boolean(false));
    if (!options.minimalQcontext) {
        values -> setdefault("debug", options.debug.size() ? Value::str(options.debug) : Value::boolean(false));
        Value json = Value::dict();
        json.map -> set("dumps", builtin("json.dumps"));
        json.map -> set("loads", builtin("json.loads"));
        values -> set("json", json);
        values -> set("quote_plus", builtin("quote_plus"));
        values -> set("floor", builtin("floor"));
        values -> set("ceil", builtin("ceil"));
        values -> set("lang", options.lang.size() ? Value::str(options.lang) : Value::none());
    }
    rootValues = std::make_shared<Mapping>(*values);
}

std::shared_ptr<const CompiledTemplate> Session::compile(const std::string& ref, const RenderOptions& o) {
    std::string key = ref + "|" + o.cacheKey();
    auto found = loaded.find(key);
    if (found != loaded.end()) {
        return found -> second;
    }
    std::shared_ptr<const CompiledTemplate> ret = engine -> compile(ref, o);
    loaded[key] = ret;
    return ret;
}

std::string Session::render(std::shared_ptr<CallParameters> params) {
    RenderStack stack(this, params);
    return stack.run();
}
