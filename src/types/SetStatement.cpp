#include <types/SetStatement.hpp>
#include <blockrunner.hpp>
#include <template.hpp>
#include <options.hpp>
#include <render/callparams.hpp>
#include <render/content.hpp>


void SetStatement::run(BlockRunner* runner) {
    std::shared_ptr<Mapping> values = runner -> values;
    switch (kind) {
        case FromValue:
            values -> set(name, value -> eval(values));
            break;
        case FromFormat:
            values -> set(name, Value::str(format -> render(values)));
            break;
        case Merge: {
            Value v = value -> eval(values);
            if (v.kind != Value::Dict) {
                throw EvalError("TypeError", "'" + v.typeName() + "' object is not a mapping");
            }
            values -> update(*v.map);
            break;
        }
        case FromContent: {
            std::shared_ptr<CallParameters> params = std::make_shared<CallParameters>();
            params -> scope = CallParameters::Root;
            params -> context = runner -> options -> toDict();
            params -> ref = runner -> compiled -> ref;
            params -> block = block;
            params -> compiled = runner -> compiled;
            params -> values = std::make_shared<Mapping>(*values);
            params -> directive = "t-set";
            params -> path = where;
            values -> set(name, Value::lazy(std::make_shared<ContentValue>(runner -> session, params)));
            break;
        }
        case Empty:
            values -> set(name, Value::str(""));
            break;
    }
}
