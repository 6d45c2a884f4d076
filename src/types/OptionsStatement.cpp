#include <types/OptionsStatement.hpp>
#include <blockrunner.hpp>


void OptionsStatement::run(BlockRunner* runner) {
    std::shared_ptr<Mapping> result = std::make_shared<Mapping>();
    if (options != NULL) {
        Value v = options -> eval(runner -> values);
        if (v.kind == Value::Dict) {
            result -> update(*v.map);
        }
        else if (!v.isNone()) {
            throw EvalError("TypeError", "t-options must be a dict, not " + v.typeName());
        }
    }
    for (auto& entry : entries) {
        result -> set(entry.first, entry.second -> eval(runner -> values));
    }
    runner -> pendingOptions = result;
}
