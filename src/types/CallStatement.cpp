#include <types/CallStatement.hpp>
#include <types/AttsStatement.hpp>
#include <blockrunner.hpp>
#include <template.hpp>
#include <options.hpp>
#include <render/callparams.hpp>
#include <render/content.hpp>


void CallStatement::run(BlockRunner* runner) {
    std::shared_ptr<Mapping> values = runner -> values;
    std::shared_ptr<Mapping> callOptions = runner -> takeOptions();
    std::shared_ptr<Mapping> callValues = std::make_shared<Mapping>();

    if (contentBlock.size() > 0) {
        std::shared_ptr<CallParameters> content = std::make_shared<CallParameters>();
        content -> scope = CallParameters::Root;
        content -> context = runner -> options -> toDict();
        content -> ref = runner -> compiled -> ref;
        content -> block = contentBlock;
        content -> compiled = runner -> compiled;
        content -> values = std::make_shared<Mapping>(*values);
        content -> directive = "inner-content";
        content -> path = where;
        callValues -> set(WEFT_CALL_SLOT, Value::lazy(std::make_shared<ContentValue>(runner -> session, content)));
    }
    else {
        callValues -> set(WEFT_CALL_SLOT, Value::str(""));
    }

    for (const CallArgument& arg : args) {
        switch (arg.kind) {
            case CallArgument::Expr:
                callValues -> set(arg.name, arg.expr -> eval(values));
                break;
            case CallArgument::Format:
                callValues -> set(arg.name, Value::str(arg.format -> render(values)));
                break;
            case CallArgument::Spread:
                mergePairs(*callValues, arg.expr -> eval(values));
                break;
        }
    }

    std::shared_ptr<CallParameters> params = std::make_shared<CallParameters>();
    params -> scope = CallParameters::Copy;
    params -> context = *callOptions;
    params -> ref = target != NULL ? target -> render(values) : ref;
    params -> values = callValues;
    params -> directive = "t-call";
    params -> path = where;
    runner -> emit(params);
}
