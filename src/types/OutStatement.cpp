#include <types/OutStatement.hpp>
#include <blockrunner.hpp>
#include <session.hpp>
#include <engine.hpp>


static bool isShown(const Value& v) { // python's `v is not None and v is not False`
    return !(v.isNone() || (v.kind == Value::Bool && !v.b));
}

static Value toTextValue(const Value& v) { // str-like values go through untouched, so markup stays markup
    if (!isShown(v)) {
        return Value::str("");
    }
    if (v.isText()) {
        return v;
    }
    return Value::str(v.toString());
}

static void mergeResult(BlockRunner* runner, const FieldResult& result) {
    if (runner -> pendingAttrs == NULL) {
        runner -> pendingAttrs = std::make_shared<Mapping>(result.attributes);
    }
    else {
        runner -> pendingAttrs -> update(result.attributes);
    }
}


OutStatement::~OutStatement() {
    deleteCode(display);
    deleteCode(fallback);
    deleteCode(forced);
}

void OutStatement::run(BlockRunner* runner) {
    FieldConverter* converter = runner -> session -> engine -> fields;
    Value content;
    bool forceDisplay = false;
    if (kind == Field) {
        Value record = expr -> eval(runner -> values);
        std::shared_ptr<Mapping> fieldOptions = runner -> takeOptions();
        FieldResult result = converter -> field(record, fieldName, source, tag, *fieldOptions, *runner -> options);
        mergeResult(runner, result);
        content = isShown(result.content) ? toTextValue(result.content) : result.content;
        forceDisplay = result.forceDisplay;
    }
    else {
        if (slot) {
            const Value* found = runner -> values -> find(WEFT_CALL_SLOT);
            content = found != NULL ? *found : Value::str("");
        }
        else {
            content = expr -> eval(runner -> values);
        }
        if (widget) {
            std::shared_ptr<Mapping> fieldOptions = runner -> takeOptions();
            FieldResult result = converter -> widget(content, source, tag, *fieldOptions, *runner -> options);
            mergeResult(runner, result);
            content = isShown(result.content) ? toTextValue(result.content) : result.content;
            forceDisplay = result.forceDisplay;
        }
        if (kind == Raw && isShown(content)) {
            content = Value::markup(content.toString());
        }
    }

    runner -> current = content;
    if (isShown(content)) {
        runner -> enter(display);
    }
    else if (fallback.size() > 0) {
        runner -> enter(fallback);
    }
    else if (forceDisplay && forced.size() > 0) {
        runner -> enter(forced);
    }
    else {
        runner -> pendingAttrs = NULL;
    }
}


void EmitStatement::run(BlockRunner* runner) {
    if (slot) {
        runner -> emitValue(runner -> values -> get(WEFT_CALL_SLOT), false);
    }
    else {
        runner -> emitValue(runner -> current, true);
    }
}
