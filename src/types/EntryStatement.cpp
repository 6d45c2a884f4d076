#include <types/EntryStatement.hpp>
#include <blockrunner.hpp>
#include <template.hpp>
#include <evals/value.hpp>
#include <util.hpp>
#include <cstdio>


void EntryStatement::run(BlockRunner* runner) {
    if (!runner -> values -> contains("xmlid")) {
        runner -> values -> set("xmlid", xmlid.size() > 0 ? Value::str(xmlid) : Value::none());
        int64_t id;
        runner -> values -> set("viewid", isNumber(viewid) && toInteger(viewid, id) ? Value::integer(id) : Value::str(viewid));
    }
    runner -> enter(runner -> compiled -> block(body) -> code);
}


void NotFoundStatement::run(BlockRunner* runner) {
    if (runner -> options -> raiseIfNotFound) {
        throw TemplateNotFound(message);
    }
    printf(WARNING "Cannot load template %s: %s\n", ref.c_str(), message.c_str());
}
