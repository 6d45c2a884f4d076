#include <types/IfStatement.hpp>
#include <blockrunner.hpp>


IfStatement::~IfStatement() {
    deleteCode(body);
    deleteCode(orelse);
}

void IfStatement::run(BlockRunner* runner) {
    if (condition -> eval(runner -> values).truthy()) {
        runner -> enter(body);
    }
    else {
        runner -> enter(orelse);
    }
}
