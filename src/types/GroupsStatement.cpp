#include <types/GroupsStatement.hpp>
#include <blockrunner.hpp>
#include <session.hpp>
#include <engine.hpp>


GroupsStatement::~GroupsStatement() {
    deleteCode(body);
}

void GroupsStatement::run(BlockRunner* runner) {
    if (runner -> session -> engine -> access -> hasGroups(groups)) {
        runner -> enter(body);
    }
}
