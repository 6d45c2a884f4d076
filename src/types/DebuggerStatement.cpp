#include <types/DebuggerStatement.hpp>
#include <blockrunner.hpp>
#include <cstdio>


void DebuggerStatement::run(BlockRunner* runner) {
    if (debugger.size() > 0) {
        if (debugger != "pdb" && debugger != "ipdb" && debugger != "wdb" && debugger != "pudb") {
            throw EvalError("ValueError", "unsupported t-debug value: " + debugger);
        }
        printf(WARNING "Using t-debug with an explicit debugger (%s) is deprecated, leave the value empty\n", debugger.c_str());
    }
    printf("==== DEBUGGER BREAK ====\n");
    printf("++++     ELEMENT    ++++\n");
    printf("\t%s\n\t%s\n", runner -> lastPath.path.c_str(), runner -> lastPath.xml.c_str());
    printf("++++     VALUES     ++++\n");
    for (auto& binding : runner -> values -> items) {
        printf("\t%s = %s\n", binding.first.c_str(), binding.second.repr().c_str());
    }
    printf("====  DEBUGGER OVER ====\n");
}
