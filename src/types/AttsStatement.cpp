#include <types/AttsStatement.hpp>
#include <blockrunner.hpp>
#include <evals/ops.hpp>


static void mergePair(Mapping& target, const Value& pair, size_t n) {
    Sequence parts = iterate(pair);
    if (parts.size() != 2) {
        throw EvalError("ValueError", "dictionary update sequence element #" + std::to_string(n) + " has length " + std::to_string(parts.size()) + "; 2 is required");
    }
    target.set(keyOf(parts[0]), parts[1]);
}

void mergePairs(Mapping& target, const Value& pairs) {
    if (pairs.kind == Value::Dict) {
        target.update(*pairs.map);
        return;
    }
    if (!pairs.isSequence() || pairs.seq -> size() == 0) {
        return;
    }
    if (!(*pairs.seq)[0].isSequence()) { // a single (name, value)
        mergePair(target, pairs, 0);
        return;
    }
    for (size_t n = 0; n < pairs.seq -> size(); n ++) {
        mergePair(target, (*pairs.seq)[n], n);
    }
}


void AttsStatement::run(BlockRunner* runner) {
    std::shared_ptr<Mapping> attrs = std::make_shared<Mapping>();
    for (const AttributeEntry& entry : entries) {
        switch (entry.kind) {
            case AttributeEntry::Static:
                attrs -> set(entry.name, Value::str(entry.value));
                break;
            case AttributeEntry::Format:
                attrs -> set(entry.name, Value::str(entry.format -> render(runner -> values)));
                break;
            case AttributeEntry::Expr:
                attrs -> set(entry.name, entry.expr -> eval(runner -> values));
                break;
            case AttributeEntry::Spread:
                mergePairs(*attrs, entry.expr -> eval(runner -> values));
                break;
        }
    }
    runner -> pendingAttrs = attrs;
}
