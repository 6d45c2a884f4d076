#include <types/ForLoop.hpp>
#include <blockrunner.hpp>
#include <evals/ops.hpp>


bool LoopState::advance(BlockRunner* runner) {
    index ++;
    Value item;
    Value value;
    switch (source) {
        case Count:
            if (index >= size) {
                return false;
            }
            item = Value::integer(index);
            value = item;
            break;
        case Items:
            if (index >= (int64_t)collection.seq -> size()) { // a list can grow or shrink while it's looped over
                return false;
            }
            item = (*collection.seq)[index];
            value = item;
            break;
        case Pairs:
            if ((int64_t)collection.map -> size() != size) {
                throw EvalError("RuntimeError", "dictionary changed size during iteration");
            }
            if (index >= size) {
                return false;
            }
            item = Value::str(collection.map -> items[index].first);
            value = collection.map -> items[index].second;
            break;
        case Characters:
            if (index >= size) {
                return false;
            }
            item = characters[index];
            value = item;
            break;
    }
    std::shared_ptr<Mapping> values = std::make_shared<Mapping>(*outer); // every pass starts over from the outer bindings
    values -> set(as + "_size", Value::integer(size));
    values -> set(as + "_index", Value::integer(index));
    values -> set(as, item);
    values -> set(as + "_value", value);
    values -> set(as + "_first", Value::boolean(index == 0));
    values -> set(as + "_last", Value::boolean(index + 1 == size));
    values -> set(as + "_odd", Value::integer(index % 2));
    values -> set(as + "_even", Value::boolean(index % 2 == 0));
    values -> set(as + "_parity", Value::str(index % 2 ? "odd" : "even"));
    runner -> values = values;
    return true;
}


ForLoop::~ForLoop() {
    deleteCode(body);
}

void ForLoop::run(BlockRunner* runner) {
    std::shared_ptr<LoopState> state = std::make_shared<LoopState>();
    state -> as = as;
    state -> outer = runner -> values;
    state -> size = count;
    if (iterable != NULL) {
        Value v = iterable -> eval(runner -> values);
        if (v.kind == Value::Content) {
            v = Value::markup(v.content -> html());
        }
        state -> size = 0;
        if (!v.truthy()) { // None, 0, empty: nothing to do
        }
        else if (v.kind == Value::Int) {
            state -> size = v.i;
        }
        else if (v.kind == Value::Dict) {
            state -> source = LoopState::Pairs;
            state -> collection = v;
            state -> size = v.map -> size();
        }
        else if (v.kind == Value::List || v.kind == Value::Tuple) {
            state -> source = LoopState::Items;
            state -> collection = v;
            state -> size = v.seq -> size();
        }
        else {
            state -> source = LoopState::Characters;
            state -> characters = iterate(v); // throws TypeError for anything else
            state -> size = state -> characters.size();
        }
    }
    runner -> loop(body, state);
}
