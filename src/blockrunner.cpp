#include <blockrunner.hpp>
#include <instruction.hpp>
#include <types/ForLoop.hpp>
#include <render/callparams.hpp>
#include <render/content.hpp>


BlockRunner::BlockRunner(Session* s, std::shared_ptr<const CompiledTemplate> c, const Code& code, std::shared_ptr<Mapping> v, const RenderOptions* o) : session(s), compiled(c), options(o), values(v) {
    enter(code);
}

bool BlockRunner::next(Item& out) {
    while (true) {
        if (pending.size() > 0) {
            out = pending.front();
            pending.pop_front();
            return true;
        }
        if (cursors.size() == 0) {
            return false;
        }
        Cursor& cursor = cursors.back();
        if (cursor.pc >= cursor.code -> size()) {
            if (cursor.loop != NULL && cursor.loop -> advance(this)) {
                cursor.pc = 0;
                continue;
            }
            if (cursor.restore != NULL) {
                values = cursor.restore;
            }
            cursors.pop_back();
            continue;
        }
        Instruction* ins = (*cursor.code)[cursor.pc];
        cursor.pc ++; // before running: run() may push cursors, which moves this one
        if (!ins -> where.empty()) {
            lastPath = ins -> where;
        }
        ins -> run(this);
    }
}

void BlockRunner::enter(const Code& code) {
    if (code.size() == 0) {
        return;
    }
    Cursor cursor;
    cursor.code = &code;
    cursors.push_back(cursor);
}

void BlockRunner::loop(const Code& code, std::shared_ptr<LoopState> state) {
    std::shared_ptr<Mapping> outer = values;
    if (!state -> advance(this)) {
        return;
    }
    Cursor cursor;
    cursor.code = &code;
    cursor.loop = state;
    cursor.restore = outer;
    cursors.push_back(cursor);
}

void BlockRunner::emit(const std::string& text) {
    if (text.size() == 0) {
        return;
    }
    if (pending.size() > 0 && pending.back().kind == Item::Text) {
        pending.back().text += text;
        return;
    }
    Item item;
    item.text = text;
    pending.push_back(item);
}

void BlockRunner::emit(std::shared_ptr<CallParameters> call) {
    Item item;
    item.kind = Item::Call;
    item.call = call;
    pending.push_back(item);
}

void BlockRunner::emitValue(const Value& v, bool escape) {
    if (v.kind == Value::Content) {
        std::shared_ptr<ContentValue> content = std::dynamic_pointer_cast<ContentValue>(v.content);
        if (content != NULL && !content -> done) {
            Item item;
            item.kind = Item::Content;
            item.content = content;
            pending.push_back(item);
            return;
        }
        emit(v.content -> html());
        return;
    }
    if (v.isNone() || (v.kind == Value::Bool && !v.b)) {
        return;
    }
    emit(escape ? v.escaped() : v.toString());
}

std::shared_ptr<Mapping> BlockRunner::takeOptions() {
    std::shared_ptr<Mapping> ret = pendingOptions;
    pendingOptions = NULL;
    if (ret == NULL) {
        ret = std::make_shared<Mapping>();
    }
    return ret;
}
