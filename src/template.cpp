#include <template.hpp>
#include <instruction.hpp>


void deleteCode(Code& code) {
    for (Instruction* ins : code) {
        delete ins;
    }
    code.clear();
}


Block::~Block() {
    deleteCode(code);
}


CompiledTemplate::~CompiledTemplate() {
    for (auto& b : blocks) {
        delete b.second;
    }
}

const Block* CompiledTemplate::block(const std::string& name) const {
    auto found = blocks.find(name);
    if (found == blocks.end()) {
        throw RenderError("KeyError", "'" + name + "'");
    }
    return found -> second;
}

std::string CompiledTemplate::displayName() const {
    return refName.size() ? refName : ref;
}
