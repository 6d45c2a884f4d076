#include <types/TagAttributes.hpp>
#include <blockrunner.hpp>
#include <util.hpp>


void sanitizeAttributes(Mapping& attrs) {
    for (auto& item : attrs.items) {
        if (isUrlAttribute(item.first) && item.second.truthy() && isMaliciousUrl(item.second.toString())) {
            item.second = Value::str("");
        }
    }
}

std::string renderAttributes(const Mapping& attrs) {
    std::string ret;
    for (auto& item : attrs.items) {
        const Value& v = item.second;
        if (v.kind == Value::Str || v.kind == Value::Markup || v.truthy()) {
            ret += " " + escapeHtml(item.first) + "=\"" + escapeHtml(v.toString()) + "\"";
        }
    }
    return ret;
}


void TagAttributes::run(BlockRunner* runner) {
    std::shared_ptr<Mapping> attrs = runner -> pendingAttrs;
    runner -> pendingAttrs = NULL;
    if (attrs == NULL || attrs -> size() == 0) {
        return;
    }
    sanitizeAttributes(*attrs);
    runner -> emit(renderAttributes(*attrs));
}
