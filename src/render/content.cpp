#include <render/content.hpp>
#include <render/stack.hpp>


ContentValue::ContentValue(Session* s, std::shared_ptr<CallParameters> p) : session(s), params(p) {}

std::string ContentValue::html() {
    if (!done) {
        RenderStack stack(session, params);
        rendered = stack.run();
        done = true;
    }
    return rendered;
}

std::string ContentValue::describe() const {
    return "<QwebContent " + (done ? Value::str(rendered).repr() : params -> describe()) + ">";
}
