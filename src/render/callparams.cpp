#include <render/callparams.hpp>


std::string CallParameters::describe() const {
    static const char* scopes[] = { "False", "True", "'root'" };
    std::string ret = "QwebCallParameters(context=" + Value::dict(context).repr();
    ret += ", view_ref=" + (ref.size() ? Value::str(ref).repr() : "None");
    ret += ", method=" + (block.size() ? Value::str(block).repr() : "None");
    ret += ", values=" + (values != NULL ? Value::dict(*values).repr() : "None");
    ret += ", scope=" + std::string(scopes[scope]);
    ret += ", directive=" + Value::str(directive).repr();
    ret += ", path_xml=" + (path.empty() ? "None" : path.toString()) + ")";
    return ret;
}
