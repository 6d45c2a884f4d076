#include <errors.hpp>
#include <util.hpp>


static std::string quoted(const std::string& thing) {
    std::string ret = "'";
    for (char c : thing) {
        if (c == '\'' || c == '\\') {
            ret += '\\';
        }
        ret += c;
    }
    return ret + "'";
}


bool PathXml::empty() const {
    return path.size() == 0 && xml.size() == 0;
}

bool PathXml::operator==(const PathXml& other) const {
    return ref == other.ref && path == other.path && xml == other.xml;
}

std::string PathXml::toString() const {
    std::string r = isNumber(ref) ? ref : (ref.size() ? quoted(ref) : "None");
    return "(" + r + ", " + quoted(path) + ", " + quoted(xml) + ")";
}


std::string ErrorInfo::toString() const {
    std::string ret = error;
    if (templateName.size()) {
        ret += "\n    Template: " + templateName;
    }
    if (ref.size()) {
        ret += "\n    Reference: " + ref;
    }
    if (path.size()) {
        ret += "\n    Path: " + path;
    }
    if (element.size()) {
        ret += "\n    Element: " + element;
    }
    if (source.size()) {
        ret += "\n    From: ";
        for (size_t i = 0; i < source.size(); i ++) {
            if (i > 0) {
                ret += "\n          ";
            }
            ret += source[i].toString();
        }
    }
    return ret;
}


TemplateError::TemplateError(std::string k, std::string message) : std::runtime_error(message), kind(k) {
    info.error = kind + ": " + message;
}

std::string TemplateError::message() const {
    return what();
}

std::string TemplateError::describe() const {
    if (!annotated) {
        return info.error;
    }
    return "Error while rendering the template:\n    " + info.toString();
}


CompileError::CompileError(std::string message, std::string kind) : TemplateError(kind, message) {}

TemplateNotFound::TemplateNotFound(std::string message) : TemplateError("MissingError", message) {}

EvalError::EvalError(std::string kind, std::string message) : TemplateError(kind, message) {}

RenderError::RenderError(std::string kind, std::string message) : TemplateError(kind, message) {}

RecursionError::RecursionError() : TemplateError("RecursionError", "Qweb template infinite recursion") {}

StorageConflictError::StorageConflictError(std::string message) : std::runtime_error(message) {}
