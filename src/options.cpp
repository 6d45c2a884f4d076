#include <options.hpp>


Mapping RenderOptions::toDict() const {
    return Mapping {
        { "lang", lang.size() ? Value::str(lang) : Value::boolean(false) },
        { "inherit_branding", Value::boolean(inheritBranding) },
        { "inherit_branding_auto", Value::boolean(inheritBrandingAuto) },
        { "edit_translations", Value::boolean(editTranslations) },
        { "profile", Value::boolean(profile) },
        { "dev_mode", Value::boolean(devMode) },
        { "raise_if_not_found", Value::boolean(raiseIfNotFound) },
        { "preserve_comments", Value::boolean(preserveComments) },
        { "minimal_qcontext", Value::boolean(minimalQcontext) },
        { "debug", Value::str(debug) }
    };
}

RenderOptions RenderOptions::overlay(const Mapping& context) const {
    RenderOptions ret = *this;
    for (auto& item : context.items) {
        const std::string& key = item.first;
        const Value& v = item.second;
        if (key == "lang") {
            ret.lang = v.truthy() ? v.toString() : "";
        }
        else if (key == "inherit_branding") {
            ret.inheritBranding = v.truthy();
        }
        else if (key == "inherit_branding_auto") {
            ret.inheritBrandingAuto = v.truthy();
        }
        else if (key == "edit_translations") {
            ret.editTranslations = v.truthy();
        }
        else if (key == "profile") {
            ret.profile = v.truthy();
        }
        else if (key == "dev_mode") {
            ret.devMode = v.truthy();
        }
        else if (key == "raise_if_not_found") {
            ret.raiseIfNotFound = v.truthy();
        }
        else if (key == "preserve_comments") {
            ret.preserveComments = v.truthy();
        }
        else if (key == "minimal_qcontext") {
            ret.minimalQcontext = v.truthy();
        }
        else if (key == "debug") {
            ret.debug = v.truthy() ? v.toString() : "";
        }
    }
    return ret;
}

std::string RenderOptions::cacheKey() const {
    std::string ret = lang.size() ? lang : "False";
    ret += inheritBranding ? "|1" : "|0";
    ret += inheritBrandingAuto ? "1" : "0";
    ret += editTranslations ? "1" : "0";
    ret += profile ? "1" : "0";
    return ret;
}
