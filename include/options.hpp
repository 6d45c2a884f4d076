// Rendering options. The first five are part of a compiled template's cache key: changing any of them means compiling again.
#pragma once
#include <evals/value.hpp>
#include <string>


struct RenderOptions {
    std::string lang; // empty means unset
    bool inheritBranding = false;
    bool inheritBrandingAuto = false;
    bool editTranslations = false;
    bool profile = false;

    bool devMode = false; // t-debug works, deprecated directives get reported
    bool raiseIfNotFound = true;
    bool preserveComments = false;
    bool minimalQcontext = false;
    std::string debug; // bound as `debug` in the environment

    Mapping toDict() const;

    RenderOptions overlay(const Mapping& context) const; // a copy, with the known keys of context applied

    std::string cacheKey() const;
};
