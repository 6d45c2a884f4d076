// Engine ties the template compiler to its collaborators and the compiled template cache. One engine serves any number of
// concurrent renders; everything a render mutates lives in its Session.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <options.hpp>
#include <template.hpp>
#include <writer.hpp>
#include <collaborators/loader.hpp>
#include <collaborators/cache.hpp>
#include <collaborators/fields.hpp>
#include <collaborators/assets.hpp>
#include <collaborators/access.hpp>
#include <collaborators/profiler.hpp>
#include <atomic>
#include <memory>
#include <string>


struct Engine {
    MemoryLoader defaultLoader;
    MemoryTemplateCache defaultCache;
    DefaultFieldConverter defaultFields;
    StaticAssetLinker defaultAssets;
    GroupAccess defaultAccess;
    CountingProfiler defaultProfiler;

    TemplateLoader* loader; // none of these are owned
    TemplateCache* cache;
    FieldConverter* fields;
    AssetLinker* assets;
    AccessControl* access;
    ProfileTracker* profiler;

    std::atomic<size_t> compileCount{ 0 }; // templates actually compiled, cache hits excluded
    std::atomic<size_t> inlineCount{ 0 }; // names inline templates

    Engine();

    Engine(const Engine&) = delete;

    void setLoader(TemplateLoader* l); // NULL puts the default back, for all of these

    void setCache(TemplateCache* c);

    void setFieldConverter(FieldConverter* f);

    void setAssetLinker(AssetLinker* a);

    void setAccessControl(AccessControl* a);

    void setProfileTracker(ProfileTracker* p);

    std::shared_ptr<const CompiledTemplate> compile(const std::string& ref, const RenderOptions& options); // cached. throws CompileError

    std::shared_ptr<const CompiledTemplate> compile(const XmlElement& element, const RenderOptions& options); // never cached. throws CompileError

    std::string render(const std::string& ref, const Mapping& values = {}, RenderOptions options = {});

    std::string render(const XmlElement& element, const Mapping& values = {}, RenderOptions options = {});

    void render(const std::string& ref, const Mapping& values, RenderOptions options, WriteOutput& out); // streams chunks as they come

    void clearCache();
};
