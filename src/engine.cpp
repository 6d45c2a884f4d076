#include <engine.hpp>
#include <session.hpp>
#include <compiler/compiler.hpp>
#include <render/callparams.hpp>
#include <render/stack.hpp>
#include <util.hpp>
#include <cstdio>


Engine::Engine() {
    loader = &defaultLoader;
    cache = &defaultCache;
    fields = &defaultFields;
    assets = &defaultAssets;
    access = &defaultAccess;
    profiler = &defaultProfiler;
}

void Engine::setLoader(TemplateLoader* l) {
    loader = l == NULL ? &defaultLoader : l;
}

void Engine::setCache(TemplateCache* c) {
    cache = c == NULL ? &defaultCache : c;
}

void Engine::setFieldConverter(FieldConverter* f) {
    fields = f == NULL ? &defaultFields : f;
}

void Engine::setAssetLinker(AssetLinker* a) {
    assets = a == NULL ? &defaultAssets : a;
}

void Engine::setAccessControl(AccessControl* a) {
    access = a == NULL ? &defaultAccess : a;
}

void Engine::setProfileTracker(ProfileTracker* p) {
    profiler = p == NULL ? &defaultProfiler : p;
}

std::shared_ptr<const CompiledTemplate> Engine::compile(const std::string& ref, const RenderOptions& options) {
    std::string key = ref + "|" + options.cacheKey();
    std::shared_ptr<const CompiledTemplate> found = cache -> get(key);
    if (found != NULL) {
        if (found -> failure != NULL) {
            throw CompileError(*found -> failure);
        }
        return found;
    }

    compileCount ++;
    LoadedTemplate loaded;
    try {
        loaded = loader -> load(ref);
    }
    catch (TemplateNotFound& e) { // deferred: the error only surfaces if the template actually runs
        std::shared_ptr<const CompiledTemplate> missing = notFoundTemplate(ref, e.message(), options);
        cache -> put(key, missing);
        return cache -> get(key);
    }

    TemplateSource source;
    source.element = loaded.element;
    source.ref = loaded.id.size() ? loaded.id : ref;
    source.refName = loaded.key;
    source.document = loaded.document;
    source.defName = toVarname("template_" + (loaded.key.find('<') == std::string::npos ? loaded.key : "") + "_" + source.ref);

    std::shared_ptr<CompiledTemplate> compiled;
    try {
        compiled = compileTemplate(source, options);
    }
    catch (CompileError& e) {
        std::shared_ptr<CompiledTemplate> failed = std::make_shared<CompiledTemplate>();
        failed -> ref = source.ref;
        failed -> refName = source.refName;
        failed -> options = options;
        failed -> failure = std::make_shared<CompileError>(e);
        cache -> put(key, failed);
        throw;
    }
    cache -> put(key, compiled);
    std::shared_ptr<const CompiledTemplate> stored = cache -> get(key); // somebody else may have won the race
    return stored != NULL ? stored : compiled;
}

std::shared_ptr<const CompiledTemplate> Engine::compile(const XmlElement& element, const RenderOptions& options) {
    std::unique_ptr<XmlElement> copy(element.cloneElement());
    XmlElement* named = copy -> findNamed("t-name");
    TemplateSource source;
    source.element = named != NULL ? named : copy.get(); // only the named template of a <templates> document
    source.ref = named != NULL ? named -> get("t-name") : "etree._Element";
    source.refName = source.ref;
    source.document = element.serialize();
    source.defName = "template_etree_" + std::to_string(++ inlineCount);
    compileCount ++;
    std::shared_ptr<CompiledTemplate> ret = compileTemplate(source, options);
    return ret;
}

std::string Engine::render(const std::string& ref, const Mapping& values, RenderOptions options) {
    StringWriteOutput out;
    render(ref, values, options, out);
    return out.content;
}

std::string Engine::render(const XmlElement& element, const Mapping& values, RenderOptions options) {
    Session session(this, values, options);
    std::shared_ptr<CallParameters> params = std::make_shared<CallParameters>();
    params -> compiled = compile(element, options);
    params -> ref = params -> compiled -> ref;
    params -> directive = "render";
    return session.render(params);
}

void Engine::render(const std::string& ref, const Mapping& values, RenderOptions options, WriteOutput& out) {
    Session session(this, values, options);
    std::shared_ptr<CallParameters> params = std::make_shared<CallParameters>();
    params -> ref = ref;
    params -> directive = "render";
    RenderStack stack(&session, params);
    stack.run(out);
}

void Engine::clearCache() {
    cache -> clear();
    printf(INFO "Template cache cleared\n");
}
