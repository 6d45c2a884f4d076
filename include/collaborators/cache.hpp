// The compiled template cache. Entries are immutable once put; the only invalidation is dropping everything.
#pragma once
#include <defs.h>
#include <template.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>


struct TemplateCache {
    virtual ~TemplateCache() {}

    virtual std::shared_ptr<const CompiledTemplate> get(const std::string& key) = 0; // NULL on a miss

    virtual void put(const std::string& key, std::shared_ptr<const CompiledTemplate> compiled) = 0; // the first put for a key wins

    virtual void clear() = 0;
};


struct MemoryTemplateCache : TemplateCache {
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const CompiledTemplate>> entries;

    std::shared_ptr<const CompiledTemplate> get(const std::string& key);

    void put(const std::string& key, std::shared_ptr<const CompiledTemplate> compiled);

    void clear();

    size_t size();
};
