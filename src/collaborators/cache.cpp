#include <collaborators/cache.hpp>


std::shared_ptr<const CompiledTemplate> MemoryTemplateCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = entries.find(key);
    if (found == entries.end()) {
        return NULL;
    }
    return found -> second;
}

void MemoryTemplateCache::put(const std::string& key, std::shared_ptr<const CompiledTemplate> compiled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    entries.insert({ key, compiled }); // no-op if the key is already there
}

void MemoryTemplateCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    entries.clear();
}

size_t MemoryTemplateCache::size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return entries.size();
}
