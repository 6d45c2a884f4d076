#include <collaborators/loader.hpp>
#include <xml/parser.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <algorithm>
#include <cstdio>


MemoryLoader::~MemoryLoader() {
    clear();
}

std::vector<std::string> MemoryLoader::add(const std::string& xml, const std::string& source) {
    XmlElement* root = parseXml(xml, source);
    documents.push_back(root);
    std::vector<std::string> names;
    if (root -> tag == "templates") {
        for (XmlNode* child : root -> children) {
            if (child -> type == XmlNode::Element) {
                index((XmlElement*)child, xml, source, names);
            }
        }
    }
    else {
        index(root, xml, source, names);
    }
    return names;
}

void MemoryLoader::index(XmlElement* el, const std::string& document, const std::string& source, std::vector<std::string>& names) {
    if (!el -> has("t-name")) {
        return;
    }
    std::string name = el -> get("t-name");
    if (el -> has("t-inherit")) {
        printf(WARNING "Template %s in %s inherits from %s; inheritance is not applied by this loader, it is registered as written\n", name.c_str(), source.c_str(), el -> get("t-inherit").c_str());
    }
    LoadedTemplate loaded;
    loaded.element = el;
    loaded.document = document;
    loaded.id = std::to_string(nextId ++);
    loaded.key = name;
    if (byName.count(name) > 0) {
        printf(WARNING "Template %s is defined again in %s; the last definition wins\n", name.c_str(), source.c_str());
    }
    byName[name] = loaded;
    byId[loaded.id] = loaded;
    names.push_back(name);
}

void MemoryLoader::clear() {
    byName.clear();
    byId.clear();
    for (XmlElement* document : documents) {
        delete document;
    }
    documents.clear();
}

LoadedTemplate MemoryLoader::load(const std::string& ref) {
    auto& table = isNumber(ref) ? byId : byName;
    auto found = table.find(ref);
    if (found == table.end()) {
        throw TemplateNotFound("External ID can not be loaded: " + ref);
    }
    return found -> second;
}


DirectoryLoader::DirectoryLoader(std::string dir) : files(dir) {
    reload();
}

void DirectoryLoader::reload() {
    clear();
    if (files.checkPath(files.dir) != FileMan::Directory) {
        printf(ERROR "Template directory %s doesn't exist or isn't a directory!\n", files.dir.c_str());
        return;
    }
    std::vector<std::string> found;
    files.walk([&](std::string path) {
        if (endsWith(path, ".xml")) {
            found.push_back(path);
        }
    }, [](std::string) {});
    std::sort(found.begin(), found.end()); // later files win name clashes, so the order can't depend on the filesystem
    for (const std::string& path : found) {
        files.uncache(path);
        MapView map = files.open(path);
        if (!map.isValid()) {
            printf(ERROR "Couldn't read template file %s\n", path.c_str());
            continue;
        }
        try {
            std::vector<std::string> names = add(map.toString(), files.arcTransmuted(path));
            printf(INFO "Loaded %zu templates from %s\n", names.size(), files.arcTransmuted(path).c_str());
        }
        catch (CompileError& e) {
            printf(ERROR "Couldn't parse %s\n\t%s\n", path.c_str(), e.message().c_str());
        }
    }
}
