#include <types/AssetsStatement.hpp>
#include <types/TagAttributes.hpp>
#include <blockrunner.hpp>
#include <session.hpp>
#include <engine.hpp>
#include <util.hpp>
#include <cstdio>


bool linkToNode(const std::string& path, bool deferLoad, bool lazyLoad, const std::string& media, AssetNode& out) {
    std::string ext = "js";
    if (path.size() > 0) {
        size_t dot = path.rfind('.');
        ext = dot == std::string::npos ? path : path.substr(dot + 1);
    }
    out.second = Mapping();
    if (ext == "js") {
        out.first = "script";
        out.second.set("type", Value::str("text/javascript"));
        if (deferLoad) {
            out.second.set("defer", Value::str("defer"));
        }
        if (path.size() > 0) {
            out.second.set(lazyLoad ? "data-src" : "src", Value::str(path));
        }
        if (startsWith(path, "/web/assets/")) {
            out.second.set("onerror", Value::str("__weftAssetError=1"));
        }
        return true;
    }
    if (ext == "css" || ext == "scss" || ext == "sass" || ext == "less") {
        out.first = "link";
        out.second.set("type", Value::str("text/" + ext));
        out.second.set("rel", Value::str("stylesheet"));
        out.second.set("href", Value::str(path));
        out.second.set("media", media.size() > 0 ? Value::str(media) : Value::none());
        return true;
    }
    if (ext == "xml") {
        out.first = "script";
        out.second.set("type", Value::str("text/xml"));
        out.second.set("async", Value::str("async"));
        out.second.set("rel", Value::str("prefetch"));
        out.second.set("data-src", Value::str(path));
        return true;
    }
    return false;
}


void AssetsStatement::run(BlockRunner* runner) {
    std::vector<std::string> links = runner -> session -> engine -> assets -> links(bundle, css, js);
    std::string out;
    bool first = true;
    for (const std::string& link : links) {
        AssetNode node;
        if (!linkToNode(link, deferLoad, lazyLoad, css ? media : "", node)) {
            printf(WARNING "Skipping asset %s of bundle %s: unknown file type\n", link.c_str(), bundle.c_str());
            continue;
        }
        if (!first) {
            out += "\n        ";
        }
        first = false;
        sanitizeAttributes(node.second);
        out += "<" + node.first + renderAttributes(node.second);
        if (isVoidElement(node.first)) {
            out += "/>";
        }
        else {
            out += "></" + node.first + ">";
        }
    }
    runner -> emit(out);
}
