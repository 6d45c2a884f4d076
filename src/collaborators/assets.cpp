#include <collaborators/assets.hpp>
#include <util.hpp>


static bool isStylesheet(const std::string& link) {
    return endsWith(link, ".css") || endsWith(link, ".scss") || endsWith(link, ".sass") || endsWith(link, ".less");
}


void StaticAssetLinker::add(const std::string& bundle, std::vector<std::string> urls) {
    std::vector<std::string>& links = bundles[bundle];
    links.insert(links.end(), urls.begin(), urls.end());
}

std::vector<std::string> StaticAssetLinker::links(const std::string& bundle, bool css, bool js) {
    std::vector<std::string> ret;
    auto found = bundles.find(bundle);
    if (found == bundles.end()) {
        return ret;
    }
    for (const std::string& link : found -> second) { // stylesheets first, like a generated bundle
        if (css && isStylesheet(link)) {
            ret.push_back(link);
        }
    }
    for (const std::string& link : found -> second) {
        if (js && !isStylesheet(link)) {
            ret.push_back(link);
        }
    }
    return ret;
}
