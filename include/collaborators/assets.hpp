// Asset bundles: t-call-assets asks for the links of a bundle and turns them into <script> and <link> nodes.
#pragma once
#include <defs.h>
#include <map>
#include <string>
#include <vector>


struct AssetLinker {
    virtual ~AssetLinker() {}

    virtual std::vector<std::string> links(const std::string& bundle, bool css, bool js) = 0;
};


struct StaticAssetLinker : AssetLinker { // bundle name -> urls, configured up front
    std::map<std::string, std::vector<std::string>> bundles;

    void add(const std::string& bundle, std::vector<std::string> urls);

    std::vector<std::string> links(const std::string& bundle, bool css, bool js);
};
