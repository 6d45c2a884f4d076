#pragma once
#include <instruction.hpp>
#include <evals/value.hpp>
#include <string>
#include <utility>
#include <vector>
#include <defs.h>


typedef std::pair<std::string, Mapping> AssetNode; // tag, attributes


struct AssetsStatement : Instruction { // t-call-assets
    std::string bundle;
    bool css = true;
    bool js = true;
    bool deferLoad = false;
    bool lazyLoad = false;
    bool autoprefix = false;
    std::string media; // empty: no media attribute

    void run(BlockRunner* runner);
};


bool linkToNode(const std::string& path, bool deferLoad, bool lazyLoad, const std::string& media, AssetNode& out); // false for unknown extensions
