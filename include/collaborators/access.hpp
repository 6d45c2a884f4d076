// Visibility of t-groups elements.
#pragma once
#include <defs.h>
#include <set>
#include <string>


struct AccessControl {
    virtual ~AccessControl() {}

    virtual bool hasGroups(const std::string& groups) = 0; // comma separated; !group means "not in group"
};


struct GroupAccess : AccessControl { // the groups the current user is in
    std::set<std::string> groups;

    GroupAccess() {}

    GroupAccess(std::set<std::string> g) : groups(g) {}

    bool hasGroups(const std::string& spec);
};
