#include <collaborators/access.hpp>
#include <util.hpp>


bool GroupAccess::hasGroups(const std::string& spec) {
    std::vector<std::string> wanted;
    std::vector<std::string> excluded;
    for (std::string group : splitOn(spec, ',')) {
        group = stripWhitespace(group);
        if (group.size() == 0) {
            continue;
        }
        if (group[0] == '!') {
            excluded.push_back(stripWhitespace(group.substr(1)));
        }
        else {
            wanted.push_back(group);
        }
    }
    for (const std::string& group : excluded) {
        if (groups.count(group) > 0) {
            return false;
        }
    }
    if (wanted.size() == 0) {
        return true;
    }
    for (const std::string& group : wanted) {
        if (groups.count(group) > 0) {
            return true;
        }
    }
    return false;
}
