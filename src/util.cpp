#include <util.hpp>
#include <set>
#include <cerrno>
#include <cstdlib>
#include <cstdio>
// definitions for util functions


void mkdirR(std::string filename) { // recursively create the directories before a file
    // expects syntax like directory/directory/directory/file or directory/directory/directory/. directory/directory/directory is not supported.
    struct stat sb;
    size_t blobend = 0;
    while (blobend < filename.size()) {
        if (filename[blobend] == '/' && blobend > 0) {
            std::string dirname = filename.substr(0, blobend);
            if (stat(dirname.c_str(), &sb) == -1) {
                if (mkdir(dirname.c_str(), 0) != 0) {
                    printf(ERROR "Couldn't create %s!\n", dirname.c_str());
                    perror("\tmkdir");
                }
                chmod(dirname.c_str(), 0755);
            }
            else if (!S_ISDIR(sb.st_mode)) {
                printf(ERROR "%s exists and is not a directory. Aborting recursive mkdir operation.\n", dirname.c_str());
                return;
            }
        }
        blobend++;
    }
}


bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r' || thing == '\f' || thing == '\v';
}


bool isBlank(const std::string& thing) {
    if (thing.size() == 0) {
        return false;
    }
    for (char c : thing) {
        if (!isWhitespace(c)) {
            return false;
        }
    }
    return true;
}


bool isNumber(const std::string& data) {
    if (data.size() == 0) {
        return false;
    }
    for (char c : data) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}


static bool isIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool isIdentByte(char c) {
    return isIdentStart(c) || (c >= '0' && c <= '9');
}


bool toInteger(const std::string& digits, int64_t& out) {
    errno = 0;
    char* end = NULL;
    long long v = strtoll(digits.c_str(), &end, 10);
    if (digits.size() == 0 || *end != 0 || errno == ERANGE) {
        return false;
    }
    out = v;
    return true;
}

bool isVarname(const std::string& name) {
    if (name.size() == 0 || !isIdentStart(name[0])) {
        return false;
    }
    for (char c : name) {
        if (!isIdentByte(c)) {
            return false;
        }
    }
    return true;
}


std::string toVarname(const std::string& name) {
    std::string ret;
    ret.reserve(name.size());
    bool inRun = false;
    for (char c : name) {
        if (isIdentByte(c)) {
            ret += c;
            inRun = false;
        }
        else if (!inRun) {
            ret += '_';
            inRun = true;
        }
    }
    return ret;
}


bool startsWith(const std::string& thing, const std::string& prefix) {
    return thing.size() >= prefix.size() && thing.compare(0, prefix.size(), prefix) == 0;
}


bool endsWith(const std::string& thing, const std::string& suffix) {
    return thing.size() >= suffix.size() && thing.compare(thing.size() - suffix.size(), suffix.size(), suffix) == 0;
}


std::string stripWhitespace(const std::string& thing) {
    size_t start = 0;
    size_t end = thing.size();
    while (start < end && isWhitespace(thing[start])) {start ++;}
    while (end > start && isWhitespace(thing[end - 1])) {end --;}
    return thing.substr(start, end - start);
}


std::vector<std::string> splitOn(const std::string& thing, char sep) {
    std::vector<std::string> ret;
    size_t chunkStart = 0;
    for (size_t i = 0; i <= thing.size(); i ++) {
        if (i == thing.size() || thing[i] == sep) {
            ret.push_back(thing.substr(chunkStart, i - chunkStart));
            chunkStart = i + 1;
        }
    }
    return ret;
}


std::string toLower(std::string thing) {
    for (size_t i = 0; i < thing.size(); i ++) {
        if (thing[i] >= 'A' && thing[i] <= 'Z') {
            thing[i] += 'a' - 'A';
        }
    }
    return thing;
}


std::string escapeHtml(const std::string& thing) {
    std::string ret;
    ret.reserve(thing.size());
    for (char c : thing) {
        switch (c) {
            case '&': ret += "&amp;"; break;
            case '<': ret += "&lt;"; break;
            case '>': ret += "&gt;"; break;
            case '"': ret += "&#34;"; break;
            case '\'': ret += "&#39;"; break;
            default: ret += c;
        }
    }
    return ret;
}


std::string escapeText(const std::string& thing) {
    std::string ret;
    ret.reserve(thing.size());
    for (char c : thing) {
        switch (c) {
            case '&': ret += "&amp;"; break;
            case '<': ret += "&lt;"; break;
            case '>': ret += "&gt;"; break;
            default: ret += c;
        }
    }
    return ret;
}


bool isMaliciousUrl(const std::string& url) { // javascript:(?!( ?)((window\.)?)history\.back\(\)$), case insensitive, searched anywhere
    std::string lower = toLower(url);
    size_t pos = lower.find("javascript:");
    while (pos != std::string::npos) {
        std::string rest = lower.substr(pos + 11);
        if (rest.size() > 0 && rest[0] == ' ') {
            rest = rest.substr(1);
        }
        if (startsWith(rest, "window.")) {
            rest = rest.substr(7);
        }
        if (rest != "history.back()") {
            return true;
        }
        pos = lower.find("javascript:", pos + 1);
    }
    return false;
}

std::string quotePlus(const std::string& thing, const std::string& safe) {
    static const char* hex = "0123456789ABCDEF";
    std::string ret;
    for (char c : thing) {
        unsigned char u = (unsigned char)c;
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-' || c == '~' || (c != 0 && safe.find(c) != std::string::npos)) {
            ret += c;
        }
        else if (c == ' ') {
            ret += '+';
        }
        else {
            ret += '%';
            ret += hex[u >> 4];
            ret += hex[u & 15];
        }
    }
    return ret;
}

bool isUrlAttribute(const std::string& name) {
    static const std::set<std::string> urls = { "href", "src", "action", "formaction", "xlink:href" };
    return urls.count(name) > 0;
}

bool isVoidElement(const std::string& tag) {
    static const std::set<std::string> voids = {
        "area", "base", "br", "col", "embed", "hr", "img", "input", "keygen",
        "link", "menuitem", "meta", "param", "source", "track", "wbr"
    };
    return voids.count(tag) > 0;
}


std::string rstripNewline(std::string& text) { // \n[ \t]*$
    size_t i = text.size();
    while (i > 0 && (text[i - 1] == ' ' || text[i - 1] == '\t')) {
        i --;
    }
    if (i > 0 && text[i - 1] == '\n') {
        std::string stripped = text.substr(i - 1);
        text.resize(i - 1);
        return stripped;
    }
    return "";
}


bool lstripNewline(const std::string& text) { // ^[ \t]*\n
    for (char c : text) {
        if (c == '\n') {
            return true;
        }
        if (c != ' ' && c != '\t') {
            return false;
        }
    }
    return false;
}


std::string collapseFirstNewlines(const std::string& text) { // ^(\n[ \t]*)+(\n[ \t])
    // find every "\n[ \t]*" run at the start; the last run that still has a space or tab after its newline is kept
    std::vector<size_t> runs;
    size_t i = 0;
    while (i < text.size() && text[i] == '\n') {
        runs.push_back(i);
        i ++;
        while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
            i ++;
        }
    }
    for (size_t r = runs.size(); r > 1; r --) { // at least one run must remain for the first group
        size_t keep = runs[r - 1];
        if (keep + 1 < text.size() && (text[keep + 1] == ' ' || text[keep + 1] == '\t')) {
            return text.substr(keep);
        }
    }
    return text;
}


size_t utf8Length(const std::string& thing) {
    size_t ret = 0;
    for (unsigned char c : thing) {
        if ((c & 0xC0) != 0x80) {
            ret ++;
        }
    }
    return ret;
}


std::vector<std::string> utf8Split(const std::string& thing) {
    std::vector<std::string> ret;
    for (size_t i = 0; i < thing.size(); i ++) {
        unsigned char c = thing[i];
        if ((c & 0xC0) != 0x80 || ret.size() == 0) {
            ret.push_back(std::string(1, thing[i]));
        }
        else {
            ret.back() += thing[i];
        }
    }
    return ret;
}


std::string fconcat(std::string one, std::string two) { // sanely glue two filenames together (useful for things like "templates" + "web.xml")
    if (one.size() == 0) {
        return two;
    }
    if (two.size() == 0) {
        return one;
    }
    if (one[one.size() - 1] == '/' && two[0] == '/') {
        return one.substr(0, one.size() - 1) + two;
    }
    else if (one[one.size() - 1] == '/' || two[0] == '/') {
        return one + two;
    }
    else {
        return one + '/' + two;
    }
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += (char)cp;
    }
    else if (cp < 0x800) {
        out += (char)(0xC0 | (cp >> 6));
        out += (char)(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000) {
        out += (char)(0xE0 | (cp >> 12));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
    else {
        out += (char)(0xF0 | (cp >> 18));
        out += (char)(0x80 | ((cp >> 12) & 0x3F));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
}
