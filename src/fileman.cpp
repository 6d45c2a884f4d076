// definitions for FileMan

#include <fileman.hpp>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <fts.h>
#include <cerrno>
#include <cstdio>


FileMan::FileMan(std::string rdir) {
    dir = rdir;
}

FileMan::PathState FileMan::checkPath(std::string path) {
    struct stat sb;
    if (stat(transmuted(path).c_str(), &sb) == 0) {
        if (S_ISDIR(sb.st_mode)) {
            return FileMan::PathState::Directory;
        }
        else if (S_ISREG(sb.st_mode)) {
            return FileMan::PathState::File;
        }
        else {
            return FileMan::PathState::Other;
        }
    }
    else if (errno == ENOENT) {
        return FileMan::PathState::CNEP;
    }
    else {
        return FileMan::PathState::Error;
    }
}

FileWriteOutput FileMan::create(std::string name) {
    name = transmuted(name);
    mkdirR(name);
    mode_t mask = umask(0);
    int output = ::open(name.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0664);
    umask(mask);
    if (output == -1) {
        printf(ERROR "Couldn't open output file %s. Nothing will be written to it.\n", name.c_str());
        perror("\topen");
    }
    return FileWriteOutput(output);
}

MapView FileMan::open(std::string name) {
    auto found = maps.find(name);
    if (found != maps.end()) {
        if (!found -> second.needsReload()) {
            return found -> second;
        }
        maps.erase(found);
    }
    MapView m(name);
    if (m.isValid()) {
        maps.insert({ name, m });
    }
    return m;
}

void FileMan::uncache(std::string path) {
    maps.erase(path);
}

std::string FileMan::transmuted(std::string path) {
    if (startsWith(path, dir)) { // already absolute-ish (fts hands us paths that include dir)
        return path;
    }
    return fconcat(dir, path);
}

std::string FileMan::arcTransmuted(std::string path) {
    if (path.size() <= dir.size() || !startsWith(path, dir)) {
        return path;
    }
    std::string ret = path.substr(dir.size() + (dir[dir.size() - 1] == '/' ? 0 : 1), path.size());
    return ret;
}

void FileMan::walk(std::function<void(std::string)> onFile, std::function<void(std::string)> onDirectory) {
    char* paths[] = { (char*)dir.c_str(), NULL }; // for FTS
    FTS* ftsp = fts_open(paths, FTS_PHYSICAL | FTS_NOCHDIR, NULL);
    if (ftsp == NULL) {
        printf(ERROR "Couldn't initiate directory traversal of %s.\n", dir.c_str());
        perror("\tfts_open");
        return;
    }
    FTSENT* ent;
    while ((ent = fts_read(ftsp)) != NULL) {
        if (ent -> fts_info == FTS_F) {
            onFile(ent -> fts_path);
        }
        else if (ent -> fts_info == FTS_D) {
            onDirectory(ent -> fts_path);
        }
    }
    fts_close(ftsp);
}
