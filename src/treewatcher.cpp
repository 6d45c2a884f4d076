#include <treewatcher.hpp>
#include <sys/inotify.h>
#include <unistd.h>
#include <limits.h>
#include <sys/stat.h>
#include <cstdio>


TreeWatcher::TreeWatcher() {
    inotifier = inotify_init();
    if (inotifier == -1) {
        printf(ERROR "Couldn't start inotify; watch mode will never see a change.\n");
        perror("\tinotify_init");
    }
}

TreeWatcher::~TreeWatcher() {
    for (WatchedFile* f : files) {
        delete f;
    }
    for (WatchedDir* d : directories) {
        delete d;
    }
    if (inotifier != -1) {
        close(inotifier);
    }
}

WatchedFile* TreeWatcher::filewatch(std::string file) {
    for (WatchedFile* f : files) {
        if (f -> filename == file) {
            return f;
        }
    } // if it doesn't already exist, create it
    WatchedFile* f = new WatchedFile {
        .filename = file,
        .watcher = inotify_add_watch(inotifier, file.c_str(), IN_CLOSE_WRITE)
    };
    files.push_back(f);
    return f;
}

WatchedDir* TreeWatcher::dirwatch(std::string path) {
    for (WatchedDir* d : directories) {
        if (d -> path == path) {
            return d;
        }
    } // if it doesn't already exist, create it
    WatchedDir* d = new WatchedDir {
        .path = path,
        .watcher = inotify_add_watch(inotifier, path.c_str(), IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO)
    };
    directories.push_back(d);
    return d;
}

void TreeWatcher::unwatch(std::string path) {
    for (size_t i = 0; i < directories.size(); i ++) {
        if (directories[i] -> path == path) {
            WatchedDir* d = directories[i];
            directories[i] = directories[directories.size() - 1];
            directories.pop_back();
            inotify_rm_watch(inotifier, d -> watcher);
            delete d;
            return;
        }
    }
    for (size_t i = 0; i < files.size(); i ++) {
        if (files[i] -> filename == path) {
            WatchedFile* f = files[i];
            files[i] = files[files.size() - 1];
            files.pop_back();
            inotify_rm_watch(inotifier, f -> watcher);
            delete f;
            return;
        }
    }
}

void TreeWatcher::waitForModifications(std::function<void(std::string)> onModify, std::function<void(std::string)> onDelete) {
    char buffer[sizeof(struct inotify_event) + NAME_MAX + 1]; // the manual entry for inotify guarantees this to be a large enough buffer for a single inotify event
    if (read(inotifier, buffer, sizeof(buffer)) <= 0) {
        printf(ERROR "Couldn't read an inotify event.\n");
        perror("\tread");
        return;
    }
    struct inotify_event* evt = (struct inotify_event*)buffer;
    std::string absname;
    if (evt -> len > 0) { // it's a filename in a directory
        for (WatchedDir* dir : directories) {
            if (dir -> watcher == evt -> wd) {
                absname = dir -> path + '/' + evt -> name;
            }
        }
    }
    else { // it's a regular file
        for (WatchedFile* file : files) {
            if (file -> watcher == evt -> wd) {
                absname = file -> filename;
            }
        }
    }
    if (absname.size() == 0) {
        return; // a watch we already dropped
    }
    if (evt -> mask & (IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_CLOSE_WRITE)) {
        struct stat sb;
        if (stat(absname.c_str(), &sb) == 0) {
            if (S_ISDIR(sb.st_mode)) {
                dirwatch(absname);
            }
            else if (S_ISREG(sb.st_mode)) {
                filewatch(absname);
            }
        }
        onModify(absname);
    }
    else if (evt -> mask & (IN_DELETE | IN_MOVED_FROM)) {
        unwatch(absname);
        onDelete(absname);
    }
    else if (!(evt -> mask & IN_IGNORED)) {
        printf(WARNING "Unrecognized inotify event %d on file %s\n", evt -> mask, absname.c_str());
    }
}
