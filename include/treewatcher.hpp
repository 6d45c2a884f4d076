// TreeWatcher, watcher of trees
// TreeWatchers manage inotifying for the template directory: they set inotify watchers on newly-indexed files and directories and drop the
// watchers on deleted ones. When anything changes, a callback is invoked so the caller can throw away compiled templates and render again.
#pragma once
#include <string>
#include <vector>
#include <functional>
#include <defs.h>


struct WatchedFile {
    std::string filename;
    int watcher; // produced by inotify_add_watch
};


struct WatchedDir {
    std::string path;
    int watcher;
};


struct TreeWatcher {
    std::vector<WatchedFile*> files;
    std::vector<WatchedDir*> directories;
    int inotifier; // the inotify fd

    TreeWatcher();

    ~TreeWatcher();

    WatchedFile* filewatch(std::string file);

    WatchedDir* dirwatch(std::string path);

    void unwatch(std::string path); // un-watch a file or directory

    void waitForModifications(std::function<void(std::string)> onModify, std::function<void(std::string)> onDelete);
    // onModify is called upon adding as well.
    // waitForModifications returns after every event, giving the outside program the option to either continue or end.
};
