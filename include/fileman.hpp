/* Fileman manages one directory: the template directory the loader reads from, or wherever the command line tool writes its output.
*/
#pragma once
#include <string>
#include <map>
#include <functional>
#include <defs.h>
#include <mapview.hpp>
#include <writer.hpp>
#include <util.hpp>


class FileMan {
    std::map<std::string, MapView> maps;

public:
    enum PathState {
        CNEP,      // Ce n'existe pas
        Directory, // it's a directory
        File,      // it's a file
        Other,     // it's something else (symlink?)
        Error      // an error occurred when stat'ing it
    };

    PathState checkPath(std::string path);

    std::string transmuted(std::string path); // glue a path relative to this directory onto it

    std::string arcTransmuted(std::string path); // strip off this directory from a path (returning something relative to this directory), if possible

    void uncache(std::string path); // remove a path from the mmap cache

    std::string dir;

    FileMan(std::string rdir); // construct the FileMan to manage the directory referenced by rdir. rdir is not created.

    FileWriteOutput create(std::string where); // create a file and all of its parent directories, and return the filewriteoutput that controls it.

    MapView open(std::string thing); // memory map a file into the buffer-like MapView, returning an invalid
    // mapview if it doesn't exist (you MUST always check if mapview.isValid()!)
    // open() recycles MapViews unless the file changed size on disc.

    void walk(std::function<void(std::string)> onFile, std::function<void(std::string)> onDirectory); // fts over the whole directory, physical paths
};
