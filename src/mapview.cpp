// "view" a memory map
// provides reference counted unmapping, fancy buffer-ey functions, view slicing, etc

#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstring>
#include <cstdlib>
#include <cstdio>


void MapView::init(int file, char* mm, size_t size) {
    map = mm;
    length = size;
    start = 0;
    end = length;
    fd = file;
}

MapView::MapView(std::string filename) {
    rCount = new int(1);
    map = NULL;
    length = 0;
    start = 0;
    end = 0;
    int file = open(filename.c_str(), O_RDONLY);
    fd = file; // so when the destructor calls it gets closed properly
    if (file == -1) {
        printf(ERROR "Can't open %s for memory mapping!\n", filename.c_str());
        perror("\topen");
        return;
    }
    struct stat sb;
    if (fstat(file, &sb)) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tfstat");
        return;
    }
    if (sb.st_size == 0) {
        printf(WARNING "%s has zero size and holds no templates.\n", filename.c_str());
        return;
    }
    map = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, file, 0);
    if (map == MAP_FAILED) {
        map = NULL;
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tmmap");
        return;
    }
    init(file, map, sb.st_size);
}

MapView::MapView(char* buffer, size_t size) {
    rCount = new int(1);
    heap = true;
    init(-1, buffer, size);
}

MapView MapView::fromString(const std::string& data) {
    char* buffer = (char*)malloc(data.size() + 1);
    memcpy(buffer, data.c_str(), data.size() + 1);
    return MapView(buffer, data.size());
}

MapView::MapView(const MapView& m) {
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    heap = m.heap;
    (*rCount) ++;
}

MapView& MapView::operator=(const MapView& m) {
    if (&m == this) {
        return *this;
    }
    (*m.rCount) ++;
    release();
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    heap = m.heap;
    return *this;
}

bool MapView::isValid() {
    return map != NULL;
}

char MapView::operator[](int64_t n) {
    if (len() <= 0) {
        return EOF;
    }
    else {
        while (n < 0) {
            n += len();
        }
        if (n >= len()) {
            return EOF;
        }
        return map[start + n];
    }
}

void MapView::operator++(int) {
    start ++;
}

char MapView::operator++() {
    start ++;
    return map[start - 1];
}

void MapView::operator+=(size_t n) {
    start += n;
    if (start > end) {
        start = end;
    }
}

int64_t MapView::len() {
    return (int64_t)end - (int64_t)start;
}

size_t MapView::offset() {
    return start;
}

void MapView::release() {
    (*rCount) --;
    if (*rCount == 0) {
        delete rCount;
        if (map != NULL) {
            if (heap) {
                free(map);
            }
            else {
                munmap(map, length);
            }
        }
        if (fd != -1) {
            close(fd);
        }
    }
}

MapView::~MapView() {
    release();
}

std::string MapView::toString() { // COPIES! TRY TO AVOID IT!
    if (map == NULL || len() <= 0) {
        return "";
    }
    return std::string(map + start, end - start);
}

bool MapView::cmp(const char* cmp, size_t at) {
    size_t cmpLen = strlen(cmp);
    if ((size_t)len() < at + cmpLen) {
        return false;
    }
    for (size_t i = 0; i < cmpLen; i ++) {
        if (map[start + at + i] != cmp[i]) {
            return false;
        }
    }
    return true;
}

MapView MapView::consume(char until) {
    MapView ret = *this;
    while (len() > 0 && map[start] != until) {
        start ++;
    }
    ret.end = start;
    return ret;
}

MapView MapView::consumeUntil(const char* until) {
    MapView ret = *this;
    while (len() > 0 && !cmp(until)) {
        start ++;
    }
    ret.end = start;
    return ret;
}

void MapView::trim() { // tosses whitespace towards the `start`.
    while (len() > 0 && (map[start] == ' ' || map[start] == '\n' || map[start] == '\t' || map[start] == '\r')) {start ++;}
}

bool MapView::needsReload() {
    if (fd == -1) {
        return false;
    }
    struct stat sb;
    if (fstat(fd, &sb) == 0) {
        return (size_t)sb.st_size != length; // if the size has changed, the map needs to reload!
    }
    else {
        return true;
    }
}
