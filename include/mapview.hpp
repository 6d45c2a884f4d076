// "view" a memory map
// provides reference counted unmapping, fancy buffer-ey functions, view slicing, etc
// a MapView can also view a private copy of an in-memory string (templates handed over as text rather than files)
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    char* map;
    size_t length; // authoritative length of the WHOLE MEMORY MAP
    size_t start; // starting position of this MapView's slice of the memory map
    size_t end; // ending position of this MapView's slice of the memory map
    int* rCount; // counts references to the underlying memory map
    int fd; // file descriptor of the map (useful for statf), -1 for string buffers
    bool heap = false; // the buffer was malloc'd, not mmap'd

    void init(int, char* mm, size_t size);

    void release();

    MapView(char* buffer, size_t size); // adopt a malloc'd buffer
public:
    MapView(std::string filename);

    static MapView fromString(const std::string& data); // COPIES the data into a private buffer

    bool isValid();

    MapView(const MapView& m);

    MapView& operator=(const MapView& m);

    char operator[](int64_t n);

    void operator++(int);

    char operator++();

    void operator+=(size_t n);

    int64_t len();

    size_t offset(); // how far into the whole buffer this view starts; used for error positions

    ~MapView();

    std::string toString(); // COPIES! TRY TO AVOID IT!

    bool cmp(const char* cmp, size_t at = 0);

    MapView consume(char until); // consume bytes until one of them is until, returning the consumed bytes as a child MapView

    MapView consumeUntil(const char* until); // consume bytes until the whole of until is at the front

    void trim(); // tosses whitespace towards the `start`.

    bool needsReload(); // check if the file on disc has changed in a way that would require a remap.
};
