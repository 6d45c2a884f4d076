// Writers are where rendered markup ends up: a buffered file descriptor, or a string in memory.
#pragma once
#include <string>
#include <cstddef>


struct WriteOutput {
    virtual ~WriteOutput() {}

    virtual void write(const char* data, size_t length) = 0;

    void write(const std::string& data);
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    bool move = false;
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(FileWriteOutput& f);

    FileWriteOutput(int fd);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file (unless it's stdout).

    bool isValid();

    using WriteOutput::write;

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    void flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    using WriteOutput::write;

    void write(const char* data, size_t length);
};
