#include <writer.hpp>
#include <unistd.h>
#include <cstdio>
#include <defs.h>


void WriteOutput::write(const std::string& data) {
    write(data.c_str(), data.size());
}


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

bool FileWriteOutput::isValid() {
    return file != -1;
}

void FileWriteOutput::write(const char* data, size_t length) {
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            flush();
        }
        else {
            for (size_t i = 0; i < writeSize; i ++) {
                buffer[bufferPos + i] = data[i];
            }
            bufferPos += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
}

void FileWriteOutput::flush() {
    size_t done = 0;
    while (done < bufferPos && file != -1) {
        ssize_t written = ::write(file, buffer + done, bufferPos - done);
        if (written < 0) {
            printf(ERROR "Couldn't write rendered output!\n");
            perror("\twrite");
            break;
        }
        done += written;
    }
    bufferPos = 0;
}

FileWriteOutput::~FileWriteOutput() {
    if (!move) { // allow this file descriptor to be moved into another FileWriteOutput without being closed.
        flush();
        if (file > STDERR_FILENO) {
            ::close(file);
        }
    }
}

FileWriteOutput::FileWriteOutput(FileWriteOutput& f) {
    file = f.file;
    f.move = true;
}

void StringWriteOutput::write(const char* data, size_t length) {
    content.append(data, length);
}
