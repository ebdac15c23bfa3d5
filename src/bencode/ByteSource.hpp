#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

// Blocking, pull-based byte input. read() returns 0 only at end of stream and
// may return fewer bytes than requested.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(uint8_t* dst, size_t len) = 0;
};

class StringByteSource : public ByteSource {
public:
    explicit StringByteSource(std::string data);
    size_t read(uint8_t* dst, size_t len) override;

private:
    std::string data;
    size_t offset = 0;
};

class StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& in);
    size_t read(uint8_t* dst, size_t len) override;

private:
    std::istream& in;
};

// Reads from a file descriptor or socket; the descriptor is not owned.
class FileDescriptorByteSource : public ByteSource {
public:
    explicit FileDescriptorByteSource(int fd);
    size_t read(uint8_t* dst, size_t len) override;

private:
    int fd;
};
