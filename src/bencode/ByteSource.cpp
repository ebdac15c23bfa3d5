#include "ByteSource.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

StringByteSource::StringByteSource(std::string data) : data(std::move(data)) {}

size_t StringByteSource::read(uint8_t* dst, size_t len) {
    size_t count = std::min(len, data.size() - offset);
    std::memcpy(dst, data.data() + offset, count);
    offset += count;
    return count;
}

StreamByteSource::StreamByteSource(std::istream& in) : in(in) {}

size_t StreamByteSource::read(uint8_t* dst, size_t len) {
    if (in.bad()) {
        throw std::runtime_error("Failed to read from stream");
    }
    in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(len));
    if (in.bad()) {
        throw std::runtime_error("Failed to read from stream");
    }
    return static_cast<size_t>(in.gcount());
}

FileDescriptorByteSource::FileDescriptorByteSource(int fd) : fd(fd) {}

size_t FileDescriptorByteSource::read(uint8_t* dst, size_t len) {
    while (true) {
        ssize_t received = ::read(fd, dst, len);
        if (received >= 0) {
            return static_cast<size_t>(received);
        }
        if (errno != EINTR) {
            throw std::runtime_error("Failed to read from descriptor: " + std::string(std::strerror(errno)));
        }
    }
}
