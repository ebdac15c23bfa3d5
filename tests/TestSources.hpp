#pragma once
#include "bencode/ByteSource.hpp"
#include <algorithm>
#include <cstring>
#include <string>

// Hands out at most chunk_size bytes per read, like a slow socket.
class ChunkedByteSource : public ByteSource {
public:
    explicit ChunkedByteSource(std::string data, size_t chunk_size = 1)
        : data(std::move(data)), chunk_size(chunk_size) {}

    size_t read(uint8_t* dst, size_t len) override {
        size_t count = std::min({len, chunk_size, data.size() - offset});
        std::memcpy(dst, data.data() + offset, count);
        offset += count;
        reads++;
        return count;
    }

    size_t reads = 0;

private:
    std::string data;
    size_t chunk_size;
    size_t offset = 0;
};
