#pragma once
#include "ByteSource.hpp"
#include <cstdint>

// Adds a single byte of lookahead to a ByteSource.
class PushbackReader {
public:
    explicit PushbackReader(ByteSource& source);

    // Consumes the next byte, throws EndOfInputError when the source is exhausted.
    uint8_t pop();
    // pop() followed by unread(); repeated calls return the same byte.
    uint8_t peek();
    void unread(uint8_t value);

    // Drains the pushback register first; may return fewer than len bytes, 0 at end of stream.
    size_t read(uint8_t* dst, size_t len);
    void readFully(uint8_t* dst, size_t len);
    size_t skip(size_t count);

    // Number of bytes consumed so far, net of pushback.
    uint64_t position() const { return consumed; }

private:
    ByteSource& source;
    bool has_pushed = false;
    uint8_t pushed = 0;
    uint64_t consumed = 0;
};
