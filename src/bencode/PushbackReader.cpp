#include "PushbackReader.hpp"
#include "BencodeError.hpp"
#include <algorithm>
#include <stdexcept>

PushbackReader::PushbackReader(ByteSource& source) : source(source) {}

uint8_t PushbackReader::pop() {
    uint8_t value = 0;
    if (read(&value, 1) != 1) {
        throw EndOfInputError("Unexpected end of input at offset " + std::to_string(consumed));
    }
    return value;
}

uint8_t PushbackReader::peek() {
    uint8_t value = pop();
    unread(value);
    return value;
}

void PushbackReader::unread(uint8_t value) {
    if (has_pushed) {
        throw std::logic_error("Pushback register is already full");
    }
    pushed = value;
    has_pushed = true;
    if (consumed > 0) {
        consumed--;
    }
}

size_t PushbackReader::read(uint8_t* dst, size_t len) {
    if (len == 0) {
        return 0;
    }

    size_t total = 0;
    if (has_pushed) {
        dst[total++] = pushed;
        has_pushed = false;
        if (len == 1) {
            consumed += total;
            return total;
        }
    }

    total += source.read(dst + total, len - total);
    consumed += total;
    return total;
}

void PushbackReader::readFully(uint8_t* dst, size_t len) {
    size_t total = 0;
    while (total < len) {
        size_t received = read(dst + total, len - total);
        if (received == 0) {
            throw EndOfInputError("Unexpected end of input at offset " + std::to_string(consumed) +
                                  ": expected " + std::to_string(len - total) + " more bytes");
        }
        total += received;
    }
}

size_t PushbackReader::skip(size_t count) {
    uint8_t buffer[4096];
    size_t skipped = 0;
    while (skipped < count) {
        size_t chunk = std::min(count - skipped, sizeof(buffer));
        size_t received = read(buffer, chunk);
        if (received == 0) {
            break;
        }
        skipped += received;
    }
    return skipped;
}
