#pragma once
#include <cstdint>
#include <string>

struct DecoderOptions {
    std::string charset = "UTF-8";      // Any name iconv understands
    bool decodeAsString = false;        // Byte-strings become Text instead of ByteString
    size_t maxDepth = 512;              // Nesting limit for lists and dictionaries
    uint64_t maxStringLength = 2147483647;
    size_t maxNumberLength = 4096;      // Characters between the 'i' and the terminator
};
