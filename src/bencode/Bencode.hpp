#pragma once
#include "BencodeEncoder.hpp"
#include "BencodeError.hpp"
#include "BencodeReader.hpp"
#include "ByteSource.hpp"

class Bencode {
public:
    // Decodes exactly one value; trailing bytes are a DecodeError.
    static BencodeValue decode(const std::string& encoded_value,
                               const DecoderOptions& options = DecoderOptions()) {
        StringByteSource source(encoded_value);
        BencodeReader reader(source, options);
        BencodeValue value = reader.readObject();
        if (!reader.atEnd()) {
            throw DecodeError("Trailing data after value at offset " +
                              std::to_string(reader.input().position()));
        }
        return value;
    }

    static std::string encode(const BencodeValue& value) {
        return BencodeEncoder().encode(value);
    }
};
