#pragma once
#include "BencodeError.hpp"
#include "BencodeReader.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Symbolic name -> enumerator table used by TypedReader::readEnum.
template <typename E>
using EnumSymbols = std::map<std::string, E>;

// Type-directed accessors on top of a BencodeReader. Numeric narrowing takes
// the integer part (decimals truncate toward zero) and wraps modulo 2^width.
class TypedReader {
public:
    explicit TypedReader(BencodeReader& reader);

    BencodeReader& reader() { return decoder; }

    BencodeValue readObject();
    BencodeList readList(BencodeValue::Type element_type);
    void readList(BencodeList& dst, BencodeValue::Type element_type);
    BencodeDictionary readMap(BencodeValue::Type value_type);
    void readMap(BencodeDictionary& dst, BencodeValue::Type value_type);

    template <typename E>
    E readEnum(const EnumSymbols<E>& symbols) {
        std::string name = readString();
        auto it = symbols.find(name);
        if (it == symbols.end()) {
            throw UnknownEnumValueError("Unknown enum value: " + name);
        }
        return it->second;
    }

    BencodeValue readNumber();
    int8_t readInt8();
    int16_t readInt16();
    int32_t readInt32();
    int64_t readInt64();
    uint8_t readUInt8();
    uint16_t readUInt16();
    uint32_t readUInt32();
    uint64_t readUInt64();

    int8_t readByte() { return readInt8(); }
    int16_t readShort() { return readInt16(); }
    int32_t readInt() { return readInt32(); }
    int64_t readLong() { return readInt64(); }
    int readUnsignedByte() { return readByte() & 0xFF; }
    int readUnsignedShort() { return readShort() & 0xFFFF; }

    float readFloat();
    double readDouble();
    // Nonzero integer part -> true.
    bool readBoolean();
    // First code point of the decoded text.
    char32_t readChar();

    std::string readString();
    std::string readString(const std::string& charset);
    std::string readUTF();
    // Same as readString(); the format has no notion of lines.
    std::string readLine();

    void readFully(uint8_t* dst, size_t len);
    void readFully(std::vector<uint8_t>& dst);
    size_t skipBytes(size_t count);

private:
    // Low 64 bits of the integer part of the next number, two's complement.
    uint64_t read_wrapped();

    BencodeReader& decoder;
};
