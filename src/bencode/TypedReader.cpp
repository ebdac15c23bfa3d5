#include "TypedReader.hpp"

namespace {

BencodeReader::ElementCheck requireType(BencodeValue::Type expected) {
    return [expected](const BencodeValue& value) {
        if (!value.is(expected)) {
            throw TypeMismatchError("Expected element of type " + BencodeValue::typeName(expected) +
                                    " but found " + BencodeValue::typeName(value.type()));
        }
    };
}

BigInteger integerPart(const BencodeValue& number) {
    if (number.is(BencodeValue::Type::Decimal)) {
        return number.asDecimal().integerPart();
    }
    return number.asInteger();
}

}

TypedReader::TypedReader(BencodeReader& reader) : decoder(reader) {}

BencodeValue TypedReader::readObject() {
    return decoder.readObject();
}

BencodeList TypedReader::readList(BencodeValue::Type element_type) {
    return decoder.readList(requireType(element_type));
}

void TypedReader::readList(BencodeList& dst, BencodeValue::Type element_type) {
    decoder.readList(dst, requireType(element_type));
}

BencodeDictionary TypedReader::readMap(BencodeValue::Type value_type) {
    return decoder.readMap(requireType(value_type));
}

void TypedReader::readMap(BencodeDictionary& dst, BencodeValue::Type value_type) {
    decoder.readMap(dst, requireType(value_type));
}

BencodeValue TypedReader::readNumber() {
    return decoder.readNumber();
}

uint64_t TypedReader::read_wrapped() {
    static const BigInteger modulus = BigInteger(1) << 64;

    BigInteger value = integerPart(readNumber()) % modulus;
    if (value < 0) {
        value += modulus;
    }
    return value.convert_to<uint64_t>();
}

int8_t TypedReader::readInt8() {
    return static_cast<int8_t>(read_wrapped());
}

int16_t TypedReader::readInt16() {
    return static_cast<int16_t>(read_wrapped());
}

int32_t TypedReader::readInt32() {
    return static_cast<int32_t>(read_wrapped());
}

int64_t TypedReader::readInt64() {
    return static_cast<int64_t>(read_wrapped());
}

uint8_t TypedReader::readUInt8() {
    return static_cast<uint8_t>(read_wrapped());
}

uint16_t TypedReader::readUInt16() {
    return static_cast<uint16_t>(read_wrapped());
}

uint32_t TypedReader::readUInt32() {
    return static_cast<uint32_t>(read_wrapped());
}

uint64_t TypedReader::readUInt64() {
    return read_wrapped();
}

float TypedReader::readFloat() {
    return static_cast<float>(readDouble());
}

double TypedReader::readDouble() {
    BencodeValue number = readNumber();
    if (number.is(BencodeValue::Type::Decimal)) {
        return number.asDecimal().toDouble();
    }
    return number.asInteger().convert_to<double>();
}

bool TypedReader::readBoolean() {
    return integerPart(readNumber()) != 0;
}

char32_t TypedReader::readChar() {
    std::string text = readString();
    if (text.empty()) {
        throw DecodeError("Cannot read a character from an empty string");
    }

    // Text is UTF-8 produced by CharsetUtils, so the lead byte gives the sequence length
    unsigned char lead = static_cast<unsigned char>(text[0]);
    size_t length = lead < 0x80 ? 1 : lead < 0xE0 ? 2 : lead < 0xF0 ? 3 : 4;
    if (length > text.size()) {
        throw DecodeError("Truncated character in decoded text");
    }

    char32_t code_point = length == 1 ? lead : lead & (0x7F >> length);
    for (size_t i = 1; i < length; i++) {
        code_point = (code_point << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return code_point;
}

std::string TypedReader::readString() {
    return decoder.readString();
}

std::string TypedReader::readString(const std::string& charset) {
    return decoder.readString(charset);
}

std::string TypedReader::readUTF() {
    return decoder.readString("UTF-8");
}

std::string TypedReader::readLine() {
    return readString();
}

void TypedReader::readFully(uint8_t* dst, size_t len) {
    decoder.input().readFully(dst, len);
}

void TypedReader::readFully(std::vector<uint8_t>& dst) {
    readFully(dst.data(), dst.size());
}

size_t TypedReader::skipBytes(size_t count) {
    return decoder.input().skip(count);
}
