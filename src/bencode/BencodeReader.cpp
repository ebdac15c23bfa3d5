#include "BencodeReader.hpp"
#include "BencodeError.hpp"
#include "../utils/CharsetUtils.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace {

const size_t RAW_CHUNK_SIZE = 64 * 1024;

bool isDigit(uint8_t token) {
    return '0' <= token && token <= '9';
}

std::string describeByte(uint8_t value) {
    if (value >= 0x20 && value < 0x7f) {
        return std::string("'") + static_cast<char>(value) + "'";
    }
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%02x", value);
    return buffer;
}

// Decrements the reader's nesting depth when an aggregate is left, normally or not.
class DepthGuard {
public:
    explicit DepthGuard(size_t& depth) : depth(depth) {}
    ~DepthGuard() { depth--; }

private:
    size_t& depth;
};

}

BencodeReader::BencodeReader(ByteSource& source,
                             DecoderOptions options,
                             std::shared_ptr<ExtensionHandler> extension)
    : in(source),
      options(std::move(options)),
      extension(std::move(extension)),
      converter(this->options.charset) {}

BencodeValue BencodeReader::readObject() {
    uint8_t token = in.peek();

    if (token == DICTIONARY) {
        return BencodeValue::dictionary(readMap());
    } else if (token == LIST) {
        return BencodeValue::list(readList());
    } else if (token == NUMBER) {
        return readNumber();
    } else if (isDigit(token)) {
        BencodeBytes data = readBytes();
        if (options.decodeAsString) {
            return BencodeValue::text(converter.toUtf8(data));
        }
        return BencodeValue::bytes(std::move(data));
    } else {
        return readCustom();
    }
}

BencodeValue BencodeReader::readCustom() {
    uint8_t token = in.peek();
    if (extension) {
        return extension->read(token, *this);
    }
    throw DecodeError("Unexpected token " + describeByte(token) + offset());
}

BencodeBytes BencodeReader::readBytes() {
    uint64_t length = 0;
    bool has_digits = false;

    uint8_t token;
    while ((token = in.pop()) != LENGTH_DELIMITER) {
        if (!isDigit(token)) {
            throw MalformedLengthError("Invalid byte string length: unexpected " +
                                       describeByte(token) + offset());
        }
        uint64_t digit = token - '0';
        if (digit > options.maxStringLength || length > (options.maxStringLength - digit) / 10) {
            throw MalformedLengthError("Byte string length exceeds " +
                                       std::to_string(options.maxStringLength) + offset());
        }
        length = length * 10 + digit;
        has_digits = true;
    }

    if (!has_digits) {
        throw MalformedLengthError("Missing byte string length" + offset());
    }
    return read_raw(length);
}

BencodeBytes BencodeReader::read_raw(uint64_t length) {
    // Grow in chunks so a bogus length on a short stream fails before allocating it all
    BencodeBytes data;
    while (data.size() < length) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(RAW_CHUNK_SIZE, length - data.size()));
        size_t filled = data.size();
        data.resize(filled + chunk);
        in.readFully(data.data() + filled, chunk);
    }
    return data;
}

std::string BencodeReader::readString() {
    return readString(options.charset);
}

std::string BencodeReader::readString(const std::string& charset) {
    if (charset == converter.charset()) {
        return converter.toUtf8(readBytes());
    }
    return CharsetUtils::toUtf8(readBytes(), charset);
}

BencodeValue BencodeReader::readNumber() {
    expect(NUMBER, "number");

    std::string numeral;
    bool decimal = false;

    uint8_t token;
    while ((token = in.pop()) != TERMINATOR) {
        if (token == '.') {
            decimal = true;
        } else if (!isDigit(token) && token != '-' && token != '+') {
            throw NumberFormatError("Invalid number: unexpected " + describeByte(token) + offset());
        }
        if (numeral.size() >= options.maxNumberLength) {
            throw NumberFormatError("Number longer than " + std::to_string(options.maxNumberLength) +
                                    " characters" + offset());
        }
        numeral += static_cast<char>(token);
    }

    if (decimal) {
        return BencodeValue::decimal(DecimalNumber::parse(numeral));
    }
    return BencodeValue::integer(parseBigInteger(numeral));
}

BencodeList BencodeReader::readList(const ElementCheck& check) {
    BencodeList list;
    readList(list, check);
    return list;
}

void BencodeReader::readList(BencodeList& dst, const ElementCheck& check) {
    expect(LIST, "list");
    enter_aggregate();
    DepthGuard guard(depth);

    while (in.peek() != TERMINATOR) {
        BencodeValue item = readObject();
        if (check) {
            check(item);
        }
        dst.push_back(std::move(item));
    }
    in.pop();
}

BencodeDictionary BencodeReader::readMap(const ElementCheck& check) {
    BencodeDictionary dict;
    readMap(dict, check);
    return dict;
}

void BencodeReader::readMap(BencodeDictionary& dst, const ElementCheck& check) {
    expect(DICTIONARY, "dictionary");
    enter_aggregate();
    DepthGuard guard(depth);

    while (in.peek() != TERMINATOR) {
        // Keys are text regardless of decodeAsString
        std::string key = converter.toUtf8(readBytes());
        BencodeValue value = readObject();
        if (check) {
            check(value);
        }
        dst.insert_or_assign(std::move(key), std::move(value));
    }
    in.pop();
}

bool BencodeReader::atEnd() {
    uint8_t value;
    if (in.read(&value, 1) == 0) {
        return true;
    }
    in.unread(value);
    return false;
}

void BencodeReader::expect(uint8_t token, const char* what) {
    uint8_t actual = in.pop();
    if (actual != token) {
        throw DecodeError(std::string("Expected ") + what + " but found " + describeByte(actual) + offset());
    }
}

void BencodeReader::enter_aggregate() {
    if (depth >= options.maxDepth) {
        throw DecodeError("Nesting deeper than " + std::to_string(options.maxDepth) + offset());
    }
    depth++;
}

std::string BencodeReader::offset() const {
    return " at offset " + std::to_string(in.position());
}
