#include "BencodeEncoder.hpp"
#include <stdexcept>

std::string BencodeEncoder::encode(const BencodeValue& value) {
    switch (value.type()) {
        case BencodeValue::Type::ByteString:
            return encode_bytes(value.asBytes());
        case BencodeValue::Type::Text:
            return encode_string(value.asText());
        case BencodeValue::Type::Integer:
            return encode_number(value.asInteger().str());
        case BencodeValue::Type::Decimal:
            return encode_number(value.asDecimal().toString());
        case BencodeValue::Type::List:
            return encode_list(value.asList());
        case BencodeValue::Type::Dictionary:
            return encode_dictionary(value.asDictionary());
        case BencodeValue::Type::Custom:
            break;
    }
    throw std::runtime_error("Unsupported value type for bencode encoding: " +
                             BencodeValue::typeName(value.type()));
}

std::string BencodeEncoder::encode_string(const std::string& str) {
    return std::to_string(str.length()) + ":" + str;
}

std::string BencodeEncoder::encode_bytes(const BencodeBytes& data) {
    return encode_string(std::string(data.begin(), data.end()));
}

std::string BencodeEncoder::encode_number(const std::string& numeral) {
    return "i" + numeral + "e";
}

std::string BencodeEncoder::encode_list(const BencodeList& list) {
    std::string result = "l";
    for (const auto& item : list) {
        result += encode(item);
    }
    result += "e";
    return result;
}

std::string BencodeEncoder::encode_dictionary(const BencodeDictionary& dict) {
    // Already in canonical key order
    std::string result = "d";
    for (const auto& [key, value] : dict) {
        result += encode_string(key) + encode(value);
    }
    result += "e";
    return result;
}
