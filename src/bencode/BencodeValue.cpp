#include "BencodeValue.hpp"
#include "BencodeError.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

bool ByteLexicographicLess::operator()(const std::string& lhs, const std::string& rhs) const {
    size_t common = std::min(lhs.size(), rhs.size());
    int result = std::memcmp(lhs.data(), rhs.data(), common);
    if (result != 0) {
        return result < 0;
    }
    return lhs.size() < rhs.size();
}

BencodeValue::BencodeValue() : storage(BencodeBytes()) {}

BencodeValue::BencodeValue(Storage value) : storage(std::move(value)) {}

BencodeValue BencodeValue::bytes(BencodeBytes data) {
    return BencodeValue(Storage(std::in_place_index<0>, std::move(data)));
}

BencodeValue BencodeValue::bytes(const std::string& data) {
    return bytes(BencodeBytes(data.begin(), data.end()));
}

BencodeValue BencodeValue::text(std::string text) {
    return BencodeValue(Storage(std::in_place_index<1>, std::move(text)));
}

BencodeValue BencodeValue::integer(BigInteger value) {
    return BencodeValue(Storage(std::in_place_index<2>, std::move(value)));
}

BencodeValue BencodeValue::decimal(DecimalNumber value) {
    return BencodeValue(Storage(std::in_place_index<3>, std::move(value)));
}

BencodeValue BencodeValue::list(BencodeList items) {
    return BencodeValue(Storage(std::in_place_index<4>,
                                std::make_shared<const BencodeList>(std::move(items))));
}

BencodeValue BencodeValue::dictionary(BencodeDictionary entries) {
    return BencodeValue(Storage(std::in_place_index<5>,
                                std::make_shared<const BencodeDictionary>(std::move(entries))));
}

BencodeValue BencodeValue::custom(std::shared_ptr<const CustomValue> value) {
    if (!value) {
        throw std::invalid_argument("Custom value must not be null");
    }
    return BencodeValue(Storage(std::in_place_index<6>, std::move(value)));
}

void BencodeValue::require(Type expected) const {
    if (type() != expected) {
        throw TypeMismatchError("Expected " + typeName(expected) + " but found " + typeName(type()));
    }
}

const BencodeBytes& BencodeValue::asBytes() const {
    require(Type::ByteString);
    return std::get<0>(storage);
}

const std::string& BencodeValue::asText() const {
    require(Type::Text);
    return std::get<1>(storage);
}

const BigInteger& BencodeValue::asInteger() const {
    require(Type::Integer);
    return std::get<2>(storage);
}

const DecimalNumber& BencodeValue::asDecimal() const {
    require(Type::Decimal);
    return std::get<3>(storage);
}

const BencodeList& BencodeValue::asList() const {
    require(Type::List);
    return *std::get<4>(storage);
}

const BencodeDictionary& BencodeValue::asDictionary() const {
    require(Type::Dictionary);
    return *std::get<5>(storage);
}

const CustomValue& BencodeValue::asCustom() const {
    require(Type::Custom);
    return *std::get<6>(storage);
}

std::string BencodeValue::typeName(Type type) {
    switch (type) {
        case Type::ByteString: return "byte string";
        case Type::Text:       return "text";
        case Type::Integer:    return "integer";
        case Type::Decimal:    return "decimal";
        case Type::List:       return "list";
        case Type::Dictionary: return "dictionary";
        case Type::Custom:     return "custom";
    }
    return "unknown";
}

bool BencodeValue::operator==(const BencodeValue& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case Type::ByteString: return asBytes() == other.asBytes();
        case Type::Text:       return asText() == other.asText();
        case Type::Integer:    return asInteger() == other.asInteger();
        case Type::Decimal:    return asDecimal() == other.asDecimal();
        case Type::List:       return asList() == other.asList();
        case Type::Dictionary: return asDictionary() == other.asDictionary();
        case Type::Custom:     return asCustom().equals(other.asCustom());
    }
    return false;
}
