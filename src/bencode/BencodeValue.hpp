#pragma once
#include "DecimalNumber.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// Value produced by an ExtensionHandler for a token kind outside the core grammar.
class CustomValue {
public:
    virtual ~CustomValue() = default;
    virtual std::string typeName() const = 0;
    virtual std::string describe() const = 0;
    virtual bool equals(const CustomValue& other) const { return this == &other; }
};

// Orders keys by unsigned byte value, the canonical dictionary order of the wire format.
struct ByteLexicographicLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

class BencodeValue;

using BencodeBytes = std::vector<uint8_t>;
using BencodeList = std::vector<BencodeValue>;
using BencodeDictionary = std::map<std::string, BencodeValue, ByteLexicographicLess>;

class BencodeValue {
public:
    // Order matches the alternatives of Storage.
    enum class Type {
        ByteString,
        Text,
        Integer,
        Decimal,
        List,
        Dictionary,
        Custom
    };

    BencodeValue();

    static BencodeValue bytes(BencodeBytes data);
    static BencodeValue bytes(const std::string& data);
    static BencodeValue text(std::string text);
    static BencodeValue integer(BigInteger value);
    static BencodeValue decimal(DecimalNumber value);
    static BencodeValue list(BencodeList items);
    static BencodeValue dictionary(BencodeDictionary entries);
    static BencodeValue custom(std::shared_ptr<const CustomValue> value);

    Type type() const { return static_cast<Type>(storage.index()); }
    bool is(Type expected) const { return type() == expected; }
    bool isNumber() const { return is(Type::Integer) || is(Type::Decimal); }

    // Each accessor throws TypeMismatchError when the tag differs.
    const BencodeBytes& asBytes() const;
    const std::string& asText() const;
    const BigInteger& asInteger() const;
    const DecimalNumber& asDecimal() const;
    const BencodeList& asList() const;
    const BencodeDictionary& asDictionary() const;
    const CustomValue& asCustom() const;

    static std::string typeName(Type type);

    bool operator==(const BencodeValue& other) const;
    bool operator!=(const BencodeValue& other) const { return !(*this == other); }

private:
    using Storage = std::variant<BencodeBytes,
                                 std::string,
                                 BigInteger,
                                 DecimalNumber,
                                 std::shared_ptr<const BencodeList>,
                                 std::shared_ptr<const BencodeDictionary>,
                                 std::shared_ptr<const CustomValue>>;

    explicit BencodeValue(Storage value);
    void require(Type expected) const;

    Storage storage;
};
