#include "JsonUtils.hpp"
#include <limits>
#include <stdexcept>

namespace {

nlohmann::json integerToJson(const BigInteger& value) {
    if (value >= std::numeric_limits<int64_t>::min() && value <= std::numeric_limits<int64_t>::max()) {
        return nlohmann::json(value.convert_to<int64_t>());
    }
    if (value > 0 && value <= std::numeric_limits<uint64_t>::max()) {
        return nlohmann::json(value.convert_to<uint64_t>());
    }
    // Beyond 64 bits: keep every digit
    return nlohmann::json(value.str());
}

}

nlohmann::json JsonUtils::toJson(const BencodeValue& value) {
    switch (value.type()) {
        case BencodeValue::Type::ByteString: {
            const BencodeBytes& data = value.asBytes();
            return nlohmann::json(std::string(data.begin(), data.end()));
        }
        case BencodeValue::Type::Text:
            return nlohmann::json(value.asText());
        case BencodeValue::Type::Integer:
            return integerToJson(value.asInteger());
        case BencodeValue::Type::Decimal:
            return nlohmann::json(value.asDecimal().toDouble());
        case BencodeValue::Type::List: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : value.asList()) {
                array.push_back(toJson(item));
            }
            return array;
        }
        case BencodeValue::Type::Dictionary: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& [key, item] : value.asDictionary()) {
                object[key] = toJson(item);
            }
            return object;
        }
        case BencodeValue::Type::Custom:
            return nlohmann::json(value.asCustom().describe());
    }
    throw std::runtime_error("Unhandled value type");
}

BencodeValue JsonUtils::fromJson(const nlohmann::json& json) {
    if (json.is_string()) {
        return BencodeValue::bytes(json.get<std::string>());
    } else if (json.is_boolean()) {
        return BencodeValue::integer(json.get<bool>() ? 1 : 0);
    } else if (json.is_number_unsigned()) {
        return BencodeValue::integer(json.get<uint64_t>());
    } else if (json.is_number_integer()) {
        return BencodeValue::integer(json.get<int64_t>());
    } else if (json.is_number_float()) {
        // Shortest round-trip form, e.g. 3.14
        std::string numeral = json.dump();
        if (numeral.find_first_of("eE") != std::string::npos) {
            throw std::runtime_error("Cannot bencode floating point value in exponent form: " + numeral);
        }
        if (numeral.find('.') == std::string::npos) {
            numeral += ".0";
        }
        return BencodeValue::decimal(DecimalNumber::parse(numeral));
    } else if (json.is_array()) {
        BencodeList list;
        for (const auto& item : json) {
            list.push_back(fromJson(item));
        }
        return BencodeValue::list(std::move(list));
    } else if (json.is_object()) {
        BencodeDictionary dict;
        for (auto it = json.begin(); it != json.end(); ++it) {
            dict[it.key()] = fromJson(it.value());
        }
        return BencodeValue::dictionary(std::move(dict));
    }
    throw std::runtime_error("Unsupported JSON type for bencode encoding: " + std::string(json.type_name()));
}

std::string JsonUtils::dump(const BencodeValue& value) {
    return toJson(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
