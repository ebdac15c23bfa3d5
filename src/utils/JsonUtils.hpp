#pragma once
#include "../bencode/BencodeValue.hpp"
#include <nlohmann/json.hpp>
#include <string>

class JsonUtils {
public:
    static nlohmann::json toJson(const BencodeValue& value);
    static BencodeValue fromJson(const nlohmann::json& json);

    // Serializes with invalid UTF-8 replaced, since byte strings carry arbitrary data.
    static std::string dump(const BencodeValue& value);
};
