#pragma once
#include "BencodeValue.hpp"
#include <string>

class BencodeEncoder {
public:
    std::string encode(const BencodeValue& value);

private:
    std::string encode_string(const std::string& str);
    std::string encode_bytes(const BencodeBytes& data);
    std::string encode_number(const std::string& numeral);
    std::string encode_list(const BencodeList& list);
    std::string encode_dictionary(const BencodeDictionary& dict);
};
